// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Hashes - checksums of repository metadata files

   The checksum types a repomd.xml may name for its data entries,
   calculated with the OpenSSL EVP digests.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_HASHES_H
#define IMAPKG_HASHES_H

#include <ima-pkg/macros.h>

#include <string>

class FileFd;

/** \brief a digest together with the name of its algorithm */
class IMA_PUBLIC HashString
{
   std::string Type;
   std::string Hash;

   public:
   std::string HashType() const { return Type; };
   /** \brief lowercase hex digest */
   std::string HashValue() const { return Hash; };
   bool empty() const { return Type.empty() || Hash.empty(); };

   HashString(std::string Type, std::string Hash);
   HashString();
};

class PrivateHashes;
class IMA_PUBLIC Hashes
{
   PrivateHashes * const d;

   public:
   enum SupportedHashes { SHA256SUM = (1 << 0), SHA512SUM = (1 << 1) };

   bool Add(const unsigned char * const Data, unsigned long long const Size);
   inline bool Add(std::string const &Data)
   {
      return Add(reinterpret_cast<unsigned char const *>(Data.data()), Data.length());
   };
   /** \brief feed Size bytes of Fd, 0 reads up to the end of the file */
   bool AddFD(FileFd &Fd,unsigned long long Size = 0);

   /** \brief the digest of everything added so far
    *
    *  More data can be added afterwards. An empty HashString is
    *  returned for a hash which is not calculated. */
   HashString GetHashString(SupportedHashes const Hash) const;

   /** \brief map sha256/sha512 (any case) to its #SupportedHashes flag
    *
    *  \return \b false if the type is unknown, nothing is reported */
   static bool FromTypeName(std::string const &Name, SupportedHashes &Hash);

   /** \param Hashes bitflag composed of #SupportedHashes */
   explicit Hashes(unsigned int const Hashes);
   ~Hashes();
   Hashes(Hashes const &) = delete;
   Hashes &operator=(Hashes const &) = delete;
};

#endif
