// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Hashes - checksums of repository metadata files

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/fileutl.h>
#include <ima-pkg/hashes.h>
#include <ima-pkg/macros.h>

#include <algorithm>
#include <string>
#include <vector>
#include <strings.h>

#include <openssl/evp.h>
									/*}}}*/

HashString::HashString() {}
HashString::HashString(std::string Type, std::string Hash) : Type(std::move(Type)), Hash(std::move(Hash)) {}

namespace {
struct Algorithm
{
   Hashes::SupportedHashes Flag;
   // as used by repomd.xml
   char const *TypeName;
   char const *Name;
   EVP_MD const *(*Digest)();
};
Algorithm const Algorithms[] = {
   {Hashes::SHA256SUM, "sha256", "SHA256", EVP_sha256},
   {Hashes::SHA512SUM, "sha512", "SHA512", EVP_sha512},
};
}

// PrivateHashes - one EVP context per enabled algorithm		/*{{{*/
class PrivateHashes
{
   public:
   std::vector<std::pair<Algorithm const *, EVP_MD_CTX *>> Contexts;

   explicit PrivateHashes(unsigned int const Enabled)
   {
      for (auto const &Algo : Algorithms)
      {
	 if ((Enabled & Algo.Flag) != Algo.Flag)
	    continue;
	 EVP_MD_CTX * const Ctx = EVP_MD_CTX_new();
	 if (Ctx == nullptr)
	    continue;
	 if (EVP_DigestInit_ex(Ctx, Algo.Digest(), nullptr) != 1)
	 {
	    EVP_MD_CTX_free(Ctx);
	    continue;
	 }
	 Contexts.emplace_back(&Algo, Ctx);
      }
   }
   ~PrivateHashes()
   {
      for (auto const &C : Contexts)
	 EVP_MD_CTX_free(C.second);
   }
};
									/*}}}*/
// Hashes::Add - feed a buffer to all contexts				/*{{{*/
bool Hashes::Add(const unsigned char * const Data, unsigned long long const Size)
{
   if (Size == 0)
      return true;
   for (auto const &C : d->Contexts)
      if (EVP_DigestUpdate(C.second, Data, Size) != 1)
	 return false;
   return true;
}
									/*}}}*/
// Hashes::AddFD - feed the content of a file				/*{{{*/
bool Hashes::AddFD(FileFd &Fd,unsigned long long Size)
{
   unsigned char Buf[IMA_BUFFER_SIZE];
   bool const ToEOF = (Size == 0);
   while (ToEOF == true || Size != 0)
   {
      unsigned long long const Want = ToEOF ? sizeof(Buf) : std::min<unsigned long long>(Size, sizeof(Buf));
      unsigned long long Got = 0;
      if (Fd.Read(Buf, Want, ToEOF ? &Got : nullptr) == false)
	 return false;
      if (ToEOF == false)
	 Got = Want;
      else if (Got == 0)
	 break;
      if (Add(Buf, Got) == false)
	 return false;
      if (ToEOF == false)
	 Size -= Got;
   }
   return true;
}
									/*}}}*/
// Hashes::GetHashString - hex digest of the data so far		/*{{{*/
// ---------------------------------------------------------------------
/* The context is finalized on a copy so that the running one can
   still be updated. */
HashString Hashes::GetHashString(SupportedHashes const Hash) const
{
   static char const Hex[] = "0123456789abcdef";
   for (auto const &C : d->Contexts)
   {
      if (C.first->Flag != Hash)
	 continue;

      EVP_MD_CTX * const Copy = EVP_MD_CTX_new();
      if (Copy == nullptr)
	 return HashString();
      unsigned char Sum[EVP_MAX_MD_SIZE];
      unsigned int Length = 0;
      bool const Ok = EVP_MD_CTX_copy_ex(Copy, C.second) == 1 &&
		      EVP_DigestFinal_ex(Copy, Sum, &Length) == 1;
      EVP_MD_CTX_free(Copy);
      if (Ok == false)
	 return HashString();

      std::string Value;
      Value.reserve(Length * 2);
      for (unsigned int I = 0; I != Length; ++I)
      {
	 Value.push_back(Hex[Sum[I] >> 4]);
	 Value.push_back(Hex[Sum[I] & 0xF]);
      }
      return HashString(C.first->Name, Value);
   }
   return HashString();
}
									/*}}}*/
// Hashes::FromTypeName - checksum type of repomd.xml to flag		/*{{{*/
bool Hashes::FromTypeName(std::string const &Name, SupportedHashes &Hash)
{
   for (auto const &Algo : Algorithms)
   {
      if (strcasecmp(Name.c_str(), Algo.TypeName) != 0)
	 continue;
      Hash = Algo.Flag;
      return true;
   }
   return false;
}
									/*}}}*/
Hashes::Hashes(unsigned int const Hashes) : d(new PrivateHashes(Hashes)) {}
Hashes::~Hashes() { delete d; }
