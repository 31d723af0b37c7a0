// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Header Reader - access to the header of a package archive

   The reader is the only part which knows about the archive format.
   Implementations must allow concurrent calls of Read from several
   threads, each call working on its own archive.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_HEADERREADER_H
#define IMAPKG_HEADERREADER_H

#include <ima-pkg/macros.h>
#include <ima-pkg/pkgrecord.h>

#include <optional>
#include <string>
#include <vector>

namespace IMA {

/** \brief the raw header fields of a package
 *
 *  Files holds every file of the package in header order, including
 *  those without a digest (empty string) and those carrying the
 *  all-zero placeholder. */
struct PackageHeader
{
   std::string Name;
   std::string Arch;
   bool IsSource = false;
   std::optional<unsigned long> Epoch;
   std::string Version;
   std::string Release;
   std::vector<FileDigest> Files;
};

class IMA_PUBLIC HeaderReader
{
   public:
   /** \brief read the header of the archive at Path
    *
    *  \return \b false with a message on the error stack if the archive
    *  can't be opened or is not a valid package */
   virtual bool Read(std::string const &Path, PackageHeader &Hdr) = 0;

   virtual ~HeaderReader() {};
};

}

#endif
