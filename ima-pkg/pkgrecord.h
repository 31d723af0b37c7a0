// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Package Record - identity and measured files of one package archive

   A record is built by the DigestExtractor from the header of a package
   and is consumed by the imadata.xml writer. It only contains files
   which carry a usable digest.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_PKGRECORD_H
#define IMAPKG_PKGRECORD_H

#include <optional>
#include <string>
#include <vector>

namespace IMA {

struct FileDigest
{
   // absolute path of the file once installed
   std::string Path;
   // hex encoded digest as stored in the header
   std::string Digest;
};

struct PackageRecord
{
   std::string Name;
   std::string Arch;
   bool IsSource = false;
   std::optional<unsigned long> Epoch;
   std::string Version;
   std::string Release;
   std::vector<FileDigest> Files;
};

}

#endif
