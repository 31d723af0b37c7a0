// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Artifact Finalizer - compress a metadata document and give it its
   content addressed name

   repodata/imadata.xml becomes repodata/<checksum>-imadata.xml.gz,
   the uncompressed document is removed.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_FINALIZE_H
#define IMAPKG_FINALIZE_H

#include <ima-pkg/macros.h>

#include <ctime>
#include <string>

namespace IMA {

struct ArtifactInfo
{
   // checksum type name as written to repomd.xml, e.g. sha256
   std::string ChecksumType;
   // hex digest of the compressed file
   std::string Checksum;
   // hex digest of the uncompressed document
   std::string OpenChecksum;
   unsigned long long Size = 0;
   unsigned long long OpenSize = 0;
   // change time of the compressed file
   time_t Timestamp = 0;
   // name of the compressed file before the checksum was added
   std::string Name;
   // final path of the compressed file
   std::string Path;
};

/** \brief compress DocPath and rename the result after its checksum
 *
 *  \param DocPath uncompressed document, removed on success
 *  \param ChecksumType sha256 or sha512
 *  \param[out] Info everything repomd.xml needs to know about it */
IMA_PUBLIC bool FinalizeArtifact(std::string const &DocPath, std::string const &ChecksumType,
				 ArtifactInfo &Info);

}

#endif
