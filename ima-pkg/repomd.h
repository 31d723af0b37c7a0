// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   repomd.xml - register a metadata artifact in the master index of
   a repository

   A new <data type="..."> entry is appended to the document element.
   An existing entry of the same type is never replaced, registering a
   type twice is an error which leaves repomd.xml untouched.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_REPOMD_H
#define IMAPKG_REPOMD_H

#include <ima-pkg/finalize.h>
#include <ima-pkg/macros.h>
#include <ima-pkg/xmltree.h>

#include <string>

namespace IMA {

IMA_PUBLIC extern char const * const RepoNamespace;

/** \brief true if a direct data child of the root has type Type */
IMA_PUBLIC bool HasDataType(XMLDocument const &Doc, std::string const &Type);

/** \brief append the data entry for Info to the parsed index
 *
 *  \param LocationDir directory of the artifact relative to the
 *         repository root, used for the location href */
IMA_PUBLIC bool AddDataEntry(XMLDocument &Doc, ArtifactInfo const &Info,
			     std::string const &Type = "imadata",
			     std::string const &LocationDir = "repodata");

/** \brief register Info in the master index at RepoMDPath
 *
 *  The file is replaced atomically. */
IMA_PUBLIC bool PatchRepoMD(std::string const &RepoMDPath, ArtifactInfo const &Info,
			    std::string const &Type = "imadata",
			    std::string const &LocationDir = "repodata");

}

#endif
