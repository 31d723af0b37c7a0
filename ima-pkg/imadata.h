// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   imadata.xml - the document listing the measured files of all
   packages of a repository

   <?xml version="1.0" encoding="UTF-8"?>
   <imadata packages="1">
   <package name="bash" arch="x86_64">
     <version epoch="0" ver="5.2" rel="1"/>
     <file hash="9f86...">/usr/bin/bash</file>
   </package>
   </imadata>

   Packages are ordered by name, files keep the order of the header.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_IMADATA_H
#define IMAPKG_IMADATA_H

#include <ima-pkg/macros.h>
#include <ima-pkg/pkgrecord.h>

#include <string>
#include <vector>

namespace IMA {

/** \brief the complete imadata.xml document for Records
 *
 *  The output only depends on the records, not on their order
 *  (apart from the order of packages with the same name). */
IMA_PUBLIC std::string RenderImaData(std::vector<PackageRecord> const &Records);

/** \brief write imadata.xml below the repository Root
 *
 *  \param Root of the repository
 *  \param Records to render
 *  \param[out] OutPath path of the written file
 *  \param Name path of the document relative to Root, missing
 *         directories are created. An existing file is replaced. */
IMA_PUBLIC bool WriteImaData(std::string const &Root, std::vector<PackageRecord> const &Records,
			     std::string &OutPath, std::string const &Name = "repodata/imadata.xml");

}

#endif
