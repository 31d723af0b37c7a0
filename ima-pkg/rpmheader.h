// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   RPM Header Reader - HeaderReader for rpm packages, using librpm

   Only the header is read, signatures and digests of the package are
   not verified.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_RPMHEADER_H
#define IMAPKG_RPMHEADER_H

#include <ima-pkg/headerreader.h>
#include <ima-pkg/macros.h>

#include <string>

namespace IMA {

class IMA_PUBLIC RpmHeaderReader : public HeaderReader
{
   public:
   virtual bool Read(std::string const &Path, PackageHeader &Hdr) override;

   RpmHeaderReader();
   virtual ~RpmHeaderReader();
};

}

#endif
