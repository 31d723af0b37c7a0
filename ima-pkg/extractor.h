// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Digest Extractor - turn a package header into a PackageRecord

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_EXTRACTOR_H
#define IMAPKG_EXTRACTOR_H

#include <ima-pkg/headerreader.h>
#include <ima-pkg/macros.h>
#include <ima-pkg/pkgrecord.h>

#include <string>

namespace IMA {

/** \brief true if Digest carries a measurement
 *
 *  Files without a digest and files with the all-zero placeholder
 *  of a sha256 digest have none. */
IMA_PUBLIC bool IsMeasured(std::string const &Digest) IMA_PURE;

class IMA_PUBLIC DigestExtractor
{
   HeaderReader &Reader;

   public:
   /** \brief build the record of the package archive at Path
    *
    *  Safe to call from several threads if the reader is.
    *  \return \b false if the header can't be read */
   bool Extract(std::string const &Path, PackageRecord &Record);

   explicit DigestExtractor(HeaderReader &Reader) : Reader(Reader) {};
};

}

#endif
