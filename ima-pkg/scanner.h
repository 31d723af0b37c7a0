// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Repository Scanner - find all package archives below a repository
   root and extract their records in parallel

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_SCANNER_H
#define IMAPKG_SCANNER_H

#include <ima-pkg/extractor.h>
#include <ima-pkg/macros.h>
#include <ima-pkg/pkgrecord.h>
#include <ima-pkg/workerpool.h>

#include <string>
#include <vector>

namespace IMA {

class IMA_PUBLIC RepositoryScanner
{
   DigestExtractor &Extractor;
   WorkerPool Pool;
   std::string Pattern;

   public:
   /** \brief collect the archives below Root
    *
    *  Regular files whose name matches the package pattern are
    *  collected, including symlinks to regular files. Symlinked
    *  directories are not entered. The order is unspecified.
    *  Any directory or file which can not be examined is an error. */
   bool Discover(std::string const &Root, std::vector<std::string> &Paths);

   /** \brief extract the records of all archives below Root
    *
    *  Records are appended in completion order. If one extraction
    *  fails no record is returned at all. */
   bool Scan(std::string const &Root, std::vector<PackageRecord> &Records);

   unsigned int JobCount() const { return Pool.JobCount(); }

   /** \param Jobs maximum of concurrent extractions, 0 picks the host's
    *  parallelism
    *  \param Pattern fnmatch(3) pattern the archive file names match */
   RepositoryScanner(DigestExtractor &Extractor, unsigned int const Jobs,
		     std::string const &Pattern = "*.rpm");
};

}

#endif
