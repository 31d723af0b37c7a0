// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Digest Extractor - turn a package header into a PackageRecord

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/error.h>
#include <ima-pkg/extractor.h>

#include <algorithm>
#include <string>
#include <utility>
									/*}}}*/

using namespace std;

namespace IMA {

// IsMeasured - does the digest carry a measurement			/*{{{*/
bool IsMeasured(std::string const &Digest)
{
   if (Digest.empty() == true)
      return false;
   if (Digest.length() == 64 && std::all_of(Digest.begin(), Digest.end(),
					    [](char const c) { return c == '0'; }))
      return false;
   return true;
}
									/*}}}*/
// DigestExtractor::Extract - read a header and filter its files	/*{{{*/
bool DigestExtractor::Extract(std::string const &Path, PackageRecord &Record)
{
   PackageHeader Hdr;
   if (Reader.Read(Path, Hdr) == false)
   {
      if (_error->PendingError() == false)
	 return _error->Error("Unable to read package header of %s", Path.c_str());
      return false;
   }

   Record.Name = std::move(Hdr.Name);
   Record.Arch = std::move(Hdr.Arch);
   Record.IsSource = Hdr.IsSource;
   Record.Epoch = Hdr.Epoch;
   Record.Version = std::move(Hdr.Version);
   Record.Release = std::move(Hdr.Release);
   Record.Files.clear();
   for (auto &File : Hdr.Files)
      if (IsMeasured(File.Digest) == true)
	 Record.Files.push_back(std::move(File));
   return true;
}
									/*}}}*/

}
