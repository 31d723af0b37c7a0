// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Repository Scanner - find all package archives below a repository
   root and extract their records in parallel

   The directory walk is done with nftw(3), which has no way to pass
   state to its callback, so the state of the running walk is kept in
   a thread local.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>
#include <ima-pkg/fileutl.h>
#include <ima-pkg/scanner.h>

#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <errno.h>
#include <fnmatch.h>
#include <ftw.h>
#include <string.h>
#include <sys/stat.h>
									/*}}}*/

using namespace std;

namespace IMA {

namespace {
struct WalkState
{
   std::string const *Pattern;
   std::vector<std::string> *Paths;
   bool Debug;
};
thread_local WalkState *Walk = nullptr;
}

// ScannerFTW - nftw callback collecting matching files			/*{{{*/
// ---------------------------------------------------------------------
/* Any directory or file we can not look at fails the walk, a partial
   list of packages would produce incomplete metadata. Symlinks are
   followed to regular files only, so a directory loop can not occur. */
static int ScannerFTW(const char *File, const struct stat * /*sb*/, int Flag, struct FTW *Info)
{
   switch (Flag)
   {
      case FTW_DNR:
	 // opendir() only leaves us here with EACCES
	 errno = EACCES;
	 _error->Errno("opendir", "Unable to read directory %s", File);
	 return 1;
      case FTW_NS:
	 _error->Errno("stat", "Unable to stat %s", File);
	 return 1;
      case FTW_F:
	 break;
      case FTW_SL:
      {
	 struct stat Target;
	 if (stat(File, &Target) != 0 || S_ISREG(Target.st_mode) == 0)
	 {
	    if (Walk->Debug == true)
	       std::clog << "Skipping symlink " << File << std::endl;
	    return 0;
	 }
	 break;
      }
      default:
	 return 0;
   }

   char const * const LastComponent = File + Info->base;
   if (fnmatch(Walk->Pattern->c_str(), LastComponent, 0) != 0)
      return 0;

   if (Walk->Debug == true)
      std::clog << "Found package " << File << std::endl;
   Walk->Paths->push_back(File);
   return 0;
}
									/*}}}*/
// RepositoryScanner::RepositoryScanner - Constructor			/*{{{*/
RepositoryScanner::RepositoryScanner(DigestExtractor &Extractor, unsigned int const Jobs,
				     std::string const &Pattern) :
   Extractor(Extractor), Pool(Jobs), Pattern(Pattern)
{
}
									/*}}}*/
// RepositoryScanner::Discover - walk the repository			/*{{{*/
bool RepositoryScanner::Discover(std::string const &Root, std::vector<std::string> &Paths)
{
   struct stat Buf;
   if (StatFile("stat", Root, Buf) == false)
      return false;
   if (S_ISDIR(Buf.st_mode) == 0)
      return _error->Error("Repository %s is not a directory", Root.c_str());

   WalkState State{&Pattern, &Paths, _config->FindB("Debug::IMA::Scanner", false)};
   Walk = &State;
   int const Res = nftw(Root.c_str(), ScannerFTW, 30, FTW_PHYS);
   Walk = nullptr;

   // Error treewalking?
   if (Res != 0)
   {
      if (_error->PendingError() == false)
	 _error->Errno("nftw", "Tree walking failed for %s", Root.c_str());
      return false;
   }
   return true;
}
									/*}}}*/
// RepositoryScanner::Scan - extract all archives on the pool		/*{{{*/
bool RepositoryScanner::Scan(std::string const &Root, std::vector<PackageRecord> &Records)
{
   bool const Debug = _config->FindB("Debug::IMA::Scanner", false);

   std::vector<std::string> Paths;
   if (Discover(Root, Paths) == false)
      return false;
   if (Debug == true)
      std::clog << "Scanning " << Paths.size() << " packages in " << Root
		<< " with " << Pool.JobCount() << " jobs" << std::endl;

   std::mutex CollectorLock;
   std::vector<PackageRecord> Collected;
   Collected.reserve(Paths.size());
   bool const Res = Pool.Run(Paths.size(), [&](size_t const Index) {
      PackageRecord Record;
      if (Extractor.Extract(Paths[Index], Record) == false)
	 return false;
      std::lock_guard<std::mutex> Guard(CollectorLock);
      if (Debug == true)
	 std::clog << "Extracted " << Record.Files.size() << " digests from " << Paths[Index] << std::endl;
      Collected.push_back(std::move(Record));
      return true;
   });
   if (Res == false)
      return false;

   for (auto &Record : Collected)
      Records.push_back(std::move(Record));
   return true;
}
									/*}}}*/

}
