// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   imadata.xml - the document listing the measured files of all
   packages of a repository

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/error.h>
#include <ima-pkg/fileutl.h>
#include <ima-pkg/imadata.h>
#include <ima-pkg/strutl.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>
									/*}}}*/

using namespace std;

namespace IMA {

// RenderImaData - build the document					/*{{{*/
std::string RenderImaData(std::vector<PackageRecord> const &Records)
{
   std::vector<PackageRecord const *> Sorted;
   Sorted.reserve(Records.size());
   for (auto const &R : Records)
      Sorted.push_back(&R);
   std::stable_sort(Sorted.begin(), Sorted.end(), [](PackageRecord const *A, PackageRecord const *B) {
      return A->Name < B->Name;
   });

   std::ostringstream Out;
   Out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
       << "<imadata packages=\"" << Records.size() << "\">\n";
   for (auto const * const R : Sorted)
   {
      Out << "<package name=\"" << XMLEscape(R->Name) << "\" arch=\""
	  << (R->IsSource ? std::string("src") : XMLEscape(R->Arch)) << "\">\n";
      Out << "  <version epoch=\"" << R->Epoch.value_or(0)
	  << "\" ver=\"" << XMLEscape(R->Version)
	  << "\" rel=\"" << XMLEscape(R->Release) << "\"/>\n";
      for (auto const &F : R->Files)
	 Out << "  <file hash=\"" << XMLEscape(F.Digest) << "\">" << XMLEscape(F.Path) << "</file>\n";
      Out << "</package>\n";
   }
   // no newline at the end of the document
   Out << "</imadata>";
   return Out.str();
}
									/*}}}*/
// WriteImaData - write the document into the repository		/*{{{*/
bool WriteImaData(std::string const &Root, std::vector<PackageRecord> const &Records,
		  std::string &OutPath, std::string const &Name)
{
   std::string const FileName = flCombine(Root, Name);
   std::string Dir = flNotFile(FileName);
   if (Dir.length() > 1 && Dir.back() == '/')
      Dir.pop_back();
   std::string Parent = Root;
   if (Parent.length() > 1 && Parent.back() == '/')
      Parent.pop_back();
   if (DirectoryExists(Dir) == false && CreateDirectory(Parent, Dir) == false)
   {
      if (_error->PendingError() == false)
	 return _error->Error("Unable to create directory %s", Dir.c_str());
      return false;
   }

   FileFd Fd;
   if (Fd.Open(FileName, FileFd::WriteAtomic, 0644) == false)
      return false;
   if (Fd.Write(RenderImaData(Records)) == false)
   {
      Fd.OpFail();
      Fd.Close();
      return false;
   }
   if (Fd.Close() == false)
      return false;

   OutPath = FileName;
   return true;
}
									/*}}}*/

}
