// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   ima-repodata - Add IMA digests to the metadata of an rpm repository

   Every package below the repository root is read and the digests of
   its files are listed in repodata/imadata.xml. With --modify the
   document is compressed, named after its checksum and registered
   in repodata/repomd.xml.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/cmndline.h>
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>
#include <ima-pkg/extractor.h>
#include <ima-pkg/fileutl.h>
#include <ima-pkg/finalize.h>
#include <ima-pkg/imadata.h>
#include <ima-pkg/init.h>
#include <ima-pkg/pkgrecord.h>
#include <ima-pkg/repomd.h>
#include <ima-pkg/rpmheader.h>
#include <ima-pkg/scanner.h>
#include <ima-pkg/strutl.h>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>
									/*}}}*/

using namespace std;

ostream c0out(0);
ostream c1out(0);
static ofstream devnull("/dev/null");
static unsigned Quiet = 0;

// ShowHelp - Show the help text					/*{{{*/
static bool ShowHelp()
{
   std::cout <<
    "Usage: ima-repodata [options] REPO\n"
      "\n"
      "ima-repodata reads the header of every rpm package below the\n"
      "repository root REPO and writes the IMA digests of their files\n"
      "to repodata/imadata.xml.\n"
      "\n"
      "With --modify the document is compressed into\n"
      "repodata/<checksum>-imadata.xml.gz and registered in\n"
      "repodata/repomd.xml. A repository which already has imadata\n"
      "registered is left alone.\n"
      "\n"
      "Options:\n"
      "  -h    This help text\n"
      "  -v    Show the program version\n"
      "  -j=?  Number of packages to read in parallel\n"
      "  -m    Compress the document and register it in repomd.xml\n"
      "  -q    Quiet\n"
      "  -c=?  Read this configuration file\n"
      "  -o=?  Set an arbitrary configuration option" << endl;
   return true;
}
									/*}}}*/
// ShowVersion - Show the version line					/*{{{*/
static bool ShowVersion()
{
   std::cout << "ima-repodata " << imaVersion << endl;
   return true;
}
									/*}}}*/
// InitOutput - set up the progress streams				/*{{{*/
static void InitOutput()
{
   Quiet = _config->FindI("quiet",0);
   c0out.rdbuf(cout.rdbuf());
   c1out.rdbuf(cout.rdbuf());
   if (Quiet > 0)
      c0out.rdbuf(devnull.rdbuf());
   if (Quiet > 1)
      c1out.rdbuf(devnull.rdbuf());
}
									/*}}}*/
// DoRepodata - scan the repository and write the metadata		/*{{{*/
static bool DoRepodata(std::string const &Root)
{
   int const Jobs = _config->FindI("IMA::Repodata::Jobs", 0);
   if (Jobs < 0)
      return _error->Error("Invalid number of jobs %d", Jobs);

   IMA::RpmHeaderReader Reader;
   IMA::DigestExtractor Extractor(Reader);
   IMA::RepositoryScanner Scanner(Extractor, Jobs,
				  _config->Find("IMA::Repodata::Package-Pattern", "*.rpm"));

   c1out << "Scanning " << Root << endl;
   std::vector<IMA::PackageRecord> Records;
   if (Scanner.Scan(Root, Records) == false)
      return false;
   c1out << Records.size() << " packages read with " << Scanner.JobCount() << " jobs" << endl;

   std::string DocPath;
   if (IMA::WriteImaData(Root, Records, DocPath, _config->FindFile("Dir::Repodata::ImaData")) == false)
      return false;
   c1out << "Wrote " << DocPath << endl;

   if (_config->FindB("IMA::Repodata::Modify", false) == false)
      return true;

   std::string const Type = _config->Find("IMA::Repodata::Type", "imadata");
   IMA::ArtifactInfo Info;
   if (IMA::FinalizeArtifact(DocPath, _config->Find("IMA::Repodata::Checksum-Type", "sha256"), Info) == false)
      return false;
   ioprintf(c0out, "Compressed %sB into %sB at %s\n", SizeToStr(Info.OpenSize).c_str(),
	    SizeToStr(Info.Size).c_str(), Info.Path.c_str());

   std::string const RepoMD = flCombine(Root, _config->FindFile("Dir::Repodata::RepoMD"));
   if (IMA::PatchRepoMD(RepoMD, Info, Type, _config->Find("Dir::Repodata", "repodata")) == false)
      return false;
   c1out << "Registered " << Type << " in " << RepoMD << endl;
   return true;
}
									/*}}}*/
int main(int argc, const char *argv[])					/*{{{*/
{
   CommandLine::Args Args[] = {
      {'h',"help","help",0},
      {'v',"version","version",0},
      {'q',"quiet","quiet",CommandLine::IntLevel},
      {'j',"jobs","IMA::Repodata::Jobs",CommandLine::HasArg},
      {'m',"modify","IMA::Repodata::Modify",0},
      {'c',"config-file",0,CommandLine::ConfigFile},
      {'o',"option",0,CommandLine::ArbItem},
      {0,0,0,0}};

   // Parse the command line and initialize the package library
   CommandLine CmdL(Args,_config);
   if (imaInitConfig(*_config) == false ||
       CmdL.Parse(argc,argv) == false)
   {
      _error->DumpErrors();
      return 100;
   }

   if (_config->FindB("help") == true)
   {
      ShowHelp();
      return 0;
   }
   if (_config->FindB("version") == true)
   {
      ShowVersion();
      return 0;
   }

   InitOutput();

   if (CmdL.FileSize() != 1)
   {
      _error->Error("Exactly one repository has to be given, see ima-repodata --help");
      _error->DumpErrors();
      return 100;
   }

   bool const Res = DoRepodata(CmdL.FileList[0]);

   // Print any errors or warnings found during processing
   bool const Errors = _error->PendingError();
   // -qq leaves only the errors
   if (_config->FindI("quiet",0) > 1)
      _error->DumpErrors(std::cerr, GlobalError::ERROR);
   else
      _error->DumpErrors();
   return (Res == false || Errors == true) ? 100 : 0;
}
									/*}}}*/
