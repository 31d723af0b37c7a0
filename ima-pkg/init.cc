// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the ima library

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>
#include <ima-pkg/fileutl.h>
#include <ima-pkg/init.h>
#include <ima-pkg/workerpool.h>

#include <cstdlib>
#include <string.h>
									/*}}}*/

const char *imaVersion = PACKAGE_VERSION;

// imaInitConfig - Initialize the configuration class			/*{{{*/
// ---------------------------------------------------------------------
/* Directories are relative to the repository root, the file named by
   IMA_CONFIG can override all of the defaults. */
bool imaInitConfig(Configuration &Cnf)
{
   Cnf.CndSet("IMA::Repodata::Jobs", static_cast<int>(IMA::AvailableParallelism()));
   Cnf.CndSet("IMA::Repodata::Modify", "false");
   Cnf.CndSet("IMA::Repodata::Package-Pattern", "*.rpm");
   Cnf.CndSet("IMA::Repodata::Checksum-Type", "sha256");
   Cnf.CndSet("IMA::Repodata::Type", "imadata");

   Cnf.CndSet("Dir::Repodata", "repodata");
   Cnf.CndSet("Dir::Repodata::ImaData", "imadata.xml");
   Cnf.CndSet("Dir::Repodata::RepoMD", "repomd.xml");

   bool Res = true;

   // Read an alternate config file
   const char *Cfg = getenv("IMA_CONFIG");
   if (Cfg != 0 && strlen(Cfg) != 0)
   {
      if (RealFileExists(Cfg) == true)
	 Res &= ReadConfigFile(Cnf,Cfg);
      else
	 _error->WarningE("RealFileExists","Unable to read %s",Cfg);
   }

   if (Cnf.FindB("Debug::imaInitConfig",false) == true)
      Cnf.Dump();

   return Res;
}
									/*}}}*/
