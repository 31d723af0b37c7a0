// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   RPM Header Reader - HeaderReader for rpm packages, using librpm

   Every call of Read creates its own transaction set, so readers can
   be used from several threads at once. The rpm configuration itself
   is read once per process.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>
#include <ima-pkg/macros.h>
#include <ima-pkg/rpmheader.h>

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

#include <rpm/header.h>
#include <rpm/rpmfi.h>
#include <rpm/rpmio.h>
#include <rpm/rpmlib.h>
#include <rpm/rpmtag.h>
#include <rpm/rpmts.h>
									/*}}}*/

using namespace std;

namespace IMA {

// InitRpm - read the rpm configuration once				/*{{{*/
static bool InitRpm()
{
   static std::once_flag Once;
   static bool Success = false;
   std::call_once(Once, []() { Success = (rpmReadConfigFiles(NULL, NULL) == 0); });
   if (Success == false)
      return _error->Error("Unable to read the rpm configuration");
   return true;
}
									/*}}}*/
RpmHeaderReader::RpmHeaderReader() {}
RpmHeaderReader::~RpmHeaderReader() {}

// RpmHeaderReader::Read - Read the header of a single package		/*{{{*/
bool RpmHeaderReader::Read(std::string const &Path, PackageHeader &Hdr)
{
   if (InitRpm() == false)
      return false;

   FD_t Fd = Fopen(Path.c_str(), "r.ufdio");
   if (Fd == NULL || Ferror(Fd))
   {
      std::string const Reason = Fstrerror(Fd);
      if (Fd != NULL)
	 Fclose(Fd);
      return _error->Error("Unable to open package %s: %s", Path.c_str(), Reason.c_str());
   }
   DEFER([&]() { Fclose(Fd); });

   rpmts Ts = rpmtsCreate();
   DEFER([&]() { rpmtsFree(Ts); });
   rpmtsSetVSFlags(Ts, static_cast<rpmVSFlags>(_RPMVSF_NOSIGNATURES | _RPMVSF_NODIGESTS));

   Header H = NULL;
   rpmRC const Res = rpmReadPackageFile(Ts, Fd, Path.c_str(), &H);
   DEFER([&]() { if (H != NULL) headerFree(H); });
   switch (Res)
   {
      case RPMRC_OK:
      case RPMRC_NOTTRUSTED:
      case RPMRC_NOKEY:
	 break;
      case RPMRC_NOTFOUND:
	 return _error->Error("%s is not an rpm package", Path.c_str());
      default:
	 return _error->Error("Unable to read package header of %s", Path.c_str());
   }
   if (H == NULL)
      return _error->Error("Unable to read package header of %s", Path.c_str());

   auto const GetString = [&](rpmTagVal const Tag) {
      char const * const S = headerGetString(H, Tag);
      return S == NULL ? std::string() : std::string(S);
   };
   Hdr.Name = GetString(RPMTAG_NAME);
   Hdr.Arch = GetString(RPMTAG_ARCH);
   Hdr.IsSource = headerGetNumber(H, RPMTAG_SOURCEPACKAGE) != 0;
   if (headerIsEntry(H, RPMTAG_EPOCH))
      Hdr.Epoch = headerGetNumber(H, RPMTAG_EPOCH);
   else
      Hdr.Epoch.reset();
   Hdr.Version = GetString(RPMTAG_VERSION);
   Hdr.Release = GetString(RPMTAG_RELEASE);
   if (Hdr.Name.empty() == true)
      return _error->Error("Package %s has no name in its header", Path.c_str());

   Hdr.Files.clear();
   rpmfi Fi = rpmfiNew(Ts, H, RPMTAG_BASENAMES, RPMFI_KEEPHEADER);
   if (Fi == NULL)
      return true; // no files at all
   DEFER([&]() { rpmfiFree(Fi); });

   rpmfiInit(Fi, 0);
   while (rpmfiNext(Fi) >= 0)
   {
      FileDigest File;
      File.Path = rpmfiFN(Fi);
      char * const Digest = rpmfiFDigestHex(Fi, NULL);
      if (Digest != NULL)
      {
	 File.Digest = Digest;
	 free(Digest);
      }
      Hdr.Files.push_back(std::move(File));
   }

   if (_config->FindB("Debug::IMA::Scanner", false) == true)
      std::clog << "Read header of " << Path << ": " << Hdr.Name << " with "
		<< Hdr.Files.size() << " files" << std::endl;
   return true;
}
									/*}}}*/

}
