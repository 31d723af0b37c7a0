// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Artifact Finalizer - compress a metadata document and give it its
   content addressed name

   The gzip header written by zlib carries no modification time, but
   the file's ctime is recorded as timestamp, so two runs over the
   same repository still produce different index entries.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>
#include <ima-pkg/fileutl.h>
#include <ima-pkg/finalize.h>
#include <ima-pkg/hashes.h>
#include <ima-pkg/macros.h>
#include <ima-pkg/strutl.h>

#include <array>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
									/*}}}*/

using namespace std;

namespace IMA {

// CompressFile - gzip From into To while hashing the input		/*{{{*/
static bool CompressFile(std::string const &From, std::string const &To, Hashes &Hash)
{
   FileFd In;
   if (In.Open(From, FileFd::ReadOnly) == false)
      return false;
   FileFd Out;
   if (Out.Open(To, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, FileFd::Gzip, 0644) == false)
      return false;
   Out.EraseOnFailure();

   std::array<unsigned char, IMA_BUFFER_SIZE> Buf;
   unsigned long long Actual = 0;
   do {
      if (In.Read(Buf.data(), Buf.size(), &Actual) == false ||
	  Hash.Add(Buf.data(), Actual) == false ||
	  Out.Write(Buf.data(), Actual) == false)
      {
	 Out.OpFail();
	 Out.Close();
	 return false;
      }
   } while (Actual != 0);

   if (Out.Close() == false)
      return false;
   return In.Close();
}
									/*}}}*/
// FinalizeArtifact - compress, hash and rename the document		/*{{{*/
bool FinalizeArtifact(std::string const &DocPath, std::string const &ChecksumType,
		      ArtifactInfo &Info)
{
   bool const Debug = _config->FindB("Debug::IMA::Finalize", false);

   Hashes::SupportedHashes HashType;
   if (Hashes::FromTypeName(ChecksumType, HashType) == false)
      return _error->Error("Checksum type %s is not supported", ChecksumType.c_str());
   Info.ChecksumType.clear();
   for (char const c : ChecksumType)
      Info.ChecksumType.push_back(tolower_ascii(c));

   struct stat Buf;
   if (StatFile("stat", DocPath, Buf) == false)
      return false;
   Info.OpenSize = Buf.st_size;

   std::string const GzPath = DocPath + ".gz";
   Hashes OpenHash(HashType);
   if (CompressFile(DocPath, GzPath, OpenHash) == false)
      return false;
   Info.OpenChecksum = OpenHash.GetHashString(HashType).HashValue();
   if (Debug == true)
      std::clog << "Compressed " << DocPath << " (" << Info.OpenSize << " bytes, "
		<< ChecksumType << " " << Info.OpenChecksum << ") into " << GzPath << std::endl;

   if (unlink(DocPath.c_str()) != 0)
      return _error->Errno("unlink", "Problem unlinking the file %s", DocPath.c_str());

   FileFd Gz;
   if (Gz.Open(GzPath, FileFd::ReadOnly) == false)
      return false;
   Hashes Hash(HashType);
   if (Hash.AddFD(Gz) == false)
      return _error->Error("Unable to calculate the checksum of %s", GzPath.c_str());
   if (Gz.Close() == false)
      return false;
   Info.Checksum = Hash.GetHashString(HashType).HashValue();

   if (StatFile("stat", GzPath, Buf) == false)
      return false;
   Info.Size = Buf.st_size;
   Info.Timestamp = Buf.st_ctime;

   Info.Name = flNotDir(GzPath);
   Info.Path = flNotFile(GzPath) + Info.Checksum + "-" + Info.Name;
   if (Rename(GzPath, Info.Path) == false)
      return false;

   if (Debug == true)
      std::clog << "Finalized " << Info.Path << " (" << Info.Size << " bytes, timestamp "
		<< Info.Timestamp << ")" << std::endl;
   return true;
}
									/*}}}*/

}
