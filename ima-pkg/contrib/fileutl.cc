// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   Gzip output is produced through zlib on the descriptor FileFd
   opened itself, gzclose closes both.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <ima-pkg/error.h>
#include <ima-pkg/fileutl.h>
#include <ima-pkg/macros.h>

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <zlib.h>
									/*}}}*/

class FileFdPrivate							/*{{{*/
{
   public:
   FileFd::CompressMode Compress = FileFd::None;
   gzFile gz = nullptr;
};
									/*}}}*/
// RemoveFile - unlink a file, a missing file is not an error		/*{{{*/
bool RemoveFile(char const * const Function, std::string const &FileName)
{
   if (unlink(FileName.c_str()) == 0 || errno == ENOENT)
      return true;
   return _error->WarningE(Function, "Problem unlinking the file %s", FileName.c_str());
}
									/*}}}*/
// Rename - rename(2) with error reporting				/*{{{*/
bool Rename(std::string const &From, std::string const &To)
{
   if (rename(From.c_str(), To.c_str()) != 0)
      return _error->Errno("rename", "Failed to rename %s to %s", From.c_str(), To.c_str());
   return true;
}
									/*}}}*/
// StatFile - stat() with error reporting				/*{{{*/
bool StatFile(char const * const Function, std::string const &Path, struct stat &Buf)
{
   if (stat(Path.c_str(), &Buf) != 0)
      return _error->Errno(Function, "Unable to stat %s", Path.c_str());
   return true;
}
									/*}}}*/
// ReadFile - slurp a file						/*{{{*/
bool ReadFile(std::string const &FileName, std::string &Content)
{
   FileFd Fd;
   if (Fd.Open(FileName, FileFd::ReadOnly) == false)
      return false;

   Content.clear();
   char Buf[IMA_BUFFER_SIZE];
   unsigned long long Actual = 0;
   do {
      if (Fd.Read(Buf, sizeof(Buf), &Actual) == false)
	 return false;
      Content.append(Buf, Actual);
   } while (Actual != 0);
   return Fd.Close();
}
									/*}}}*/
// RealFileExists - a regular file, after following symlinks		/*{{{*/
bool RealFileExists(std::string const &File)
{
   struct stat Buf;
   return stat(File.c_str(), &Buf) == 0 && S_ISREG(Buf.st_mode);
}
									/*}}}*/
// DirectoryExists - a directory, after following symlinks		/*{{{*/
bool DirectoryExists(std::string const &Path)
{
   struct stat Buf;
   return stat(Path.c_str(), &Buf) == 0 && S_ISDIR(Buf.st_mode);
}
									/*}}}*/
// CreateDirectory - mkdir -p below an existing Parent			/*{{{*/
bool CreateDirectory(std::string const &Parent, std::string const &Path)
{
   if (Parent.empty() == true || Path.empty() == true)
      return _error->Error("Refusing to create a directory without a name");
   if (DirectoryExists(Path) == true)
      return true;
   if (Path.compare(0, Parent.length(), Parent) != 0)
      return _error->Error("Directory %s is not below %s", Path.c_str(), Parent.c_str());
   if (DirectoryExists(Parent) == false)
      return _error->Error("Directory %s does not exist", Parent.c_str());

   std::string::size_type Pos = Parent.length();
   while (Pos < Path.length())
   {
      std::string::size_type const Slash = Path.find('/', Pos + 1);
      std::string const Current = Path.substr(0, Slash);
      Pos = (Slash == std::string::npos) ? Path.length() : Slash;
      if (Current.empty() == true || Current.back() == '/' || DirectoryExists(Current) == true)
	 continue;
      if (mkdir(Current.c_str(), 0755) != 0)
	 return _error->Errno("mkdir", "Unable to create directory %s", Current.c_str());
   }
   return true;
}
									/*}}}*/
// flNotDir - the part after the last slash				/*{{{*/
std::string flNotDir(std::string const &File)
{
   std::string::size_type const Slash = File.rfind('/');
   if (Slash == std::string::npos)
      return File;
   return File.substr(Slash + 1);
}
									/*}}}*/
// flNotFile - the part up to and including the last slash		/*{{{*/
std::string flNotFile(std::string const &File)
{
   std::string::size_type const Slash = File.rfind('/');
   if (Slash == std::string::npos)
      return "./";
   return File.substr(0, Slash + 1);
}
									/*}}}*/
// flCombine - File relative to Dir, absolute and ./ files stay as is	/*{{{*/
std::string flCombine(std::string const &Dir, std::string const &File)
{
   if (File.empty() == true)
      return std::string();
   if (File[0] == '/' || Dir.empty() == true)
      return File;
   if (File.length() >= 2 && File.compare(0, 2, "./") == 0)
      return File;
   if (Dir.back() == '/')
      return Dir + File;
   return Dir + '/' + File;
}
									/*}}}*/

FileFd::FileFd() : iFd(-1), Flags(0), d(nullptr) {}
FileFd::~FileFd()
{
   Close();
}
// FileFd::Open - open a file, possibly via a temporary one		/*{{{*/
bool FileFd::Open(std::string const &FileName, unsigned int const Mode,
		  CompressMode const Compress, unsigned long const AccessMode)
{
   Close();
   Flags = 0;
   this->FileName = FileName;

   if ((Mode & ReadWrite) == 0)
      return FileFdError("No openmode provided in FileFd::Open for %s", FileName.c_str());
   if (Compress == Gzip && (Mode & ReadWrite) != WriteOnly)
      return FileFdError("Gzip compression is only supported for writing %s", FileName.c_str());
   if ((Mode & Atomic) == Atomic && (Mode & Create) != Create)
      return FileFdError("Atomic writing of %s needs Create", FileName.c_str());

   if ((Mode & Atomic) == Atomic)
   {
      std::vector<char> Template(FileName.begin(), FileName.end());
      for (char const c : std::string(".XXXXXX"))
	 Template.push_back(c);
      Template.push_back('\0');
      iFd = mkstemp(Template.data());
      if (iFd == -1)
	 return FileFdErrno("mkstemp", "Could not create temporary file for %s", FileName.c_str());
      TemporaryFileName = Template.data();

      mode_t const CurrentUmask = umask(0);
      umask(CurrentUmask);
      if (fchmod(iFd, AccessMode & ~CurrentUmask) != 0)
	 return FileFdErrno("fchmod", "Could not change permissions for temporary file %s", TemporaryFileName.c_str());
   }
   else
   {
      int fileflags = 0;
      switch (Mode & ReadWrite)
      {
	 case ReadOnly: fileflags = O_RDONLY; break;
	 case WriteOnly: fileflags = O_WRONLY; break;
	 default: fileflags = O_RDWR; break;
      }
      if ((Mode & Create) == Create)
	 fileflags |= O_CREAT;
      if ((Mode & Empty) == Empty)
	 fileflags |= O_TRUNC;
      iFd = open(FileName.c_str(), fileflags | O_CLOEXEC, AccessMode);
      if (iFd == -1)
	 return FileFdErrno("open", "Could not open file %s", FileName.c_str());
   }

   d = new FileFdPrivate();
   d->Compress = Compress;
   if (Compress == Gzip)
   {
      d->gz = gzdopen(iFd, "wb9");
      if (d->gz == nullptr)
	 return FileFdError("Could not open %s for gzip compression", FileName.c_str());
   }
   return true;
}
									/*}}}*/
// FileFd::Read - read bytes, short reads only allowed with Actual	/*{{{*/
bool FileFd::Read(void *To, unsigned long long Size, unsigned long long *Actual)
{
   if (IsOpen() == false || d->Compress != None)
      return FileFdError("Reading from %s is not possible", FileName.c_str());

   char *Pos = static_cast<char *>(To);
   unsigned long long Done = 0;
   while (Done < Size)
   {
      ssize_t const Res = read(iFd, Pos + Done, Size - Done);
      if (Res < 0)
      {
	 if (errno == EINTR)
	    continue;
	 return FileFdErrno("read", "Read error in %s", FileName.c_str());
      }
      if (Res == 0)
	 break;
      Done += Res;
   }

   if (Actual != nullptr)
   {
      *Actual = Done;
      return true;
   }
   if (Done != Size)
      return FileFdError("read, still have %llu to read but none left in %s", Size - Done, FileName.c_str());
   return true;
}
									/*}}}*/
// FileFd::Write - write all bytes					/*{{{*/
bool FileFd::Write(const void *From, unsigned long long Size)
{
   if (IsOpen() == false)
      return FileFdError("Writing to %s is not possible", FileName.c_str());

   char const *Pos = static_cast<char const *>(From);
   while (Size != 0)
   {
      ssize_t Res;
      if (d->gz != nullptr)
      {
	 unsigned int const Chunk = Size > IMA_BUFFER_SIZE ? IMA_BUFFER_SIZE : Size;
	 Res = gzwrite(d->gz, Pos, Chunk);
	 if (Res <= 0)
	 {
	    int err;
	    char const * const msg = gzerror(d->gz, &err);
	    if (err == Z_ERRNO)
	       return FileFdErrno("gzwrite", "Write error in %s", FileName.c_str());
	    return FileFdError("gzwrite: Write error in %s (%s)", FileName.c_str(), msg);
	 }
      }
      else
      {
	 Res = write(iFd, Pos, Size);
	 if (Res < 0)
	 {
	    if (errno == EINTR)
	       continue;
	    return FileFdErrno("write", "Write error in %s", FileName.c_str());
	 }
      }
      Pos += Res;
      Size -= Res;
   }
   return true;
}
									/*}}}*/
// FileFd::Sync - flush the data to disk				/*{{{*/
bool FileFd::Sync()
{
   if (IsOpen() == false)
      return true;
   if (d->gz != nullptr && gzflush(d->gz, Z_SYNC_FLUSH) != Z_OK)
      return FileFdError("Problem flushing compressed data of %s", FileName.c_str());
   if (fsync(iFd) != 0 && errno != EINVAL)
      return FileFdErrno("fsync", "Problem syncing the file %s", FileName.c_str());
   return true;
}
									/*}}}*/
// FileFd::Close - close and commit or drop an atomic write		/*{{{*/
bool FileFd::Close()
{
   if (IsOpen() == false && TemporaryFileName.empty() == true)
      return true;

   bool Res = true;
   if (d != nullptr && d->gz != nullptr)
   {
      int const e = gzclose(d->gz);
      // gzdclose() on an empty gzFile may report Z_BUF_ERROR
      if (e != Z_OK && e != Z_BUF_ERROR)
	 Res &= _error->Errno("close", "Problem closing the gzip file %s", FileName.c_str());
   }
   else if (iFd != -1 && close(iFd) != 0)
      Res &= _error->Errno("close", "Problem closing the file %s", FileName.c_str());
   iFd = -1;
   delete d;
   d = nullptr;
   if (Res == false)
      Flags |= Fail;

   if (TemporaryFileName.empty() == false)
   {
      if (Failed() == true)
	 Res &= RemoveFile("FileFd::Close", TemporaryFileName);
      else
	 Res &= Rename(TemporaryFileName, FileName);
      TemporaryFileName.clear();
   }
   else if (Failed() == true && (Flags & DelOnFail) == DelOnFail)
      Res &= RemoveFile("FileFd::Close", FileName);

   return Res;
}
									/*}}}*/
// FileFd::FileFdErrno - failure with errno, marks the file failed	/*{{{*/
bool FileFd::FileFdErrno(const char *Function, const char *Description, ...)
{
   Flags |= Fail;
   int const Errsv = errno;
   va_list Args;
   va_start(Args, Description);
   char Buf[1024];
   vsnprintf(Buf, sizeof(Buf), Description, Args);
   va_end(Args);
   errno = Errsv;
   return _error->Errno(Function, "%s", Buf);
}
									/*}}}*/
// FileFd::FileFdError - failure, marks the file failed			/*{{{*/
bool FileFd::FileFdError(const char *Description, ...)
{
   Flags |= Fail;
   va_list Args;
   va_start(Args, Description);
   char Buf[1024];
   vsnprintf(Buf, sizeof(Buf), Description, Args);
   va_end(Args);
   return _error->Error("%s", Buf);
}
									/*}}}*/
