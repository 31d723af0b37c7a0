// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd wraps a file descriptor with error reporting on the global
   error list. It writes plain or gzip compressed files and can replace
   a file atomically: the data goes to a temporary file next to the
   target which Close renames over it, unless an operation failed.

   ##################################################################### */
									/*}}}*/
#ifndef IMAPKG_FILEUTL_H
#define IMAPKG_FILEUTL_H

#include <ima-pkg/macros.h>

#include <string>
#include <sys/stat.h>

class FileFdPrivate;
class IMA_PUBLIC FileFd
{
   public:
   enum OpenMode {
      ReadOnly = (1 << 0),
      WriteOnly = (1 << 1),
      ReadWrite = ReadOnly | WriteOnly,

      Create = (1 << 2),
      Empty = (1 << 3),
      Atomic = (1 << 4),

      WriteEmpty = WriteOnly | Create | Empty,
      WriteAtomic = WriteOnly | Create | Atomic
   };
   enum CompressMode {
      None = 'N',
      // only for writing
      Gzip = 'G'
   };

   /** \brief read up to Size bytes
    *
    *  Without \b Actual anything short of Size is an error, with it
    *  a short count signals the end of the file. */
   bool Read(void *To,unsigned long long Size,unsigned long long *Actual = nullptr);
   bool Write(const void *From,unsigned long long Size);
   inline bool Write(std::string const &From) { return Write(From.data(), From.length()); };

   bool Open(std::string const &FileName,unsigned int const Mode,CompressMode const Compress,unsigned long const AccessMode = 0666);
   inline bool Open(std::string const &FileName,unsigned int const Mode,unsigned long const AccessMode = 0666) {
      return Open(FileName, Mode, None, AccessMode);
   };
   /** \brief close the file, an atomic write is committed here */
   bool Close();
   bool Sync();

   inline bool IsOpen() const { return iFd >= 0; };
   inline bool Failed() const { return (Flags & Fail) == Fail; };
   /** \brief a failed non-atomic write removes the file on Close */
   inline void EraseOnFailure() { Flags |= DelOnFail; };
   inline void OpFail() { Flags |= Fail; };
   inline std::string const &Name() const { return FileName; };

   FileFd();
   ~FileFd();
   FileFd(FileFd const &) = delete;
   FileFd &operator=(FileFd const &) = delete;

   private:
   enum LocalFlags { Fail = (1 << 0), DelOnFail = (1 << 1) };
   int iFd;
   unsigned int Flags;
   std::string FileName;
   std::string TemporaryFileName;
   FileFdPrivate *d;

   IMA_HIDDEN bool FileFdErrno(const char *Function,const char *Description,...) IMA_PRINTF(3) IMA_COLD;
   IMA_HIDDEN bool FileFdError(const char *Description,...) IMA_PRINTF(2) IMA_COLD;
};

/** \brief unlink a file, a file which is already gone is fine */
IMA_PUBLIC bool RemoveFile(char const * const Function, std::string const &FileName);
IMA_PUBLIC bool Rename(std::string const &From, std::string const &To);
/** \brief stat() a file, reporting failures on the error stack */
IMA_PUBLIC bool StatFile(char const * const Function, std::string const &Path, struct stat &Buf);
/** \brief read a complete (small) file into Content */
IMA_PUBLIC bool ReadFile(std::string const &FileName, std::string &Content);

IMA_PUBLIC bool RealFileExists(std::string const &File);
IMA_PUBLIC bool DirectoryExists(std::string const &Path);
/** \brief mkdir -p for the part of Path below Parent
 *
 *  Parent has to exist and to be a prefix of Path. */
IMA_PUBLIC bool CreateDirectory(std::string const &Parent, std::string const &Path);

// File string manipulators
IMA_PUBLIC std::string flNotDir(std::string const &File);
IMA_PUBLIC std::string flNotFile(std::string const &File);
IMA_PUBLIC std::string flCombine(std::string const &Dir,std::string const &File);

#endif
