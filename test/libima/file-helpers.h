#ifndef IMA_TEST_FILE_HELPERS_H
#define IMA_TEST_FILE_HELPERS_H

#include <string>

#include <gtest/gtest.h>

// The macros end the calling test on failure, the helper functions
// behind them are not meant to be called directly.

#define createTemporaryDirectory(id, dir) \
   ASSERT_NO_FATAL_FAILURE(helperCreateTemporaryDirectory(id, dir))
#define removeDirectory(dir) \
   ASSERT_NO_FATAL_FAILURE(helperRemoveDirectory(dir))
#define createFile(dir, name) \
   ASSERT_NO_FATAL_FAILURE(helperCreateFile(dir, name, ""))
#define createFileWithContent(dir, name, content) \
   ASSERT_NO_FATAL_FAILURE(helperCreateFile(dir, name, content))
#define createDirectory(dir, name) \
   ASSERT_NO_FATAL_FAILURE(helperCreateDirectory(dir, name))
// symlink dir/linkname -> dir/targetname
#define createLink(dir, targetname, linkname) \
   ASSERT_NO_FATAL_FAILURE(helperCreateLink(dir, targetname, linkname))
#define readFile(file, content) \
   ASSERT_NO_FATAL_FAILURE(helperReadFile(file, content))

void helperCreateTemporaryDirectory(std::string const &id, std::string &dir);
void helperRemoveDirectory(std::string const &dir);
void helperCreateFile(std::string const &dir, std::string const &name, std::string const &content);
void helperCreateDirectory(std::string const &dir, std::string const &name);
void helperCreateLink(std::string const &dir, std::string const &targetname, std::string const &linkname);
void helperReadFile(std::string const &file, std::string &content);

// a temporary file which is removed again at the end of the scope
class ScopedFileDeleter
{
   std::string _filename;

   public:
   explicit ScopedFileDeleter(std::string const &filename);
   ScopedFileDeleter(ScopedFileDeleter const &) = delete;
   ScopedFileDeleter(ScopedFileDeleter &&other);
   ScopedFileDeleter &operator=(ScopedFileDeleter const &) = delete;
   ScopedFileDeleter &operator=(ScopedFileDeleter &&other);
   ~ScopedFileDeleter();

   std::string const &Name() const { return _filename; }
};
ScopedFileDeleter createTemporaryFile(std::string const &id, char const * const content = nullptr);

#endif
