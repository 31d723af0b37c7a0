#include <ima-pkg/error.h>
#include <ima-pkg/extractor.h>
#include <ima-pkg/pkgrecord.h>
#include <ima-pkg/scanner.h>

#include <algorithm>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"
#include "header-helpers.h"

static void AddHeader(FakeHeaderReader &Reader, std::string const &Path, std::string const &Name)
{
   IMA::PackageHeader &Hdr = Reader.Headers[Path];
   Hdr.Name = Name;
   Hdr.Arch = "noarch";
   Hdr.Version = "1.0";
   Hdr.Release = "1";
   Hdr.Files.push_back({"/usr/bin/" + Name, std::string(64, 'a')});
}

TEST(ScannerTest, Discover)
{
   std::string tempdir;
   createTemporaryDirectory("discover", tempdir);
   createFile(tempdir, "a-1.0-1.noarch.rpm");
   createDirectory(tempdir, "Packages/b");
   createFile(tempdir, "Packages/b/b-2.0-1.src.rpm");
   createDirectory(tempdir, "Packages/c/deeper/still");
   createFile(tempdir, "Packages/c/deeper/still/c-3-1.x86_64.rpm");
   createFile(tempdir, "README");
   createFile(tempdir, "a-1.0-1.noarch.rpm.bak");
   createDirectory(tempdir, "directory.rpm");
   createDirectory(tempdir, "repodata");
   createFile(tempdir, "repodata/repomd.xml");
   // a symlinked archive is found, a symlinked directory is not entered
   createLink(tempdir, "a-1.0-1.noarch.rpm", "link.rpm");
   createLink(tempdir, "Packages", "linkdir");

   FakeHeaderReader Reader;
   IMA::DigestExtractor Extractor(Reader);
   {
      IMA::RepositoryScanner Scanner(Extractor, 1);
      std::vector<std::string> Paths;
      EXPECT_TRUE(Scanner.Discover(tempdir, Paths));
      std::sort(Paths.begin(), Paths.end());
      std::vector<std::string> const Expected = {
	 tempdir + "/Packages/b/b-2.0-1.src.rpm",
	 tempdir + "/Packages/c/deeper/still/c-3-1.x86_64.rpm",
	 tempdir + "/a-1.0-1.noarch.rpm",
	 tempdir + "/link.rpm",
      };
      EXPECT_EQ(Expected, Paths);
   }
   {
      IMA::RepositoryScanner Scanner(Extractor, 1, "*.src.rpm");
      std::vector<std::string> Paths;
      EXPECT_TRUE(Scanner.Discover(tempdir, Paths));
      ASSERT_EQ(1u, Paths.size());
      EXPECT_EQ(tempdir + "/Packages/b/b-2.0-1.src.rpm", Paths[0]);
   }
   EXPECT_EQ(0u, Reader.Calls);
   EXPECT_TRUE(_error->empty());
   removeDirectory(tempdir);
}
TEST(ScannerTest, SymlinkedArchive)
{
   std::string tempdir;
   createTemporaryDirectory("symlinked", tempdir);
   createDirectory(tempdir, "pool");
   createDirectory(tempdir, "Packages");
   createFile(tempdir, "pool/a-1-1.noarch.rpm");
   createLink(tempdir, "pool/a-1-1.noarch.rpm", "Packages/b-1-1.noarch.rpm");
   // dangling links and links to directories are skipped
   createLink(tempdir, "pool/gone-1-1.noarch.rpm", "Packages/gone-1-1.noarch.rpm");
   createLink(tempdir, "pool", "Packages/pool.rpm");

   FakeHeaderReader Reader;
   IMA::DigestExtractor Extractor(Reader);
   IMA::RepositoryScanner Scanner(Extractor, 1);
   std::vector<std::string> Paths;
   EXPECT_TRUE(Scanner.Discover(tempdir, Paths));
   std::sort(Paths.begin(), Paths.end());
   std::vector<std::string> const Expected = {
      tempdir + "/Packages/b-1-1.noarch.rpm",
      tempdir + "/pool/a-1-1.noarch.rpm",
   };
   EXPECT_EQ(Expected, Paths);
   EXPECT_TRUE(_error->empty());
   removeDirectory(tempdir);
}
TEST(ScannerTest, UnreadableSubdirectory)
{
   // root reads every directory regardless of its mode
   if (getuid() == 0)
      GTEST_SKIP() << "permissions are not enforced for root";

   std::string tempdir;
   createTemporaryDirectory("unreadable", tempdir);
   createFile(tempdir, "a-1-1.noarch.rpm");
   createDirectory(tempdir, "private");
   createFile(tempdir, "private/b-1-1.noarch.rpm");
   std::string const privdir = tempdir + "/private";
   ASSERT_EQ(0, chmod(privdir.c_str(), 0));

   FakeHeaderReader Reader;
   IMA::DigestExtractor Extractor(Reader);
   IMA::RepositoryScanner Scanner(Extractor, 1);
   std::vector<std::string> Paths;
   EXPECT_FALSE(Scanner.Discover(tempdir, Paths));
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Unable to read directory " + privdir + " - opendir (13: Permission denied)", msg);
   EXPECT_TRUE(_error->empty());

   std::vector<IMA::PackageRecord> Records;
   EXPECT_FALSE(Scanner.Scan(tempdir, Records));
   EXPECT_TRUE(Records.empty());
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   ASSERT_EQ(0, chmod(privdir.c_str(), 0755));
   removeDirectory(tempdir);
}
TEST(ScannerTest, BadRoot)
{
   FakeHeaderReader Reader;
   IMA::DigestExtractor Extractor(Reader);
   IMA::RepositoryScanner Scanner(Extractor, 2);
   std::vector<IMA::PackageRecord> Records;

   std::string tempdir;
   createTemporaryDirectory("badroot", tempdir);
   EXPECT_FALSE(Scanner.Scan(tempdir + "/does-not-exist", Records));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   createFile(tempdir, "plain.rpm");
   EXPECT_FALSE(Scanner.Scan(tempdir + "/plain.rpm", Records));
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Repository " + tempdir + "/plain.rpm is not a directory", msg);
   EXPECT_TRUE(Records.empty());
   _error->Discard();
   removeDirectory(tempdir);
}
TEST(ScannerTest, EmptyRepository)
{
   std::string tempdir;
   createTemporaryDirectory("emptyrepo", tempdir);
   createDirectory(tempdir, "repodata");
   createFile(tempdir, "repodata/repomd.xml");

   FakeHeaderReader Reader;
   IMA::DigestExtractor Extractor(Reader);
   IMA::RepositoryScanner Scanner(Extractor, 0);
   std::vector<IMA::PackageRecord> Records;
   EXPECT_TRUE(Scanner.Scan(tempdir, Records));
   EXPECT_TRUE(Records.empty());
   EXPECT_EQ(0u, Reader.Calls);
   EXPECT_TRUE(_error->empty());
   removeDirectory(tempdir);
}
TEST(ScannerTest, Scan)
{
   std::string tempdir;
   createTemporaryDirectory("scan", tempdir);
   createDirectory(tempdir, "Packages");

   FakeHeaderReader Reader;
   std::vector<std::string> Names;
   for (char c = 'a'; c <= 'z'; ++c)
   {
      std::string const Name(1, c);
      std::string const File = "Packages/" + Name + "-1.0-1.noarch.rpm";
      createFile(tempdir, File);
      AddHeader(Reader, tempdir + "/" + File, Name);
      Names.push_back(Name);
   }

   IMA::DigestExtractor Extractor(Reader);
   IMA::RepositoryScanner Scanner(Extractor, 4);
   EXPECT_EQ(4u, Scanner.JobCount());
   std::vector<IMA::PackageRecord> Records;
   ASSERT_TRUE(Scanner.Scan(tempdir, Records));
   EXPECT_EQ(26u, Reader.Calls);
   ASSERT_EQ(26u, Records.size());

   std::vector<std::string> Found;
   for (auto const &R : Records)
   {
      Found.push_back(R.Name);
      ASSERT_EQ(1u, R.Files.size());
      EXPECT_EQ("/usr/bin/" + R.Name, R.Files[0].Path);
   }
   std::sort(Found.begin(), Found.end());
   EXPECT_EQ(Names, Found);
   EXPECT_TRUE(_error->empty());
   removeDirectory(tempdir);
}
TEST(ScannerTest, OneBrokenArchiveFailsTheScan)
{
   std::string tempdir;
   createTemporaryDirectory("brokenscan", tempdir);

   FakeHeaderReader Reader;
   for (auto const &Name : { "a", "b", "c", "d" })
   {
      std::string const File = std::string(Name) + "-1.0-1.noarch.rpm";
      createFile(tempdir, File);
      AddHeader(Reader, tempdir + "/" + File, Name);
   }
   createFile(tempdir, "broken-1.0-1.noarch.rpm");
   Reader.Message = "broken-1.0-1.noarch.rpm is not an rpm package";

   IMA::DigestExtractor Extractor(Reader);
   IMA::RepositoryScanner Scanner(Extractor, 2);
   std::vector<IMA::PackageRecord> Records;
   Records.emplace_back();
   Records.back().Name = "kept";
   EXPECT_FALSE(Scanner.Scan(tempdir, Records));
   // nothing partial is handed out
   ASSERT_EQ(1u, Records.size());
   EXPECT_EQ("kept", Records[0].Name);

   EXPECT_TRUE(_error->PendingError());
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("broken-1.0-1.noarch.rpm is not an rpm package", msg);
   _error->Discard();
   removeDirectory(tempdir);
}
