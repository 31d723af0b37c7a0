#include <ima-pkg/cmndline.h>
#include <ima-pkg/configuration.h>
#include <ima-pkg/error.h>

#include <string>

#include <gtest/gtest.h>

#include "file-helpers.h"

static CommandLine::Args RepodataArgs[] = {
   {'h',"help","help",0},
   {'v',"version","version",0},
   {'q',"quiet","quiet",CommandLine::IntLevel},
   {'j',"jobs","IMA::Repodata::Jobs",CommandLine::HasArg},
   {'m',"modify","IMA::Repodata::Modify",0},
   {'c',"config-file",0,CommandLine::ConfigFile},
   {'o',"option",0,CommandLine::ArbItem},
   {0,0,0,0}};

static std::string ParseError(CommandLine &CmdL, int const argc, char const **argv)
{
   EXPECT_FALSE(CmdL.Parse(argc, argv));
   EXPECT_EQ(0u, CmdL.FileSize());
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   _error->Discard();
   return msg;
}

TEST(CommandLineTest,Repodata)
{
   ::Configuration c;
   CommandLine CmdL(RepodataArgs, &c);

   {
   char const * argv[] = { "ima-repodata", "-j", "4", "--modify", "/srv/repo" };
   EXPECT_TRUE(CmdL.Parse(5 , argv));
   EXPECT_EQ(4, c.FindI("IMA::Repodata::Jobs"));
   EXPECT_TRUE(c.FindB("IMA::Repodata::Modify"));
   ASSERT_EQ(1u, CmdL.FileSize());
   EXPECT_STREQ("/srv/repo", CmdL.FileList[0]);
   EXPECT_EQ(nullptr, CmdL.FileList[1]);
   }
   c.Clear();
   {
   char const * argv[] = { "ima-repodata", "--no-modify", "/srv/repo", "-qq", "--jobs=2" };
   EXPECT_TRUE(CmdL.Parse(5 , argv));
   EXPECT_EQ(2, c.FindI("IMA::Repodata::Jobs"));
   EXPECT_FALSE(c.FindB("IMA::Repodata::Modify", true));
   EXPECT_EQ(2, c.FindI("quiet"));
   ASSERT_EQ(1u, CmdL.FileSize());
   EXPECT_STREQ("/srv/repo", CmdL.FileList[0]);
   }
   c.Clear();
   {
   char const * argv[] = { "ima-repodata", "-q=5", "-mj8", "--", "-repo", "other" };
   EXPECT_TRUE(CmdL.Parse(6 , argv));
   EXPECT_EQ(5, c.FindI("quiet"));
   EXPECT_TRUE(c.FindB("IMA::Repodata::Modify"));
   EXPECT_EQ(8, c.FindI("IMA::Repodata::Jobs"));
   ASSERT_EQ(2u, CmdL.FileSize());
   EXPECT_STREQ("-repo", CmdL.FileList[0]);
   EXPECT_STREQ("other", CmdL.FileList[1]);
   }
   c.Clear();
   {
   auto const file = createTemporaryFile("cmdlineconfig", "IMA::Repodata::Checksum-Type \"sha512\";\n");
   char const * argv[] = { "ima-repodata", "-c", file.Name().c_str(), "-o", "Dir::Repodata=meta", "repo" };
   EXPECT_TRUE(CmdL.Parse(6 , argv));
   EXPECT_EQ("sha512", c.Find("IMA::Repodata::Checksum-Type"));
   EXPECT_EQ("meta", c.Find("Dir::Repodata"));
   EXPECT_EQ(1u, CmdL.FileSize());
   }
   EXPECT_TRUE(_error->empty());
}
TEST(CommandLineTest,ValueForms)
{
   ::Configuration c;
   CommandLine CmdL(RepodataArgs, &c);

   {
   char const * argv[] = { "ima-repodata", "-q7", "--MODIFY=no", "-j=3", "." };
   EXPECT_TRUE(CmdL.Parse(5 , argv));
   EXPECT_EQ(7, c.FindI("quiet"));
   EXPECT_FALSE(c.FindB("IMA::Repodata::Modify", true));
   EXPECT_EQ(3, c.FindI("IMA::Repodata::Jobs"));
   EXPECT_EQ(1u, CmdL.FileSize());
   }
   c.Clear();
   {
   // an empty value does not take the next word
   char const * argv[] = { "ima-repodata", "--jobs=", "repo" };
   EXPECT_TRUE(CmdL.Parse(3 , argv));
   EXPECT_TRUE(c.Exists("IMA::Repodata::Jobs"));
   EXPECT_EQ(5, c.FindI("IMA::Repodata::Jobs", 5));
   ASSERT_EQ(1u, CmdL.FileSize());
   EXPECT_STREQ("repo", CmdL.FileList[0]);
   }
   c.Clear();
   {
   // a lone - is a file name
   char const * argv[] = { "ima-repodata", "-", "-m" };
   EXPECT_TRUE(CmdL.Parse(3 , argv));
   ASSERT_EQ(1u, CmdL.FileSize());
   EXPECT_STREQ("-", CmdL.FileList[0]);
   }
}
TEST(CommandLineTest,Errors)
{
   ::Configuration c;
   CommandLine CmdL(RepodataArgs, &c);

   {
   char const * argv[] = { "ima-repodata", "-x" };
   EXPECT_EQ("Command line option 'x' [from -x] is not understood in combination with the other options.", ParseError(CmdL, 2, argv));
   }
   {
   char const * argv[] = { "ima-repodata", "--unknown", "repo" };
   EXPECT_EQ("Command line option --unknown is not understood in combination with the other options", ParseError(CmdL, 3, argv));
   }
   {
   char const * argv[] = { "ima-repodata", "--no-jobs" };
   EXPECT_EQ("Command line option --no-jobs is not boolean", ParseError(CmdL, 2, argv));
   }
   {
   char const * argv[] = { "ima-repodata", "--modify=maybe" };
   EXPECT_EQ("Sense maybe is not understood, try true or false.", ParseError(CmdL, 2, argv));
   }
   {
   char const * argv[] = { "ima-repodata", "--quiet=loud" };
   EXPECT_EQ("Option --quiet=loud requires an integer argument, not 'loud'", ParseError(CmdL, 2, argv));
   }
   {
   char const * argv[] = { "ima-repodata", "--jobs" };
   EXPECT_EQ("Option --jobs requires an argument.", ParseError(CmdL, 2, argv));
   }
   {
   char const * argv[] = { "ima-repodata", "-j", "-m" };
   EXPECT_EQ("Option -j requires an argument.", ParseError(CmdL, 3, argv));
   }
   {
   char const * argv[] = { "ima-repodata", "-o", "Dir::Repodata" };
   EXPECT_EQ("Option -o: Configuration item specification must have an =<val>.", ParseError(CmdL, 3, argv));
   }
   {
   char const * argv[] = { "ima-repodata", "-c", "/does/not/exist.conf" };
   EXPECT_FALSE(CmdL.Parse(3 , argv));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   }
}
