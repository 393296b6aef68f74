#include <config.h>

#include <partial-pkg/cmndline.h>
#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-private/private-cmndline.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

static CommandLine::Args SampleArgs[] = {
   { 'm', "merge-source", "Partial::Merge-Source", 0 },
   { 'I', "ignore-large", "Partial::Ignore-Large", 0 },
   { 'S', "size", "Partial::Size", CommandLine::HasArg },
   { 0, "nosource", "Partial::Source", CommandLine::InvBoolean },
   { 'q', "quiet", "quiet", CommandLine::IntLevel },
   { 'o', "option", 0, CommandLine::ArbItem },
   {0,0,0,0}
};
TEST(CommandLineTest,Booleans)
{
   ::Configuration c;
   CommandLine CmdL(SampleArgs, &c);

   char const * argv[] = { "debpartial", "--merge-source", "-I" };
   ASSERT_TRUE(CmdL.Parse(3, argv));
   EXPECT_TRUE(c.FindB("Partial::Merge-Source", false));
   EXPECT_TRUE(c.FindB("Partial::Ignore-Large", false));

   char const * argv2[] = { "debpartial", "--no-merge-source", "-I=no", "--nosource" };
   ASSERT_TRUE(CmdL.Parse(4, argv2));
   EXPECT_FALSE(c.FindB("Partial::Merge-Source", true));
   EXPECT_FALSE(c.FindB("Partial::Ignore-Large", true));
   EXPECT_FALSE(c.FindB("Partial::Source", true));
   EXPECT_EQ(0u, CmdL.FileSize());

   // bundled letters
   c.Clear("Partial");
   char const * argv3[] = { "debpartial", "-mI", "/srv/debian" };
   ASSERT_TRUE(CmdL.Parse(3, argv3));
   EXPECT_TRUE(c.FindB("Partial::Merge-Source", false));
   EXPECT_TRUE(c.FindB("Partial::Ignore-Large", false));
   ASSERT_EQ(1u, CmdL.FileSize());
   EXPECT_EQ(std::string("/srv/debian"), CmdL.FileList[0]);

   // only a real boolean is taken from the next word
   char const * argv4[] = { "debpartial", "-m", "0ad" };
   ASSERT_TRUE(CmdL.Parse(3, argv4));
   EXPECT_TRUE(c.FindB("Partial::Merge-Source", false));
   ASSERT_EQ(1u, CmdL.FileSize());
   EXPECT_EQ(std::string("0ad"), CmdL.FileList[0]);

   char const * argv5[] = { "debpartial", "-m", "false", "ad" };
   ASSERT_TRUE(CmdL.Parse(4, argv5));
   EXPECT_FALSE(c.FindB("Partial::Merge-Source", true));
   ASSERT_EQ(1u, CmdL.FileSize());
   EXPECT_EQ(std::string("ad"), CmdL.FileList[0]);

   char const * argv6[] = { "debpartial", "--merge-source=perhaps" };
   EXPECT_FALSE(CmdL.Parse(2, argv6));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
}
TEST(CommandLineTest,Arguments)
{
   ::Configuration c;
   CommandLine CmdL(SampleArgs, &c);
   {
   char const * argv[] = { "debpartial", "-S", "CD74" };
   ASSERT_TRUE(CmdL.Parse(3, argv));
   EXPECT_EQ("CD74", c.Find("Partial::Size"));
   EXPECT_EQ(0u, CmdL.FileSize());
   }
   {
   char const * argv[] = { "debpartial", "-S=DVD" };
   ASSERT_TRUE(CmdL.Parse(2, argv));
   EXPECT_EQ("DVD", c.Find("Partial::Size"));
   }
   {
   char const * argv[] = { "debpartial", "--size", "650000000" };
   ASSERT_TRUE(CmdL.Parse(3, argv));
   EXPECT_EQ("650000000", c.Find("Partial::Size"));
   }
   {
   char const * argv[] = { "debpartial", "--size=CD80", "/srv/debian" };
   ASSERT_TRUE(CmdL.Parse(3, argv));
   EXPECT_EQ("CD80", c.Find("Partial::Size"));
   EXPECT_EQ(1u, CmdL.FileSize());
   }
   {
   // an empty value after = doesn't take the next word
   char const * argv[] = { "debpartial", "-S=", "DVD" };
   ASSERT_TRUE(CmdL.Parse(3, argv));
   EXPECT_TRUE(c.Exists("Partial::Size"));
   EXPECT_EQ("none", c.Find("Partial::Size", "none"));
   EXPECT_EQ(1u, CmdL.FileSize());
   }
   {
   char const * argv[] = { "debpartial", "-S", "--merge-source" };
   EXPECT_FALSE(CmdL.Parse(3, argv));
   _error->Discard();
   }
   {
   char const * argv[] = { "debpartial", "-o", "Partial::Limit=4" };
   ASSERT_TRUE(CmdL.Parse(3, argv));
   EXPECT_EQ(4, c.FindI("Partial::Limit"));
   }
   {
   char const * argv[] = { "debpartial", "-o", "Partial::Limit" };
   EXPECT_FALSE(CmdL.Parse(3, argv));
   _error->Discard();
   }
   {
   // everything after -- is a file name
   char const * argv[] = { "debpartial", "--", "-S", "/srv/debian" };
   ASSERT_TRUE(CmdL.Parse(4, argv));
   ASSERT_EQ(2u, CmdL.FileSize());
   EXPECT_EQ(std::string("-S"), CmdL.FileList[0]);
   }
}
TEST(CommandLineTest,IntLevel)
{
   ::Configuration c;
   CommandLine CmdL(SampleArgs, &c);
   char const * argv[] = { "debpartial", "-qq" };
   ASSERT_TRUE(CmdL.Parse(2, argv));
   EXPECT_EQ(2, c.FindI("quiet"));

   char const * argv2[] = { "debpartial", "-q=0", "-q" };
   ASSERT_TRUE(CmdL.Parse(3, argv2));
   EXPECT_EQ(1, c.FindI("quiet"));

   char const * argv3[] = { "debpartial", "--quiet", "5", "/srv/debian" };
   ASSERT_TRUE(CmdL.Parse(4, argv3));
   EXPECT_EQ(5, c.FindI("quiet"));
   EXPECT_EQ(1u, CmdL.FileSize());

   char const * argv4[] = { "debpartial", "--quiet=loud" };
   EXPECT_FALSE(CmdL.Parse(2, argv4));
   _error->Discard();
}
TEST(CommandLineTest, Unknown)
{
   ::Configuration c;
   CommandLine CmdL(SampleArgs, &c);
   char const * argv[] = { "debpartial", "--frobnicate", "a" };
   EXPECT_FALSE(CmdL.Parse(sizeof(argv)/sizeof(char*), argv));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   char const * argv2[] = { "debpartial", "-x" };
   EXPECT_FALSE(CmdL.Parse(2, argv2));
   _error->Discard();

   // a prefix only works on booleans
   char const * argv3[] = { "debpartial", "--no-size" };
   EXPECT_FALSE(CmdL.Parse(2, argv3));
   _error->Discard();
}
TEST(CommandLineTest, DebPartialOptions)
{
   std::vector<CommandLine::Args> Args = getCommandArgs(PARTIAL_CMD::DEBPARTIAL);
   ::Configuration c;
   CommandLine CmdL(Args.data(), &c);
   char const * argv[] = { "debpartial", "-d", "stable,testing", "--size=DVD", "-i", "bash",
      "--include", "dash,zsh", "--nosource", "-l", "3", "-mI", "/srv/debian", "/srv/partial" };
   ASSERT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(argv[0]), argv));

   auto const dists = c.FindVector("Partial::Dist");
   ASSERT_EQ(2u, dists.size());
   EXPECT_EQ("stable", dists[0]);
   EXPECT_EQ("testing", dists[1]);
   EXPECT_EQ("DVD", c.Find("Partial::Size"));
   auto const include = c.FindVector("Partial::Include");
   ASSERT_EQ(2u, include.size());
   EXPECT_EQ("bash", include[0]);
   EXPECT_EQ("dash,zsh", include[1]);
   EXPECT_FALSE(c.FindB("Partial::Source", true));
   EXPECT_EQ(3, c.FindI("Partial::Limit"));
   EXPECT_TRUE(c.FindB("Partial::Merge-Source"));
   EXPECT_TRUE(c.FindB("Partial::Ignore-Large"));

   ASSERT_EQ(2u, CmdL.FileSize());
   EXPECT_EQ(std::string(CmdL.FileList[0]), "/srv/debian");
   EXPECT_EQ(std::string(CmdL.FileList[1]), "/srv/partial");
}
TEST(CommandLineTest, DebCopyOptions)
{
   std::vector<CommandLine::Args> Args = getCommandArgs(PARTIAL_CMD::DEBCOPY);
   ::Configuration c;
   CommandLine CmdL(Args.data(), &c);
   char const * argv[] = { "debcopy", "-l", "/srv/debian", "/srv/partial/Debian0" };
   ASSERT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(argv[0]), argv));
   EXPECT_TRUE(c.FindB("Partial::Copy::Symlink"));
   ASSERT_EQ(2u, CmdL.FileSize());

   // debpartial options are unknown to debcopy
   char const * argv2[] = { "debcopy", "--merge-source", "/srv/debian", "/srv/partial" };
   EXPECT_FALSE(CmdL.Parse(sizeof(argv2)/sizeof(argv2[0]), argv2));
   _error->Discard();
}
