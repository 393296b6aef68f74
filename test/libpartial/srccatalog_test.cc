#include <config.h>

#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/indexstanzas.h>
#include <partial-pkg/srccatalog.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "file-helpers.h"

TEST(SourceCatalogTest, AddFile)
{
   SourceCatalog cat;
   EXPECT_TRUE(cat.AddFile("foo", "pool/main/f/foo", "foo_1.dsc", 10));
   EXPECT_TRUE(cat.AddFile("foo", "pool/main/f/foo", "foo_1.tar.xz", 1000));
   EXPECT_FALSE(cat.AddFile("foo", "pool/main/f/foo", "foo_1.dsc", 10));
   // same name, other directory
   EXPECT_TRUE(cat.AddFile("foo", "pool/contrib/f/foo", "foo_1.dsc", 10));
   EXPECT_EQ(1020u, cat.Size("foo"));
   EXPECT_EQ(0u, cat.Size("bar"));
   EXPECT_TRUE(cat.Contains("foo"));
   EXPECT_FALSE(cat.Contains("bar"));

   cat.AddBinary("libfoo1", "foo");
   cat.AddBinary("foo-utils", "foo");
   cat.AddBinary("foo-utils", "foo-tools");
   std::string src;
   EXPECT_TRUE(cat.SourceOf("libfoo1", src));
   EXPECT_EQ("foo", src);
   EXPECT_TRUE(cat.SourceOf("foo-utils", src));
   EXPECT_EQ("foo-tools", src);
   src = "untouched";
   EXPECT_FALSE(cat.SourceOf("bar", src));
   EXPECT_EQ("untouched", src);
}
TEST(SourceCatalogTest, Parse)
{
   FileFd fd;
   openTemporaryFile("sources", fd,
	 "Package: foo\n"
	 "Binary: libfoo1, foo-utils,foo-doc\n"
	 "Directory: pool/main/f/foo\n"
	 "Files:\n"
	 " 0123456789abcdef 100 foo_1.dsc\n"
	 " 0123456789abcdef 2000 foo_1.tar.gz\n"
	 " broken line\n"
	 "Checksums-Sha256:\n"
	 " 0123456789abcdef 99999 foo_1.dsc\n"
	 "\n"
	 "Package: bar\n"
	 "Binary: bar\n"
	 "Directory: pool/main/b/bar\n"
	 "Checksums-Sha256:\n"
	 " 0123456789abcdef 300 bar_2.dsc\n"
	 " 0123456789abcdef 30 bar_2.diff.gz\n");

   SourceCatalog cat;
   SourceIndex index;
   ASSERT_TRUE(fd.IsOpen());
   EXPECT_TRUE(cat.Parse(fd, &index));
   EXPECT_EQ(std::vector<std::string>({"foo", "bar"}), cat.Names());
   EXPECT_EQ(2100u, cat.Size("foo"));
   EXPECT_EQ(330u, cat.Size("bar"));
   EXPECT_EQ(2430u, cat.TotalSize({"foo", "bar", "baz"}));

   std::string src;
   EXPECT_TRUE(cat.SourceOf("foo-doc", src));
   EXPECT_EQ("foo", src);
   EXPECT_EQ(2u, index.size());
   EXPECT_EQ(std::vector<std::string>({"bar", "foo"}), index.SourcesOf({"bar", "unknown", "libfoo1", "foo-utils"}));
}
TEST(SourceCatalogTest, SourcesOf)
{
   SourceCatalog cat;
   cat.AddFile("foo", "pool", "foo.dsc", 1);
   cat.AddBinary("foo-a", "foo");
   cat.AddBinary("foo-b", "foo");

   std::vector<std::string> missing;
   auto const record = [&](std::string const &bin) { missing.push_back(bin); };
   EXPECT_EQ(std::vector<std::string>({"foo"}), cat.SourcesOf({"foo-a", "lost", "foo-b"}, record));
   EXPECT_EQ(std::vector<std::string>({"lost"}), missing);
   // reported only once
   EXPECT_EQ(std::vector<std::string>(), cat.SourcesOf({"lost"}, record));
   EXPECT_EQ(1u, missing.size());

   EXPECT_EQ(std::vector<std::string>({"foo"}), cat.SourcesOf({"other", "foo-b"}));
   std::string text;
   EXPECT_FALSE(_error->PopMessage(text));
   EXPECT_EQ("Source of other not found", text);
   EXPECT_TRUE(_error->empty());
}
