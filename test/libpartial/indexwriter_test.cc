#include <config.h>

#include <partial-pkg/archive.h>
#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/indexwriter.h>
#include <partial-pkg/partialconfiguration.h>
#include <partial-pkg/partition.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "file-helpers.h"

static char const * const PackagesA =
   "Package: A\n"
   "Filename: pool/main/s/sa/a_1_i386.deb\n"
   "Size: 40\n";
static char const * const PackagesB =
   "Package: B\n"
   "Filename: pool/main/s/sa/b_1_i386.deb\n"
   "Size: 40\n";
static char const * const PackagesC =
   "Package: C\n"
   "Filename: pool/main/s/sc/c_1_i386.deb\n"
   "Size: 40\n";
static char const * const SourcesSA =
   "Package: sa\n"
   "Binary: A, B\n"
   "Directory: pool/main/s/sa\n"
   "Files:\n"
   " 00000000000000000000000000000000 10 sa_1.dsc\n";
static char const * const SourcesSC =
   "Package: sc\n"
   "Binary: C\n"
   "Directory: pool/main/s/sc\n"
   "Files:\n"
   " 00000000000000000000000000000000 20 sc_1.dsc\n";

class RecordingWriter : public IndexWriter
{
   public:
   std::vector<std::string> Log;

   protected:
   void Start(std::string const &File, std::string const &Name, std::string const &Target) override
   {
      Log.push_back(Name + " " + File + " " + Target);
   }
   void Done(unsigned long const Count) override
   {
      Log.back().append(" ").append(std::to_string(Count));
   }

   public:
   using IndexWriter::IndexWriter;
};

static void createArchive(std::string const &dir)
{
   writeFile(dir, "dists/unstable/main/binary-i386/Packages",
	 std::string(PackagesA) + "\n" + PackagesB + "\n" + PackagesC);
   writeFile(dir, "dists/unstable/main/source/Sources.gz",
	 std::string(SourcesSA) + "\n" + SourcesSC);
}

static Partition makePartition(size_t const index, std::vector<std::string> const &names)
{
   Partition p(index);
   p.Names = names;
   return p;
}

static ArchiveLayout makeLayout()
{
   ArchiveLayout layout;
   layout.Dists = {"unstable"};
   layout.Sections = {"main"};
   layout.Archs = {"i386"};
   return layout;
}

TEST(IndexWriterTest, LoadIndices)
{
   std::string tempdir;
   createTemporaryDirectory("archive", tempdir);
   createArchive(tempdir);

   ArchiveIndices indices;
   EXPECT_TRUE(indices.LoadPackages(tempdir, "unstable", "main", "i386"));
   EXPECT_TRUE(indices.LoadSources(tempdir, "unstable", "main"));
   EXPECT_EQ(3u, indices.Packages.size());
   EXPECT_EQ(120u, indices.Packages.TotalSize(indices.Packages.Names()));
   EXPECT_EQ(10u, indices.Sources.Size("sa"));
   EXPECT_EQ(20u, indices.Sources.Size("sc"));
   ASSERT_NE(nullptr, indices.FindPackages("unstable", "main", "i386"));
   EXPECT_EQ(3u, indices.FindPackages("unstable", "main", "i386")->size());
   ASSERT_NE(nullptr, indices.FindSources("unstable", "main"));
   EXPECT_EQ(nullptr, indices.FindPackages("unstable", "main", "amd64"));
   EXPECT_EQ(nullptr, indices.FindSources("unstable", "contrib"));

   EXPECT_FALSE(indices.LoadPackages(tempdir, "unstable", "contrib", "i386"));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   removeDirectory(tempdir);
}
TEST(IndexWriterTest, Layout)
{
   EXPECT_EQ("dists/sid/main/binary-amd64/Packages", ArchiveLayout::PackagesIndex("sid", "main", "amd64"));
   EXPECT_EQ("dists/sid/contrib/source/Sources", ArchiveLayout::SourcesIndex("sid", "contrib"));

   ArchiveLayout layout;
   EXPECT_EQ("Debian", layout.DirPrefix);
   EXPECT_EQ("Debian-Src", layout.DirSrcPrefix);
   EXPECT_EQ("0", layout.TopDir(0));
   layout.DirMap = {"one", "", "three"};
   EXPECT_EQ("one", layout.TopDir(0));
   EXPECT_EQ("1", layout.TopDir(1));
   EXPECT_EQ("three", layout.TopDir(2));
   EXPECT_EQ("3", layout.TopDir(3));

   Configuration cnf;
   EXPECT_TRUE(layout.FromConfig(cnf));
   EXPECT_EQ(std::vector<std::string>({"unstable"}), layout.Dists);
   EXPECT_EQ(std::vector<std::string>({"main", "contrib", "non-free"}), layout.Sections);
   EXPECT_EQ(std::vector<std::string>({"i386"}), layout.Archs);
   EXPECT_TRUE(layout.DirMap.empty());

   cnf.Set("Partial::DirPrefix", "CD");
   cnf.Set("Partial::DirSrcPrefix", "SRC");
   cnf.Set("Partial::Arch", "amd64,arm64");
   EXPECT_TRUE(layout.FromConfig(cnf));
   EXPECT_EQ("CD", layout.DirPrefix);
   EXPECT_EQ("SRC", layout.DirSrcPrefix);
   EXPECT_EQ(std::vector<std::string>({"amd64", "arm64"}), layout.Archs);
   cnf.Set("Partial::Merge-Source", "true");
   EXPECT_TRUE(layout.FromConfig(cnf));
   EXPECT_EQ("CD", layout.DirSrcPrefix);
}
TEST(IndexWriterTest, MergedSources)
{
   std::string tempdir;
   createTemporaryDirectory("archive", tempdir);
   createArchive(tempdir);
   std::string const dest = tempdir + "/partial";

   ArchiveIndices indices;
   ASSERT_TRUE(indices.LoadPackages(tempdir, "unstable", "main", "i386"));
   ASSERT_TRUE(indices.LoadSources(tempdir, "unstable", "main"));

   Partial::Configuration::Compressor gzip;
   ASSERT_TRUE(Partial::Configuration::findCompressor("gzip", gzip));
   ArchiveLayout const layout = makeLayout();
   RecordingWriter writer(layout, indices, dest, gzip);
   std::vector<Partition> const parts = {makePartition(0, {"A"}), makePartition(1, {"B", "C"})};
   EXPECT_TRUE(writer.Write(parts, {}, true));

   EXPECT_EQ(std::string(PackagesA) + "\n",
	 readFile(dest + "/Debian0/dists/unstable/main/binary-i386/Packages.gz"));
   EXPECT_EQ(std::string(PackagesB) + "\n" + PackagesC + "\n",
	 readFile(dest + "/Debian1/dists/unstable/main/binary-i386/Packages.gz"));
   EXPECT_EQ(std::string(SourcesSA) + "\n",
	 readFile(dest + "/Debian0/dists/unstable/main/source/Sources.gz"));
   // sa is in the first partition already
   EXPECT_EQ(std::string(SourcesSC) + "\n",
	 readFile(dest + "/Debian1/dists/unstable/main/source/Sources.gz"));
   EXPECT_FALSE(FileExists(dest + "/Debian-Src0"));

   EXPECT_EQ(std::vector<std::string>({
	    "Debian0 Packages.gz (unstable,main,i386) 1",
	    "Debian0 Sources.gz (unstable,main) 1",
	    "Debian1 Packages.gz (unstable,main,i386) 2",
	    "Debian1 Sources.gz (unstable,main) 1",
	 }), writer.Log);
   EXPECT_TRUE(_error->empty());

   removeDirectory(tempdir);
}
TEST(IndexWriterTest, SeparateSources)
{
   std::string tempdir;
   createTemporaryDirectory("archive", tempdir);
   createArchive(tempdir);
   std::string const dest = tempdir + "/partial";

   ArchiveIndices indices;
   ASSERT_TRUE(indices.LoadPackages(tempdir, "unstable", "main", "i386"));
   ASSERT_TRUE(indices.LoadSources(tempdir, "unstable", "main"));

   Partial::Configuration::Compressor plain;
   ASSERT_TRUE(Partial::Configuration::findCompressor("none", plain));
   ArchiveLayout layout = makeLayout();
   layout.DirMap = {"first"};
   std::vector<Partition> const parts = {makePartition(0, {"A", "B"}), makePartition(1, {"C"})};
   std::vector<Partition> const srcs = {makePartition(0, {"sc"}), makePartition(1, {"sa"})};
   {
      RecordingWriter writer(layout, indices, dest, plain);
      EXPECT_TRUE(writer.Write(parts, srcs, false));
      EXPECT_EQ(4u, writer.Log.size());
   }

   EXPECT_EQ(std::string(PackagesA) + "\n" + PackagesB + "\n",
	 readFile(dest + "/Debianfirst/dists/unstable/main/binary-i386/Packages"));
   EXPECT_EQ(std::string(PackagesC) + "\n",
	 readFile(dest + "/Debian1/dists/unstable/main/binary-i386/Packages"));
   EXPECT_FALSE(FileExists(dest + "/Debianfirst/dists/unstable/main/source"));
   EXPECT_EQ(std::string(SourcesSC) + "\n",
	 readFile(dest + "/Debian-Srcfirst/dists/unstable/main/source/Sources"));
   EXPECT_EQ(std::string(SourcesSA) + "\n",
	 readFile(dest + "/Debian-Src1/dists/unstable/main/source/Sources"));

   // with a shared prefix the sources are numbered after the packages
   std::string const shared = tempdir + "/shared";
   layout.DirMap.clear();
   layout.DirSrcPrefix = layout.DirPrefix;
   RecordingWriter writer(layout, indices, shared, plain);
   EXPECT_TRUE(writer.Write(parts, srcs, false));
   EXPECT_TRUE(FileExists(shared + "/Debian1/dists/unstable/main/binary-i386/Packages"));
   EXPECT_EQ(std::string(SourcesSC) + "\n",
	 readFile(shared + "/Debian2/dists/unstable/main/source/Sources"));
   EXPECT_EQ(std::string(SourcesSA) + "\n",
	 readFile(shared + "/Debian3/dists/unstable/main/source/Sources"));
   EXPECT_TRUE(_error->empty());

   removeDirectory(tempdir);
}
