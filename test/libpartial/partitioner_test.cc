#include <config.h>

#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/partitioner.h>
#include <partial-pkg/pkgcatalog.h>
#include <partial-pkg/srccatalog.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

typedef std::vector<std::string> Names;

static Partitioner::Options binaryOnly(std::vector<unsigned long long> const &sizes)
{
   Partitioner::Options opts;
   opts.Sizes = CapacitySequence(sizes);
   opts.SourceSizes = opts.Sizes;
   opts.Source = false;
   return opts;
}

TEST(PartitionerTest, Greedy)
{
   PackageCatalog pkgs;
   pkgs.Insert("A", "a.deb", 40);
   pkgs.Insert("B", "b.deb", 40);
   pkgs.Insert("C", "c.deb", 40);
   SourceCatalog srcs;

   Partitioner part(pkgs, srcs, binaryOnly({100}));
   EXPECT_TRUE(part.Run({"A", "B", "C"}));
   auto const &parts = part.PackagePartitions();
   ASSERT_EQ(2u, parts.size());
   EXPECT_EQ(Names({"A", "B"}), parts[0].Names);
   EXPECT_EQ(80u, parts[0].Size);
   EXPECT_EQ(Names({"C"}), parts[1].Names);
   EXPECT_EQ(40u, parts[1].Size);
   EXPECT_TRUE(part.SourcePartitions().empty());
   EXPECT_TRUE(part.Ignored().empty());

   // packages are never reordered to fill gaps
   EXPECT_TRUE(part.Run({"C", "A"}));
   ASSERT_EQ(1u, parts.size());
   EXPECT_EQ(Names({"C", "A"}), parts[0].Names);

   EXPECT_TRUE(part.Run({}));
   EXPECT_TRUE(parts.empty());
   EXPECT_TRUE(_error->empty());
}
TEST(PartitionerTest, Repeatable)
{
   PackageCatalog pkgs;
   for (auto const &n : {"a", "b", "c", "d", "e", "f"})
      pkgs.Insert(n, std::string(n) + ".deb", 30);
   SourceCatalog srcs;
   Partitioner part(pkgs, srcs, binaryOnly({70}));

   EXPECT_TRUE(part.Run(pkgs.Names()));
   std::vector<Names> first;
   for (auto const &p : part.PackagePartitions())
      first.push_back(p.Names);
   EXPECT_EQ(3u, first.size());

   EXPECT_TRUE(part.Run(pkgs.Names()));
   ASSERT_EQ(first.size(), part.PackagePartitions().size());
   for (size_t i = 0; i < first.size(); ++i)
   {
      EXPECT_EQ(first[i], part.PackagePartitions()[i].Names);
      EXPECT_EQ(i, part.PackagePartitions()[i].Index);
   }
}
TEST(PartitionerTest, CapacityCarriedForward)
{
   PackageCatalog pkgs;
   for (auto const &n : {"A", "B", "C", "D", "E"})
      pkgs.Insert(n, std::string(n) + ".deb", 40);
   SourceCatalog srcs;
   Partitioner part(pkgs, srcs, binaryOnly({50, 100}));
   EXPECT_TRUE(part.Run(pkgs.Names()));
   auto const &parts = part.PackagePartitions();
   ASSERT_EQ(3u, parts.size());
   EXPECT_EQ(Names({"A"}), parts[0].Names);
   EXPECT_EQ(Names({"B", "C"}), parts[1].Names);
   EXPECT_EQ(Names({"D", "E"}), parts[2].Names);
}
TEST(PartitionerTest, Oversized)
{
   PackageCatalog pkgs;
   pkgs.Insert("A", "a.deb", 80);
   pkgs.Insert("B", "b.deb", 30);
   pkgs.Insert("C", "c.deb", 40);
   SourceCatalog srcs;

   Partitioner part(pkgs, srcs, binaryOnly({70}));
   EXPECT_FALSE(part.Run({"A", "B", "C"}));
   std::string text;
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Size '70' is too small to locate package 'A' in partition: size '80'", text);
   EXPECT_TRUE(_error->empty());

   // only the first package of a partition can be oversized
   EXPECT_FALSE(part.Run({"B", "A", "C"}));
   EXPECT_EQ(1u, part.PackagePartitions().size());
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
}
TEST(PartitionerTest, IgnoreOversized)
{
   PackageCatalog pkgs;
   pkgs.Insert("A", "a.deb", 80);
   pkgs.Insert("B", "b.deb", 30);
   pkgs.Insert("C", "c.deb", 40);
   SourceCatalog srcs;

   auto opts = binaryOnly({70});
   opts.IgnoreLarge = true;
   Partitioner part(pkgs, srcs, opts);
   EXPECT_TRUE(part.Run({"A", "B", "C"}));
   auto const &parts = part.PackagePartitions();
   ASSERT_EQ(1u, parts.size());
   EXPECT_EQ(Names({"B", "C"}), parts[0].Names);
   EXPECT_EQ(70u, parts[0].Size);
   EXPECT_EQ(Names({"A"}), part.Ignored());

   EXPECT_FALSE(_error->PendingError());
   std::string text;
   EXPECT_FALSE(_error->PopMessage(text));
   EXPECT_EQ("Ignoring package 'A': Size '70' is too small to locate package 'A' in partition: size '80'", text);
   EXPECT_TRUE(_error->empty());
}
TEST(PartitionerTest, Limit)
{
   PackageCatalog pkgs;
   for (auto const &n : {"A", "B", "C", "D", "E"})
      pkgs.Insert(n, std::string(n) + ".deb", 60);
   SourceCatalog srcs;

   auto opts = binaryOnly({100});
   opts.Limit = 2;
   Partitioner part(pkgs, srcs, opts);
   EXPECT_TRUE(part.Run(pkgs.Names()));
   auto const &parts = part.PackagePartitions();
   ASSERT_EQ(2u, parts.size());
   EXPECT_EQ(Names({"A"}), parts[0].Names);
   EXPECT_EQ(Names({"B"}), parts[1].Names);
   EXPECT_TRUE(_error->empty());
}
TEST(PartitionerTest, MergedSources)
{
   PackageCatalog pkgs;
   pkgs.Insert("A", "a.deb", 40);
   pkgs.Insert("B", "b.deb", 40);
   SourceCatalog srcs;
   srcs.AddFile("S", "pool", "s.dsc", 30);
   srcs.AddBinary("A", "S");
   srcs.AddBinary("B", "S");

   Partitioner::Options opts;
   opts.Sizes = CapacitySequence({100});
   opts.SourceSizes = opts.Sizes;
   opts.MergeSource = true;

   Partitioner part(pkgs, srcs, opts);
   EXPECT_TRUE(part.Run({"A", "B"}));
   auto const &parts = part.PackagePartitions();
   ASSERT_EQ(2u, parts.size());
   EXPECT_EQ(Names({"A"}), parts[0].Names);
   EXPECT_EQ(70u, parts[0].Size);
   EXPECT_EQ(30u, parts[0].SourceSize);
   // the source is charged only once
   EXPECT_EQ(Names({"B"}), parts[1].Names);
   EXPECT_EQ(40u, parts[1].Size);
   EXPECT_EQ(0u, parts[1].SourceSize);
   EXPECT_TRUE(part.SourcePartitions().empty());

   opts.Sizes = CapacitySequence({200});
   Partitioner big(pkgs, srcs, opts);
   EXPECT_TRUE(big.Run({"A", "B"}));
   ASSERT_EQ(1u, big.PackagePartitions().size());
   EXPECT_EQ(110u, big.PackagePartitions()[0].Size);
   EXPECT_TRUE(_error->empty());
}
TEST(PartitionerTest, MergedSourceTooLarge)
{
   PackageCatalog pkgs;
   pkgs.Insert("A", "a.deb", 40);
   SourceCatalog srcs;
   srcs.AddFile("S", "pool", "s.tar.xz", 80);
   srcs.AddBinary("A", "S");

   Partitioner::Options opts;
   opts.Sizes = CapacitySequence({100});
   opts.SourceSizes = opts.Sizes;
   opts.MergeSource = true;
   Partitioner part(pkgs, srcs, opts);
   EXPECT_FALSE(part.Run({"A"}));
   std::string text;
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Size '100' is too small to locate package/source 'A' in partition: size '40'/'80'", text);
   _error->Discard();
}
TEST(PartitionerTest, SeparateSources)
{
   PackageCatalog pkgs;
   pkgs.Insert("A", "a.deb", 40);
   pkgs.Insert("B", "b.deb", 40);
   pkgs.Insert("C", "c.deb", 10);
   pkgs.Insert("D", "d.deb", 10);
   SourceCatalog srcs;
   srcs.AddFile("S1", "pool", "s1.dsc", 30);
   srcs.AddFile("S2", "pool", "s2.dsc", 30);
   srcs.AddBinary("A", "S1");
   srcs.AddBinary("B", "S2");
   srcs.AddBinary("C", "S1");

   Partitioner::Options opts;
   opts.Sizes = CapacitySequence({100});
   opts.SourceSizes = CapacitySequence({50});
   Partitioner part(pkgs, srcs, opts);
   EXPECT_TRUE(part.Run(pkgs.Names()));

   auto const &parts = part.PackagePartitions();
   ASSERT_EQ(1u, parts.size());
   EXPECT_EQ(Names({"A", "B", "C", "D"}), parts[0].Names);
   EXPECT_EQ(100u, parts[0].Size);
   EXPECT_EQ(0u, parts[0].SourceSize);

   auto const &sparts = part.SourcePartitions();
   ASSERT_EQ(2u, sparts.size());
   EXPECT_EQ(Names({"S1"}), sparts[0].Names);
   EXPECT_EQ(Names({"S2"}), sparts[1].Names);

   // D has no known source
   std::string text;
   EXPECT_FALSE(_error->PopMessage(text));
   EXPECT_EQ("Source of D not found", text);
   EXPECT_TRUE(_error->empty());
}
TEST(PartitionerTest, SeparateSourcesLimit)
{
   PackageCatalog pkgs;
   SourceCatalog srcs;
   for (auto const &n : {"A", "B", "C", "D"})
   {
      pkgs.Insert(n, std::string(n) + ".deb", 60);
      srcs.AddFile(std::string("S") + n, "pool", std::string(n) + ".dsc", 30);
      srcs.AddBinary(n, std::string("S") + n);
   }

   Partitioner::Options opts;
   opts.Sizes = CapacitySequence({100});
   opts.SourceSizes = CapacitySequence({60});
   opts.Limit = 4;
   Partitioner part(pkgs, srcs, opts);
   EXPECT_TRUE(part.Run(pkgs.Names()));
   // package and source partitions share the limit
   EXPECT_EQ(2u, part.PackagePartitions().size());
   ASSERT_EQ(1u, part.SourcePartitions().size());
   EXPECT_EQ(Names({"SA", "SB"}), part.SourcePartitions()[0].Names);
   EXPECT_TRUE(_error->empty());
}
TEST(PartitionerTest, OptionsFromConfig)
{
   {
      Configuration cnf;
      Partitioner::Options opts;
      EXPECT_TRUE(opts.FromConfig(cnf));
      EXPECT_EQ(634245120u, opts.Sizes.At(0));
      EXPECT_EQ(634245120u, opts.SourceSizes.At(0));
      EXPECT_EQ(0u, opts.Limit);
      EXPECT_TRUE(opts.Source);
      EXPECT_FALSE(opts.MergeSource);
      EXPECT_FALSE(opts.IgnoreLarge);
   }
   {
      Configuration cnf;
      cnf.Set("Partial::Size", "FD, 1000");
      cnf.Set("Partial::SrcSize", "500");
      cnf.Set("Partial::Limit", 5);
      cnf.Set("Partial::Ignore-Large", "true");
      Partitioner::Options opts;
      EXPECT_TRUE(opts.FromConfig(cnf));
      EXPECT_EQ(1339200u, opts.Sizes.At(0));
      EXPECT_EQ(1000u, opts.Sizes.At(3));
      EXPECT_EQ(500u, opts.SourceSizes.At(0));
      EXPECT_EQ(5u, opts.Limit);
      EXPECT_TRUE(opts.IgnoreLarge);
   }
   {
      Configuration cnf;
      cnf.Set("Partial::Limit", 1);
      Partitioner::Options opts;
      EXPECT_FALSE(opts.FromConfig(cnf));
      std::string text;
      EXPECT_TRUE(_error->PopMessage(text));
      EXPECT_EQ("limit must be larger than 1 in no merge-mode", text);

      cnf.Set("Partial::Merge-Source", "true");
      EXPECT_TRUE(opts.FromConfig(cnf));
      cnf.Set("Partial::Merge-Source", "false");
      cnf.Set("Partial::Source", "false");
      EXPECT_TRUE(opts.FromConfig(cnf));
      cnf.Set("Partial::Merge-Source", "true");
      EXPECT_FALSE(opts.FromConfig(cnf));
      EXPECT_TRUE(_error->PendingError());
      _error->Discard();
   }
   {
      Configuration cnf;
      cnf.Set("Partial::Limit", -3);
      Partitioner::Options opts;
      EXPECT_FALSE(opts.FromConfig(cnf));
      cnf.Set("Partial::Limit", 0);
      cnf.Set("Partial::Size", "BluRay");
      EXPECT_FALSE(opts.FromConfig(cnf));
      EXPECT_TRUE(_error->PendingError());
      _error->Discard();
   }
}
