// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/partitioner.h>
#include <partial-pkg/pkgcatalog.h>
#include <partial-pkg/srccatalog.h>
#include <partial-pkg/strutl.h>

#include <string>
#include <utility>
#include <vector>
									/*}}}*/

using std::string;

// Partitioner::Options::FromConfig - Read the partitioning options	/*{{{*/
// ---------------------------------------------------------------------
/* Without sources of their own every partition but the last needs at
   least one source partition next to it, so a limit of one partition
   makes no sense there. */
bool Partitioner::Options::FromConfig(Configuration const &Cnf)
{
   if (Sizes.Parse(Cnf.FindVector("Partial::Size", "CD74")) == false)
      return false;
   if (Cnf.Exists("Partial::SrcSize") == true)
   {
      if (SourceSizes.Parse(Cnf.FindVector("Partial::SrcSize")) == false)
	 return false;
   }
   else
      SourceSizes = Sizes;

   int const limit = Cnf.FindI("Partial::Limit", 0);
   if (limit < 0)
      return _error->Error("The partition limit can't be negative: %d", limit);
   Limit = limit;
   Source = Cnf.FindB("Partial::Source", true);
   MergeSource = Cnf.FindB("Partial::Merge-Source", false);
   IgnoreLarge = Cnf.FindB("Partial::Ignore-Large", false);

   if (MergeSource == true && Source == false)
      return _error->Error("Sources can't be merged if they are not handled at all");
   if (Source == true && MergeSource == false && Limit == 1)
      return _error->Error("limit must be larger than 1 in no merge-mode");
   return true;
}
									/*}}}*/
Partitioner::Partitioner(PackageCatalog const &packages, SourceCatalog &sources, Options const &opts)
   : Packages(packages), Sources(sources), Opts(opts), PkgParts(Opts.Sizes),
     SrcParts(Opts.SourceSizes, sources)
{
}
std::vector<Partition> const &Partitioner::SourcePartitions() const
{
   static std::vector<Partition> const None;
   if (SeparateSources() == false)
      return None;
   return SrcParts.Partitions();
}
// Partitioner::Fill - Put as many packages as fit into Part		/*{{{*/
// ---------------------------------------------------------------------
/* Left is advanced past the last package placed. If the package at Left
   doesn't fit into the still empty Part, Oversized describes why. */
bool Partitioner::Fill(std::vector<string> const &Pkgs, size_t &Left,
      Partition &Part, string &Oversized)
{
   size_t const Start = Left;
   unsigned long long const Capacity = PkgParts.CapacityOf(Part.Index);
   for (; Left < Pkgs.size(); ++Left)
   {
      string const &Name = Pkgs[Left];
      unsigned long long const PkgSize = Packages.Size(Name);
      if (Part.Size + PkgSize > Capacity)
      {
	 if (Left == Start)
	    strprintf(Oversized, "Size '%llu' is too small to locate package '%s' in partition: size '%llu'",
		  Capacity, Name.c_str(), PkgSize);
	 break;
      }

      unsigned long long SrcSize = 0;
      string Src;
      if (Opts.Source == true)
      {
	 auto const Srcs = Sources.SourcesOf({Name});
	 if (Srcs.empty() == false)
	 {
	    Src = Srcs.front();
	    if (Opts.MergeSource == true)
	    {
	       if (Charged.find(Src) == Charged.end())
		  SrcSize = Sources.Size(Src);
	    }
	    else
	    {
	       string Message;
	       auto const Res = SrcParts.Add(Src, Message);
	       if (Res == SourcePartitionSequence::AddResult::Full)
		  break;
	       if (Res == SourcePartitionSequence::AddResult::Oversized)
	       {
		  if (Left == Start)
		     Oversized = Message;
		  break;
	       }
	    }
	 }
	 if (Part.Size + PkgSize + SrcSize > Capacity)
	 {
	    if (Left == Start)
	       strprintf(Oversized, "Size '%llu' is too small to locate package/source '%s' in partition: size '%llu'/'%llu'",
		     Capacity, Name.c_str(), PkgSize, SrcSize);
	    break;
	 }
	 if (Opts.MergeSource == true && Src.empty() == false)
	    Charged.insert(Src);
      }

      Part.Names.push_back(Name);
      Part.Size += PkgSize + SrcSize;
      Part.SourceSize += SrcSize;
   }
   return Oversized.empty();
}
									/*}}}*/
// Partitioner::Run - Partition the package list			/*{{{*/
// ---------------------------------------------------------------------
/* With a limit the package and source partitions share it: the source
   sequence may only grow as long as there is room left next to the
   package partitions produced so far. */
bool Partitioner::Run(std::vector<string> const &Pkgs)
{
   PkgParts.Reset();
   SrcParts.Reset();
   Charged.clear();
   Skipped.clear();
   if (Opts.Limit != 0 && SeparateSources() == true)
      SrcParts.SetLimit(static_cast<long>(Opts.Limit) - 1);
   else
      SrcParts.SetLimit(-1);

   size_t Done = 0;
   while (Done < Pkgs.size())
   {
      Partition Part(PkgParts.size());
      string Oversized;
      if (Fill(Pkgs, Done, Part, Oversized) == false)
      {
	 if (Opts.IgnoreLarge == false)
	    return _error->Error("%s", Oversized.c_str());
	 _error->Warning("Ignoring package '%s': %s", Pkgs[Done].c_str(), Oversized.c_str());
	 Skipped.push_back(Pkgs[Done]);
	 ++Done;
	 continue;
      }
      // the source partitions are exhausted
      if (Part.Names.empty() == true)
	 break;
      PkgParts.Append(std::move(Part));

      if (Opts.Limit != 0)
      {
	 size_t Used = PkgParts.size();
	 if (SeparateSources() == true)
	 {
	    SrcParts.SetLimit(SrcParts.GetLimit() - 1);
	    Used += SrcParts.size();
	 }
	 if (Used >= Opts.Limit)
	    break;
      }
   }
   return true;
}
									/*}}}*/
