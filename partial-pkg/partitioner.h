// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Partitioner - Cut an ordered package list into media sized pieces

   The packages are taken in the given order and appended to the current
   partition until the next one doesn't fit anymore, then a new partition
   is started. Packages are never reordered and closed partitions are
   never looked at again.

   Sources are either charged to the partition of the first binary
   built from them (merge mode) or placed into a sequence of source
   partitions of their own. In the latter case a binary is only placed
   if its source could be placed, too.

   A package which doesn't fit even into an empty partition is an error,
   or is skipped with a warning if large packages are to be ignored.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_PARTITIONER_H
#define PARTLIB_PARTITIONER_H

#include <partial-pkg/macros.h>
#include <partial-pkg/mediasize.h>
#include <partial-pkg/partition.h>

#include <string>
#include <unordered_set>
#include <vector>

class Configuration;
class PackageCatalog;
class SourceCatalog;

class PARTIAL_PUBLIC Partitioner
{
   public:
   struct PARTIAL_PUBLIC Options
   {
      CapacitySequence Sizes;
      CapacitySequence SourceSizes;
      /** maximum number of partitions, 0 for no limit */
      unsigned long Limit;
      bool Source;
      bool MergeSource;
      bool IgnoreLarge;

      /** \brief read the Partial:: options and check their combination */
      bool FromConfig(Configuration const &Cnf);

      Options() : Limit(0), Source(true), MergeSource(false), IgnoreLarge(false) {};
   };

   private:
   PackageCatalog const &Packages;
   SourceCatalog &Sources;
   Options const Opts;
   PartitionSequence PkgParts;
   SourcePartitionSequence SrcParts;
   std::unordered_set<std::string> Charged;
   std::vector<std::string> Skipped;

   PARTIAL_HIDDEN bool Fill(std::vector<std::string> const &Pkgs, size_t &Left,
	 Partition &Part, std::string &Oversized);
   inline bool SeparateSources() const { return Opts.Source == true && Opts.MergeSource == false; };

   public:
   /** \brief partition the given packages
    *
    *  Stops early without an error once the partition limit is reached.
    *  \return \b false if a package is too large and large packages are
    *  not ignored */
   bool Run(std::vector<std::string> const &Pkgs);

   inline std::vector<Partition> const &PackagePartitions() const { return PkgParts.Partitions(); };
   /** \brief the source partitions, empty unless sources are kept apart */
   std::vector<Partition> const &SourcePartitions() const;
   /** \brief packages skipped because they are too large */
   inline std::vector<std::string> const &Ignored() const { return Skipped; };

   Partitioner(PackageCatalog const &packages, SourceCatalog &sources, Options const &opts);
};

#endif
