// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Partition - Ordered groups of packages filling one media each

   PartitionSequence holds the closed partitions of binary packages.
   SourcePartitionSequence places sources into partitions of their own
   with the same next-fit rule: a source goes into the last partition if
   it fits, otherwise a new partition is started as long as the number
   of partitions is not limited.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_PARTITION_H
#define PARTLIB_PARTITION_H

#include <partial-pkg/macros.h>
#include <partial-pkg/mediasize.h>

#include <string>
#include <unordered_set>
#include <vector>

class SourceCatalog;

struct PARTIAL_PUBLIC Partition
{
   size_t Index;
   std::vector<std::string> Names;
   /** bytes used, including SourceSize */
   unsigned long long Size;
   /** bytes of sources charged to this partition in merge mode */
   unsigned long long SourceSize;

   explicit Partition(size_t const index) : Index(index), Size(0), SourceSize(0) {};
};

class PARTIAL_PUBLIC PartitionSequence
{
   CapacitySequence const &Capacity;
   std::vector<Partition> Parts;

   public:
   inline unsigned long long CapacityOf(size_t const Index) const { return Capacity.At(Index); };
   void Append(Partition &&Part);
   void Reset() { Parts.clear(); };

   inline std::vector<Partition> const &Partitions() const { return Parts; };
   inline size_t size() const { return Parts.size(); };

   explicit PartitionSequence(CapacitySequence const &capacity) : Capacity(capacity) {};
};

class PARTIAL_PUBLIC SourcePartitionSequence
{
   CapacitySequence const &Capacity;
   SourceCatalog const &Catalog;
   long Limit;
   std::vector<Partition> Parts;
   std::unordered_set<std::string> Written;

   public:
   enum class AddResult
   {
      Added,
      /** the source is in a partition already, nothing was done */
      AlreadyWritten,
      /** the source doesn't fit and no further partition may be started */
      Full,
      /** the source doesn't even fit into an empty partition */
      Oversized
   };

   /** \brief place a source, Message describes an Oversized result */
   AddResult Add(std::string const &Source, std::string &Message);

   /** \brief limit the number of partitions, negative means unlimited */
   inline void SetLimit(long const limit) { Limit = limit; };
   inline long GetLimit() const { return Limit; };

   bool IsWritten(std::string const &Source) const;
   void Reset();

   inline std::vector<Partition> const &Partitions() const { return Parts; };
   inline size_t size() const { return Parts.size(); };

   SourcePartitionSequence(CapacitySequence const &capacity, SourceCatalog const &catalog, long const limit = -1);
};

#endif
