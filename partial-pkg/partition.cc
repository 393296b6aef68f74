// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/partition.h>
#include <partial-pkg/srccatalog.h>
#include <partial-pkg/strutl.h>

#include <string>
#include <utility>
#include <vector>
									/*}}}*/

void PartitionSequence::Append(Partition &&Part)
{
   Part.Index = Parts.size();
   Parts.push_back(std::move(Part));
}

SourcePartitionSequence::SourcePartitionSequence(CapacitySequence const &capacity,
      SourceCatalog const &catalog, long const limit)
   : Capacity(capacity), Catalog(catalog), Limit(limit)
{
   Reset();
}
// SourcePartitionSequence::Reset - Start over with one empty partition	/*{{{*/
void SourcePartitionSequence::Reset()
{
   Parts.clear();
   Parts.emplace_back(0);
   Written.clear();
}
									/*}}}*/
bool SourcePartitionSequence::IsWritten(std::string const &Source) const
{
   return Written.find(Source) != Written.end();
}
// SourcePartitionSequence::Add - Place a source			/*{{{*/
// ---------------------------------------------------------------------
/* The first partition always exists, so a limit of 0 still allows to
   fill it. */
SourcePartitionSequence::AddResult SourcePartitionSequence::Add(std::string const &Source, std::string &Message)
{
   if (IsWritten(Source) == true)
      return AddResult::AlreadyWritten;

   unsigned long long const Size = Catalog.Size(Source);
   Partition &Current = Parts.back();
   unsigned long long const CurCapacity = Capacity.At(Current.Index);
   if (Current.Size + Size <= CurCapacity)
   {
      Current.Names.push_back(Source);
      Current.Size += Size;
      Written.insert(Source);
      return AddResult::Added;
   }

   if (Current.Names.empty() == true)
   {
      strprintf(Message, "Size '%llu' is too small to locate source '%s' in source partition %zu: %llu",
	    CurCapacity, Source.c_str(), Current.Index, Size);
      return AddResult::Oversized;
   }
   size_t const Next = Parts.size();
   unsigned long long const NextCapacity = Capacity.At(Next);
   if (Size > NextCapacity)
   {
      strprintf(Message, "Size '%llu' is too small to locate source '%s' in source partition %zu: %llu",
	    NextCapacity, Source.c_str(), Next, Size);
      return AddResult::Oversized;
   }
   if (Limit >= 0 && Parts.size() >= static_cast<unsigned long>(Limit))
      return AddResult::Full;

   Parts.emplace_back(Next);
   Parts.back().Names.push_back(Source);
   Parts.back().Size = Size;
   Written.insert(Source);
   return AddResult::Added;
}
									/*}}}*/
