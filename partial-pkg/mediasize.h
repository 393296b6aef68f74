// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Media Size - Capacities of removable media

   MediaCapacityTable maps the names of well known media (CD74, DVD, ...)
   to the number of bytes which can be used on them. Every nominal
   capacity is reduced to 93% because the fixed block size of the
   filesystem on the media makes written files take up more space.

   CapacitySequence is the list of capacities for consecutive partitions.
   Partitions beyond its end reuse the last entry.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_MEDIASIZE_H
#define PARTLIB_MEDIASIZE_H

#include <partial-pkg/macros.h>

#include <string>
#include <utility>
#include <vector>

class PARTIAL_PUBLIC MediaCapacityTable
{
   public:
   static constexpr double SafetyFactor = 0.93;

   /** \brief all known media names with their usable capacity */
   static std::vector<std::pair<std::string, unsigned long long>> const &Entries();

   /** \brief capacity of the media called Name
    *
    *  \return \b false if the name is unknown, Size is left untouched */
   static bool Lookup(std::string const &Name, unsigned long long &Size);

   /** \brief like Lookup, but an unknown name is reported as a warning
    *  and results in a capacity of zero */
   static unsigned long long Resolve(std::string const &Name);
};

class PARTIAL_PUBLIC CapacitySequence
{
   std::vector<unsigned long long> Sizes;

   public:
   /** \brief fill the sequence from a list of byte counts and media names
    *
    *  An entry of 0 repeats the capacity of the entry before it.
    *  In Strict mode an entry which is neither a number nor a known
    *  media name is an error, otherwise it is a warning and counts
    *  as a capacity of zero.
    */
   bool Parse(std::vector<std::string> const &Spec, bool const Strict = true);

   /** \brief capacity of the partition with the given index */
   unsigned long long At(size_t const Index) const;

   inline bool empty() const { return Sizes.empty(); };
   inline size_t size() const { return Sizes.size(); };

   CapacitySequence() = default;
   explicit CapacitySequence(std::vector<unsigned long long> sizes) : Sizes(std::move(sizes)) {};
};

#endif
