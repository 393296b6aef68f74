// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Media Size - Capacities of removable media

   CD capacities are given in blocks of 2048 bytes (Mode 2, XA Form 1).
   A block holds 1/75 second of audio, so a 74 minute CD has
   74*60*75 = 333000 blocks. The 80 minute CD really ends at 79m57s74.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/error.h>
#include <partial-pkg/mediasize.h>
#include <partial-pkg/strutl.h>

#include <cmath>
#include <string>
#include <vector>
									/*}}}*/

using std::string;

static unsigned long long Usable(unsigned long long const Nominal)
{
   return std::llround(Nominal * MediaCapacityTable::SafetyFactor);
}

// MediaCapacityTable::Entries - The built-in media			/*{{{*/
std::vector<std::pair<std::string, unsigned long long>> const &MediaCapacityTable::Entries()
{
   unsigned long long const MiB = 1024 * 1024;
   static std::vector<std::pair<std::string, unsigned long long>> const Table = {
      {"FD", Usable(1440000)},
      {"CF8", Usable(8 * MiB)},
      {"CF16", Usable(16 * MiB)},
      {"CF32", Usable(32 * MiB)},
      {"CF64", Usable(64 * MiB)},
      {"MO128", Usable(128 * MiB)},
      {"MO230", Usable(230 * MiB)},
      {"MO640", Usable(640 * MiB)},
      {"MO1.3G", Usable(1300 * MiB)},
      {"CD74", Usable(74ull * 60 * 75 * 2048)},
      {"CD80", Usable(((79ull * 60 * 75) + (57 * 75) + 74) * 2048)},
      {"DVD-RAM", Usable(2600000000ull)},
      {"DVD", Usable(4700000000ull)},
   };
   return Table;
}
									/*}}}*/
// MediaCapacityTable::Lookup - Find a media by name			/*{{{*/
bool MediaCapacityTable::Lookup(std::string const &Name, unsigned long long &Size)
{
   for (auto const &M : Entries())
   {
      if (M.first != Name)
	 continue;
      Size = M.second;
      return true;
   }
   return false;
}
									/*}}}*/
// MediaCapacityTable::Resolve - Find a media or warn			/*{{{*/
unsigned long long MediaCapacityTable::Resolve(std::string const &Name)
{
   unsigned long long Size = 0;
   if (Lookup(Name, Size) == false)
      _error->Warning("Unknown media name: %s", Name.c_str());
   return Size;
}
									/*}}}*/
// CapacitySequence::Parse - Read byte counts and media names		/*{{{*/
bool CapacitySequence::Parse(std::vector<std::string> const &Spec, bool const Strict)
{
   std::vector<unsigned long long> Parsed;
   Parsed.reserve(Spec.size());
   for (auto const &S : Spec)
   {
      string const Entry = Partial::String::Strip(S);
      unsigned long long Size = 0;
      if (IsDigitString(Entry) == true)
      {
	 if (StrToNum(Entry.c_str(), Size, Entry.length(), 10) == false)
	    return _error->Error("Size %s is out of range", Entry.c_str());
	 if (Size == 0 && Parsed.empty() == false)
	    Size = Parsed.back();
      }
      else if (MediaCapacityTable::Lookup(Entry, Size) == false)
      {
	 if (Strict == true)
	    return _error->Error("Unknown media type %s", Entry.c_str());
	 Size = MediaCapacityTable::Resolve(Entry);
      }
      Parsed.push_back(Size);
   }
   if (Parsed.empty() == true)
      return _error->Error("No partition size given");
   Sizes.swap(Parsed);
   return true;
}
									/*}}}*/
// CapacitySequence::At - Capacity of a partition			/*{{{*/
unsigned long long CapacitySequence::At(size_t const Index) const
{
   if (Sizes.empty() == true)
      return 0;
   if (Index >= Sizes.size())
      return Sizes.back();
   return Sizes[Index];
}
									/*}}}*/
