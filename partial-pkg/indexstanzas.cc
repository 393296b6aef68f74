// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/fileutl.h>
#include <partial-pkg/indexstanzas.h>

#include <string>
#include <unordered_set>
#include <vector>
									/*}}}*/

void IndexStanzas::Add(std::string const &Name, std::string const &Stanza)
{
   if (Name.empty() == true)
      return;
   Stanzas[Name] = Stanza;
}
bool IndexStanzas::Exists(std::string const &Name) const
{
   return Stanzas.find(Name) != Stanzas.end();
}
// IndexStanzas::Write - Emit a subset of the stanzas			/*{{{*/
bool IndexStanzas::Write(FileFd &Out, std::vector<std::string> const &Names, unsigned long &Count,
      std::function<bool(std::string const &)> const &Filter) const
{
   Count = 0;
   for (auto const &Name : Names)
   {
      auto const S = Stanzas.find(Name);
      if (S == Stanzas.end())
	 continue;
      if (Filter != nullptr && Filter(Name) == false)
	 continue;
      if (Out.Write(S->second.data(), S->second.length()) == false ||
	    Out.Write("\n", 1) == false)
	 return false;
      ++Count;
   }
   return true;
}
									/*}}}*/
void SourceIndex::AddBinary(std::string const &Binary, std::string const &Source)
{
   Binaries[Binary] = Source;
}
// SourceIndex::SourcesOf - Map binaries to their sources		/*{{{*/
std::vector<std::string> SourceIndex::SourcesOf(std::vector<std::string> const &Bins) const
{
   std::vector<std::string> Sources;
   std::unordered_set<std::string> Seen;
   for (auto const &Bin : Bins)
   {
      auto const S = Binaries.find(Bin);
      if (S == Binaries.end())
	 continue;
      if (Seen.insert(S->second).second == true)
	 Sources.push_back(S->second);
   }
   return Sources;
}
									/*}}}*/
