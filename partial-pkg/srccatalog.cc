// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/indexstanzas.h>
#include <partial-pkg/srccatalog.h>
#include <partial-pkg/strutl.h>
#include <partial-pkg/tagfile.h>

#include <sstream>
#include <string>
#include <vector>
									/*}}}*/

using std::string;

// SourceCatalog::AddFile - Account a file of a source			/*{{{*/
bool SourceCatalog::AddFile(string const &Source, string const &Directory,
      string const &Name, unsigned long long const Size)
{
   if (Registered.insert(Directory + "/" + Name).second == false)
      return false;

   auto const S = Sizes.find(Source);
   if (S == Sizes.end())
   {
      Sizes.emplace(Source, Size);
      Order.push_back(Source);
   }
   else
      S->second += Size;
   return true;
}
void SourceCatalog::AddBinary(string const &Binary, string const &Source)
{
   Binaries[Binary] = Source;
}
									/*}}}*/
// SourceCatalog::Parse - Read a Sources file				/*{{{*/
// ---------------------------------------------------------------------
/* A file line is "<checksum> <size> <name>", lines not of this form are
   ignored. */
bool SourceCatalog::Parse(FileFd &Fd, SourceIndex * const Index)
{
   pkgTagFile Tags(&Fd);
   if (_error->PendingError() == true)
      return false;

   pkgTagSection Section;
   while (Tags.Step(Section) == true)
   {
      string const Name = Section.FindS("Package");
      if (Name.empty() == true)
	 continue;
      if (Index != nullptr)
	 Index->Add(Name, Section.Raw());

      for (auto const &B : VectorizeString(Section.FindS("Binary"), ','))
      {
	 string const Bin = Partial::String::Strip(B);
	 if (Bin.empty() == true)
	    continue;
	 AddBinary(Bin, Name);
	 if (Index != nullptr)
	    Index->AddBinary(Bin, Name);
      }

      string const Directory = Section.FindS("Directory");
      string Files = Section.FindS("Files");
      if (Files.empty() == true)
	 Files = Section.FindS("Checksums-Sha256");
      std::istringstream Lines(Files);
      for (string Line; std::getline(Lines, Line);)
      {
	 std::istringstream Words(Line);
	 string Hash, Size, File;
	 if (!(Words >> Hash >> Size >> File) || IsDigitString(Size) == false)
	    continue;
	 unsigned long long Bytes = 0;
	 if (StrToNum(Size.c_str(), Bytes, Size.length(), 10) == false)
	    continue;
	 AddFile(Name, Directory, File, Bytes);
      }
   }
   return Fd.Failed() == false && _error->PendingError() == false;
}
									/*}}}*/
unsigned long long SourceCatalog::Size(string const &Name) const	/*{{{*/
{
   auto const S = Sizes.find(Name);
   if (S == Sizes.end())
      return 0;
   return S->second;
}
unsigned long long SourceCatalog::TotalSize(std::vector<string> const &Names) const
{
   unsigned long long Total = 0;
   for (auto const &Name : Names)
      Total += Size(Name);
   return Total;
}
bool SourceCatalog::Contains(string const &Name) const
{
   return Sizes.find(Name) != Sizes.end();
}
bool SourceCatalog::SourceOf(string const &Binary, string &Source) const
{
   auto const S = Binaries.find(Binary);
   if (S == Binaries.end())
      return false;
   Source = S->second;
   return true;
}
									/*}}}*/
// SourceCatalog::SourcesOf - Map binaries to their sources		/*{{{*/
std::vector<string> SourceCatalog::SourcesOf(std::vector<string> const &Bins, NotFoundCallback const &NotFound)
{
   std::vector<string> Sources;
   std::unordered_set<string> Seen;
   for (auto const &Bin : Bins)
   {
      string Source;
      if (SourceOf(Bin, Source) == false)
      {
	 if (Reported.insert(Bin).second == true && NotFound != nullptr)
	    NotFound(Bin);
	 continue;
      }
      if (Seen.insert(Source).second == true)
	 Sources.push_back(Source);
   }
   return Sources;
}
std::vector<string> SourceCatalog::SourcesOf(std::vector<string> const &Bins)
{
   return SourcesOf(Bins, [](string const &Bin) {
      _error->Warning("Source of %s not found", Bin.c_str());
   });
}
									/*}}}*/
