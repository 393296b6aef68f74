// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/indexstanzas.h>
#include <partial-pkg/pkgcatalog.h>
#include <partial-pkg/strutl.h>
#include <partial-pkg/tagfile.h>

#include <string>
#include <unordered_set>
#include <vector>
									/*}}}*/

using std::string;

// PackageCatalog::Insert - Account a package file			/*{{{*/
// ---------------------------------------------------------------------
/* A package without a Filename can't be matched against other files,
   so it is always counted. */
bool PackageCatalog::Insert(string const &Name, string const &FileName, unsigned long long const Size)
{
   if (FileName.empty() == false && Registered.insert(FileName).second == false)
      return false;

   auto const P = Sizes.find(Name);
   if (P == Sizes.end())
   {
      Sizes.emplace(Name, Size);
      Order.push_back(Name);
   }
   else
      P->second += Size;
   return true;
}
									/*}}}*/
// PackageCatalog::Parse - Read a Packages file				/*{{{*/
bool PackageCatalog::Parse(FileFd &Fd, IndexStanzas * const Stanzas)
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
      if (Stanzas != nullptr)
	 Stanzas->Add(Name, Section.Raw());
      if (Section.Exists("Size") == false)
	 continue;
      Insert(Name, Section.FindS("Filename"), Section.FindULL("Size"));
   }
   return Fd.Failed() == false && _error->PendingError() == false;
}
									/*}}}*/
unsigned long long PackageCatalog::Size(string const &Name) const	/*{{{*/
{
   auto const P = Sizes.find(Name);
   if (P == Sizes.end())
      return 0;
   return P->second;
}
unsigned long long PackageCatalog::TotalSize(std::vector<string> const &Names) const
{
   unsigned long long Total = 0;
   for (auto const &Name : Names)
      Total += Size(Name);
   return Total;
}
bool PackageCatalog::Contains(string const &Name) const
{
   return Sizes.find(Name) != Sizes.end();
}
									/*}}}*/
// SelectPackages - Packages given by name or by file			/*{{{*/
bool SelectPackages(PackageCatalog const &Catalog, std::vector<string> const &Include,
      string const &IncludeFrom, std::vector<string> &Selected)
{
   std::unordered_set<string> Seen;
   auto const Select = [&](string const &Name) {
      if (Seen.insert(Name).second == true)
	 Selected.push_back(Name);
   };

   for (auto const &Entry : Include)
      for (auto const &N : VectorizeString(Entry, ','))
      {
	 string const Name = Partial::String::Strip(N);
	 if (Name.empty() == true)
	    continue;
	 if (Catalog.Contains(Name) == false)
	    _error->Warning("No such package: %s", Name.c_str());
	 else
	    Select(Name);
      }

   if (IncludeFrom.empty() == false)
   {
      FileFd Fd(IncludeFrom, FileFd::ReadOnly);
      if (Fd.IsOpen() == false)
	 return false;
      string Line;
      while (Fd.Eof() == false)
      {
	 if (Fd.ReadLine(Line) == false)
	    return false;
	 string const Name = Partial::String::Strip(Line);
	 if (Name.empty() == false && Catalog.Contains(Name) == true)
	    Select(Name);
      }
   }

   if (Selected.empty() == true)
      Selected = Catalog.Names();
   return true;
}
									/*}}}*/
