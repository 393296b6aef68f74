// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/archive.h>
#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>

#include <string>
#include <vector>
									/*}}}*/

using std::string;

// ArchiveLayout::FromConfig - Read the layout options			/*{{{*/
// ---------------------------------------------------------------------
/* In merge mode the sources live in the package partitions, so they
   share the prefix of them. */
bool ArchiveLayout::FromConfig(Configuration const &Cnf)
{
   Dists = Cnf.FindVector("Partial::Dist", "unstable");
   Sections = Cnf.FindVector("Partial::Section", "main,contrib,non-free");
   Archs = Cnf.FindVector("Partial::Arch", "i386");
   DirMap = Cnf.FindVector("Partial::DirMap");
   DirPrefix = Cnf.Find("Partial::DirPrefix", "Debian");
   if (Cnf.FindB("Partial::Merge-Source", false) == true)
      DirSrcPrefix = DirPrefix;
   else
      DirSrcPrefix = Cnf.Find("Partial::DirSrcPrefix", "Debian-Src");

   if (Dists.empty() == true || Sections.empty() == true || Archs.empty() == true)
      return _error->Error("At least one distribution, section and architecture is needed");
   return true;
}
									/*}}}*/
string ArchiveLayout::PackagesIndex(string const &Dist, string const &Section, string const &Arch)
{
   return "dists/" + Dist + "/" + Section + "/binary-" + Arch + "/Packages";
}
string ArchiveLayout::SourcesIndex(string const &Dist, string const &Section)
{
   return "dists/" + Dist + "/" + Section + "/source/Sources";
}
string ArchiveLayout::TopDir(size_t const Index) const
{
   if (Index < DirMap.size() && DirMap[Index].empty() == false)
      return DirMap[Index];
   return std::to_string(Index);
}

// ArchiveIndices::LoadPackages - Read one Packages file		/*{{{*/
bool ArchiveIndices::LoadPackages(string const &Base, string const &Dist,
      string const &Section, string const &Arch)
{
   FileFd Fd;
   if (Fd.Open(flCombine(Base, ArchiveLayout::PackagesIndex(Dist, Section, Arch)),
	    FileFd::ReadOnly, FileFd::Auto) == false)
      return false;
   IndexStanzas &Stanzas = PkgIndices[Dist + "/" + Section + "/" + Arch];
   if (Packages.Parse(Fd, &Stanzas) == false)
      return false;
   return Fd.Close();
}
									/*}}}*/
// ArchiveIndices::LoadSources - Read one Sources file			/*{{{*/
bool ArchiveIndices::LoadSources(string const &Base, string const &Dist,
      string const &Section)
{
   FileFd Fd;
   if (Fd.Open(flCombine(Base, ArchiveLayout::SourcesIndex(Dist, Section)),
	    FileFd::ReadOnly, FileFd::Auto) == false)
      return false;
   SourceIndex &Index = SrcIndices[Dist + "/" + Section];
   if (Sources.Parse(Fd, &Index) == false)
      return false;
   return Fd.Close();
}
									/*}}}*/
IndexStanzas const *ArchiveIndices::FindPackages(string const &Dist, string const &Section,
      string const &Arch) const
{
   auto const I = PkgIndices.find(Dist + "/" + Section + "/" + Arch);
   if (I == PkgIndices.end())
      return nullptr;
   return &I->second;
}
SourceIndex const *ArchiveIndices::FindSources(string const &Dist, string const &Section) const
{
   auto const I = SrcIndices.find(Dist + "/" + Section);
   if (I == SrcIndices.end())
      return nullptr;
   return &I->second;
}
