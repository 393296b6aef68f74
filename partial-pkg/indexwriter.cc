// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/archive.h>
#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/indexstanzas.h>
#include <partial-pkg/indexwriter.h>
#include <partial-pkg/partition.h>

#include <string>
#include <utility>
#include <vector>

#include <errno.h>
#include <sys/stat.h>
									/*}}}*/

using std::string;

IndexWriter::IndexWriter(ArchiveLayout const &layout, ArchiveIndices const &indices,
      std::string dest, Partial::Configuration::Compressor const &compressor)
   : Layout(layout), Indices(indices), Dest(std::move(dest)), Compressor(compressor)
{
}
void IndexWriter::Start(string const &, string const &, string const &) {}
void IndexWriter::Done(unsigned long const) {}

// IndexWriter::WriteIndex - Write one index file			/*{{{*/
bool IndexWriter::WriteIndex(string const &Dir, string const &Base, IndexStanzas const &Stanzas,
      std::vector<string> const &Names, unsigned long &Count,
      std::function<bool(string const &)> const &Filter)
{
   string const FullDir = flCombine(Dest, Dir);
   if (CreateDirectory(Dest, FullDir) == false)
      return false;

   FileFd Out;
   if (Out.Open(flCombine(FullDir, Base + Compressor.Extension), FileFd::WriteAtomic, Compressor) == false)
      return false;
   Out.EraseOnFailure();
   if (Stanzas.Write(Out, Names, Count, Filter) == false)
   {
      Out.OpFail();
      Out.Close();
      return false;
   }
   return Out.Close();
}
									/*}}}*/
// IndexWriter::WriteSources - Write the Sources of a partition		/*{{{*/
// ---------------------------------------------------------------------
/* Sources already written for this dist and section are left out */
bool IndexWriter::WriteSources(string const &Name, string const &Dist,
      string const &Section, string const &Dir, std::vector<string> const &Srcs)
{
   SourceIndex const * const Index = Indices.FindSources(Dist, Section);
   if (Index == nullptr)
      return true;

   auto &Written = WrittenSources[Dist + "/" + Section];
   unsigned long Count = 0;
   Start("Sources" + Compressor.Extension, Name, "(" + Dist + "," + Section + ")");
   if (WriteIndex(Dir, "Sources", *Index, Srcs, Count,
	    [&](string const &Src) { return Written.find(Src) == Written.end(); }) == false)
      return false;
   Written.insert(Srcs.begin(), Srcs.end());
   Done(Count);
   return true;
}
									/*}}}*/
// IndexWriter::Write - Write the indices of all partitions		/*{{{*/
// ---------------------------------------------------------------------
/* Source partitions are numbered after the package partitions if both
   share a prefix, otherwise they count from zero again. */
bool IndexWriter::Write(std::vector<Partition> const &Packages, std::vector<Partition> const &Sources,
      bool const Merge)
{
   if (DirectoryExists(Dest) == false && mkdir(Dest.c_str(), 0755) != 0 && errno != EEXIST)
      return _error->Errno("mkdir", "Failed to create directory %s", Dest.c_str());

   for (auto const &Dist : Layout.Dists)
   {
      for (auto const &Section : Layout.Sections)
      {
	 string const DistsDir = "dists/" + Dist + "/" + Section + "/";
	 size_t I = 0;
	 for (auto const &Part : Packages)
	 {
	    string const Name = Layout.DirPrefix + Layout.TopDir(I);
	    string const Dir = Name + "/" + DistsDir;
	    for (auto const &Arch : Layout.Archs)
	    {
	       IndexStanzas const * const Stanzas = Indices.FindPackages(Dist, Section, Arch);
	       if (Stanzas == nullptr)
		  continue;
	       unsigned long Count = 0;
	       Start("Packages" + Compressor.Extension, Name, "(" + Dist + "," + Section + "," + Arch + ")");
	       if (WriteIndex(Dir + "binary-" + Arch, "Packages", *Stanzas, Part.Names, Count) == false)
		  return false;
	       Done(Count);
	    }
	    if (Merge == true)
	    {
	       SourceIndex const * const Index = Indices.FindSources(Dist, Section);
	       if (Index != nullptr &&
		     WriteSources(Name, Dist, Section, Dir + "source", Index->SourcesOf(Part.Names)) == false)
		  return false;
	    }
	    ++I;
	 }

	 if (Merge == true || Sources.empty() == true)
	    continue;
	 if (Layout.DirPrefix != Layout.DirSrcPrefix)
	    I = 0;
	 for (auto const &Part : Sources)
	 {
	    string const Name = Layout.DirSrcPrefix + Layout.TopDir(I);
	    if (WriteSources(Name, Dist, Section, Name + "/" + DistsDir + "source", Part.Names) == false)
	       return false;
	    ++I;
	 }
      }
   }
   return true;
}
									/*}}}*/
