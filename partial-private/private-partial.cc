// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/archive.h>
#include <partial-pkg/cmndline.h>
#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/indexwriter.h>
#include <partial-pkg/partialconfiguration.h>
#include <partial-pkg/partitioner.h>
#include <partial-pkg/pkgcatalog.h>
#include <partial-pkg/strutl.h>

#include <partial-private/private-output.h>
#include <partial-private/private-partial.h>

#include <iostream>
#include <string>
#include <vector>
									/*}}}*/

using std::string;

namespace {
// ProgressWriter - IndexWriter reporting every written file		/*{{{*/
class ProgressWriter : public IndexWriter
{
   protected:
   void Start(string const &File, string const &Name, string const &Target) override
   {
      ioprintf(c0out, "Writing %s of %s for %s... ", File.c_str(), Name.c_str(), Target.c_str());
      c0out << std::flush;
   }
   void Done(unsigned long const Count) override
   {
      c0out << Count << "." << std::endl;
   }

   public:
   using IndexWriter::IndexWriter;
};
									/*}}}*/
}

// LoadIndices - Read all Packages and Sources files of the archive	/*{{{*/
static bool LoadIndices(ArchiveIndices &Indices, ArchiveLayout const &Layout,
      string const &Base, bool const Source)
{
   for (auto const &Arch : Layout.Archs)
      for (auto const &Dist : Layout.Dists)
	 for (auto const &Section : Layout.Sections)
	 {
	    c0out << "Reading " << ArchiveLayout::PackagesIndex(Dist, Section, Arch) << "... " << std::flush;
	    if (Indices.LoadPackages(Base, Dist, Section, Arch) == false)
	    {
	       c0out << "failed" << std::endl;
	       return false;
	    }
	    c0out << "done" << std::endl;
	 }

   if (Source == false)
      return true;

   for (auto const &Dist : Layout.Dists)
      for (auto const &Section : Layout.Sections)
      {
	 c0out << "Reading " << ArchiveLayout::SourcesIndex(Dist, Section) << "... " << std::flush;
	 if (Indices.LoadSources(Base, Dist, Section) == false)
	 {
	    c0out << "failed" << std::endl;
	    return false;
	 }
	 c0out << "done" << std::endl;
      }
   return true;
}
									/*}}}*/
// DoPartial - Split the archive and write the partial indices		/*{{{*/
// ---------------------------------------------------------------------
/* The first file argument is the root of the full archive, the second
   the directory the partitions are created in. */
bool DoPartial(CommandLine &CmdL)
{
   if (CmdL.FileSize() != 2)
      return _error->Error("two arguments <source> and <dest> required");
   string const Base = CmdL.FileList[0];
   string const Dest = CmdL.FileList[1];

   Partitioner::Options Opts;
   if (Opts.FromConfig(*_config) == false)
      return false;
   ArchiveLayout Layout;
   if (Layout.FromConfig(*_config) == false)
      return false;
   Partial::Configuration::Compressor Compressor;
   if (Partial::Configuration::findCompressor(_config->Find("Partial::Compress", "gzip"), Compressor) == false)
      return false;

   ArchiveIndices Indices;
   if (LoadIndices(Indices, Layout, Base, Opts.Source) == false)
      return false;

   std::vector<string> Pkgs;
   if (SelectPackages(Indices.Packages, _config->FindVector("Partial::Include"),
	    _config->Find("Partial::Include-From"), Pkgs) == false)
      return false;

   Partitioner Parts(Indices.Packages, Indices.Sources, Opts);
   if (Parts.Run(Pkgs) == false)
      return false;

   ShowPackagePartitions(c1out, Layout, Parts.PackagePartitions(), Opts.MergeSource);
   ShowSourcePartitions(c1out, Layout, Parts.SourcePartitions(), Parts.PackagePartitions().size());

   ProgressWriter Writer(Layout, Indices, Dest, Compressor);
   return Writer.Write(Parts.PackagePartitions(), Parts.SourcePartitions(), Opts.MergeSource);
}
									/*}}}*/
