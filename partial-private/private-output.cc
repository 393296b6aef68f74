// Include files							/*{{{*/
#include <config.h>

#include <partial-pkg/archive.h>
#include <partial-pkg/configuration.h>
#include <partial-pkg/partition.h>

#include <partial-private/private-output.h>

#include <iostream>
#include <unistd.h>
									/*}}}*/

using namespace std;

std::ostream c0out(0);
std::ostream c1out(0);
std::ostream c2out(0);
std::ofstream devnull("/dev/null");

bool InitOutput(std::basic_streambuf<char> * const out)			/*{{{*/
{
   if (!isatty(STDOUT_FILENO) && _config->FindI("quiet", -1) == -1)
      _config->Set("quiet","1");

   c0out.rdbuf(out);
   c1out.rdbuf(out);
   c2out.rdbuf(out);
   if (_config->FindI("quiet",0) > 0)
      c0out.rdbuf(devnull.rdbuf());
   if (_config->FindI("quiet",0) > 1)
      c1out.rdbuf(devnull.rdbuf());

   return true;
}
									/*}}}*/
static void ShowFirst(ostream &out, vector<string> const &Names)	/*{{{*/
{
   out << " [ ";
   if (Names.empty() == false)
   {
      out << Names.front();
      if (Names.size() > 1)
	 out << ", ...";
   }
   out << " ]";
}
									/*}}}*/
// ShowPackagePartitions - Summary of the package partitions		/*{{{*/
// ---------------------------------------------------------------------
/* In merge mode the size is split into the binaries and the sources
   charged to the partition. */
void ShowPackagePartitions(ostream &out, ArchiveLayout const &Layout,
      vector<Partition> const &Parts, bool const Merge)
{
   for (auto const &Part : Parts)
   {
      out << Layout.DirPrefix << Layout.TopDir(Part.Index) << ": "
	  << Part.Names.size() << " packages. Size: ";
      if (Merge == true)
	 out << (Part.Size - Part.SourceSize) << " + " << Part.SourceSize << " = " << Part.Size;
      else
	 out << Part.Size;
      ShowFirst(out, Part.Names);
      out << endl;
   }
}
									/*}}}*/
// ShowSourcePartitions - Summary of the source partitions		/*{{{*/
void ShowSourcePartitions(ostream &out, ArchiveLayout const &Layout,
      vector<Partition> const &Parts, size_t const PackageParts)
{
   size_t I = Layout.DirPrefix == Layout.DirSrcPrefix ? PackageParts : 0;
   for (auto const &Part : Parts)
   {
      out << Layout.DirSrcPrefix << Layout.TopDir(I) << ": "
	  << Part.Names.size() << " sources. Size: " << Part.Size;
      ShowFirst(out, Part.Names);
      out << endl;
      ++I;
   }
}
									/*}}}*/
