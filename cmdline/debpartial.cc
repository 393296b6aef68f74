// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   debpartial - Split a Debian archive into media sized partial archives

   The Packages and Sources files of the given archive are read and the
   packages are distributed over as many partitions as needed. For every
   partition only new index files are written, debcopy fetches the
   files listed in them afterwards.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/cmndline.h>
#include <partial-pkg/configuration.h>
#include <partial-pkg/mediasize.h>

#include <partial-private/private-cmndline.h>
#include <partial-private/private-main.h>
#include <partial-private/private-output.h>
#include <partial-private/private-partial.h>

#include <iostream>
#include <vector>
									/*}}}*/

static bool ShowHelp(CommandLine &)					/*{{{*/
{
   std::cout <<
      "Usage: debpartial [options] <source> <dest>\n"
      "\n"
      "debpartial splits the Debian archive at <source> into partial archives\n"
      "below <dest> which fit onto the given media. Only the Packages and\n"
      "Sources files are written, use debcopy to fill them with the files.\n"
      "\n"
      "Options:\n"
      "  -d, --dist=DISTS           distributions to handle (unstable)\n"
      "  -s, --section=SECTIONS     sections to handle (main,contrib,non-free)\n"
      "  -a, --arch=ARCHS           architectures to handle (i386)\n"
      "  -S, --size=SIZES           partition sizes in bytes or media names (CD74)\n"
      "  -R, --srcsize=SIZES        sizes of the source partitions (--size)\n"
      "  -i, --include=PKGS         packages to include in this order\n"
      "      --include-from=FILE    read the packages to include from FILE\n"
      "  -D, --dirmap=NAMES         names of the partitions instead of numbers\n"
      "      --dirprefix=PREFIX     prefix of the partitions (Debian)\n"
      "      --dirsrcprefix=PREFIX  prefix of the source partitions (Debian-Src)\n"
      "  -l, --limit=N              maximum number of partitions (no limit)\n"
      "      --nosource             don't handle sources\n"
      "  -m, --merge-source         put sources next to their binaries\n"
      "  -I, --ignore-large-packages  skip packages larger than a partition\n"
      "  -z, --compress=NAME        compressor for the written indices (gzip)\n"
      "\n"
      "Media names: ";
   bool First = true;
   for (auto const &Entry : MediaCapacityTable::Entries())
   {
      if (First == false)
	 std::cout << ", ";
      std::cout << Entry.first;
      First = false;
   }
   std::cout << std::endl;
   return true;
}
									/*}}}*/
int main(int argc, const char *argv[])					/*{{{*/
{
   CommandLine CmdL;
   std::vector<CommandLine::Args> Args;
   ParseCommandLine(CmdL, Args, PARTIAL_CMD::DEBPARTIAL, &_config, argc, argv, &ShowHelp);

   InitSignals();
   InitOutput();

   return DispatchCommandLine(CmdL, &DoPartial);
}
									/*}}}*/
