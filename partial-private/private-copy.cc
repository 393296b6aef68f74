// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/cmndline.h>
#include <partial-pkg/configuration.h>
#include <partial-pkg/copier.h>
#include <partial-pkg/error.h>

#include <partial-private/private-copy.h>
#include <partial-private/private-output.h>

#include <iostream>
#include <string>
#include <vector>
									/*}}}*/

using std::string;

// DoCopy - Fetch the files listed in a partial archive			/*{{{*/
// ---------------------------------------------------------------------
/* Missing files are only warned about, the counters tell how many
   there were. */
bool DoCopy(CommandLine &CmdL)
{
   if (CmdL.FileSize() != 2)
      return _error->Error("two arguments <source> and <dest> required");

   ArchiveCopier Copier(CmdL.FileList[0], CmdL.FileList[1], _config->FindB("Partial::Copy::Symlink", false));
   std::vector<string> Packages, Sources;
   if (Copier.FindIndexFiles(Packages, Sources) == false)
      return false;

   for (auto const &File : Packages)
   {
      c0out << "Processing " << File << "... " << std::flush;
      if (Copier.ProcessPackages(File) == false)
	 return false;
      c0out << "done" << std::endl;
   }
   for (auto const &File : Sources)
   {
      c0out << "Processing " << File << "... " << std::flush;
      if (Copier.ProcessSources(File) == false)
	 return false;
      c0out << "done" << std::endl;
   }

   c1out << "Number of Copied Files: " << Copier.CopiedFiles() << std::endl
	 << "Number of Ignored Files: " << Copier.IgnoredFiles() << std::endl
	 << "Number of Non-existence File: " << Copier.MissingFiles() << std::endl;
   return true;
}
									/*}}}*/
