// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   debcopy - Fill a partial archive with the files of a full one

   Every file listed in the Packages and Sources files below <dest> is
   copied from <source>, or linked to it if symlinks are requested.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/cmndline.h>
#include <partial-pkg/configuration.h>

#include <partial-private/private-cmndline.h>
#include <partial-private/private-copy.h>
#include <partial-private/private-main.h>
#include <partial-private/private-output.h>

#include <iostream>
#include <vector>
									/*}}}*/

static bool ShowHelp(CommandLine &)					/*{{{*/
{
   std::cout <<
      "Usage: debcopy [options] <source> <dest>\n"
      "\n"
      "debcopy copies the files listed in the indices of the partial archive\n"
      "<dest> from the full archive <source>. Files already present are kept.\n"
      "\n"
      "Options:\n"
      "  -l, --symlink   create relative symlinks instead of copies\n";
   return true;
}
									/*}}}*/
int main(int argc, const char *argv[])					/*{{{*/
{
   CommandLine CmdL;
   std::vector<CommandLine::Args> Args;
   ParseCommandLine(CmdL, Args, PARTIAL_CMD::DEBCOPY, &_config, argc, argv, &ShowHelp);

   InitSignals();
   InitOutput();

   return DispatchCommandLine(CmdL, &DoCopy);
}
									/*}}}*/
