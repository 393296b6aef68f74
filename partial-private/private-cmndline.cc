// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/cmndline.h>
#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/init.h>
#include <partial-pkg/strutl.h>

#include <partial-private/private-cmndline.h>

#include <stdlib.h>
#include <string.h>

#include <iostream>
#include <vector>
									/*}}}*/

#define addArg(w, x, y, z) Args.emplace_back(CommandLine::MakeArgs(w, x, y, z))

static void addArgumentsDebPartial(std::vector<CommandLine::Args> &Args)/*{{{*/
{
   addArg('d', "dist", "Partial::Dist", CommandLine::HasArg);
   addArg('s', "section", "Partial::Section", CommandLine::HasArg);
   addArg('a', "arch", "Partial::Arch", CommandLine::HasArg);
   addArg('S', "size", "Partial::Size", CommandLine::HasArg);
   addArg('R', "srcsize", "Partial::SrcSize", CommandLine::HasArg);
   addArg('i', "include", "Partial::Include::", CommandLine::HasArg);
   addArg(0, "include-from", "Partial::Include-From", CommandLine::HasArg);
   addArg('D', "dirmap", "Partial::DirMap", CommandLine::HasArg);
   addArg(0, "dirprefix", "Partial::DirPrefix", CommandLine::HasArg);
   addArg(0, "dirsrcprefix", "Partial::DirSrcPrefix", CommandLine::HasArg);
   addArg('l', "limit", "Partial::Limit", CommandLine::HasArg);
   addArg(0, "nosource", "Partial::Source", CommandLine::InvBoolean);
   addArg('m', "merge-source", "Partial::Merge-Source", 0);
   addArg('I', "ignore-large-packages", "Partial::Ignore-Large", 0);
   addArg('z', "compress", "Partial::Compress", CommandLine::HasArg);
}
									/*}}}*/
static void addArgumentsDebCopy(std::vector<CommandLine::Args> &Args)	/*{{{*/
{
   addArg('l', "symlink", "Partial::Copy::Symlink", 0);
}
									/*}}}*/
std::vector<CommandLine::Args> getCommandArgs(PARTIAL_CMD const Program)/*{{{*/
{
   std::vector<CommandLine::Args> Args;
   Args.reserve(30);
   switch (Program)
   {
      case PARTIAL_CMD::DEBPARTIAL: addArgumentsDebPartial(Args); break;
      case PARTIAL_CMD::DEBCOPY: addArgumentsDebCopy(Args); break;
   }

   // options without a command
   addArg('h', "help", "help", 0);
   addArg('v', "version", "version", 0);
   // general options
   addArg('q', "quiet", "quiet", CommandLine::IntLevel);
   addArg('q', "silent", "quiet", CommandLine::IntLevel);
   addArg('c', "config-file", 0, CommandLine::ConfigFile);
   addArg('o', "option", 0, CommandLine::ArbItem);
   addArg(0, NULL, NULL, 0);

   return Args;
}
									/*}}}*/
#undef addArg
static bool ShowCommonHelp(PARTIAL_CMD const Binary, CommandLine &CmdL,	/*{{{*/
      bool (*ShowHelp)(CommandLine &))
{
   std::cout << PACKAGE << " " << PACKAGE_VERSION << std::endl;
   if (_config->FindB("version") == true)
      return true;
   if (ShowHelp(CmdL) == false)
      return false;
   char const * cmd = nullptr;
   switch (Binary)
   {
      case PARTIAL_CMD::DEBPARTIAL: cmd = "debpartial(1)"; break;
      case PARTIAL_CMD::DEBCOPY: cmd = "debcopy(1)"; break;
   }
   std::cout << std::endl;
   ioprintf(std::cout, "See %s for more information about the available options.", cmd);
   std::cout << std::endl <<
      "Configuration options and syntax is detailed in debpartial.conf(5).\n";
   return true;
}
									/*}}}*/
// ParseCommandLine - Set up the configuration and read the options	/*{{{*/
// ---------------------------------------------------------------------
/* Args has to outlive CmdL as the parser keeps a pointer into it */
void ParseCommandLine(CommandLine &CmdL, std::vector<CommandLine::Args> &Args,
      PARTIAL_CMD const Binary, Configuration * const * const Cnf, int const argc, const char *argv[],
      bool (*ShowHelp)(CommandLine &))
{
   if (Cnf != NULL && partialInitConfig(**Cnf) == false)
   {
      _error->DumpErrors();
      exit(100);
   }

   if (likely(argc != 0 && argv[0] != NULL))
      _config->Set("Binary", flNotDir(argv[0]));

   Args = getCommandArgs(Binary);
   CmdL = CommandLine(Args.data(), _config);

   if (CmdL.Parse(argc,argv) == false)
   {
      if (_config->FindB("version") == true)
	 ShowCommonHelp(Binary, CmdL, ShowHelp);

      _error->DumpErrors();
      exit(100);
   }

   // See if the help should be shown
   if (_config->FindB("help") == true || _config->FindB("version") == true)
   {
      ShowCommonHelp(Binary, CmdL, ShowHelp);
      exit(0);
   }
}
									/*}}}*/
// DispatchCommandLine - Run the handler and report its errors		/*{{{*/
unsigned short DispatchCommandLine(CommandLine &CmdL, bool (*Handler)(CommandLine &))
{
   bool const returned = Handler(CmdL);

   // Print any errors or warnings found during the run
   bool const Errors = _error->PendingError();
   if (_config->FindI("quiet",0) > 0)
      _error->DumpErrors();
   else
      _error->DumpErrors(GlobalError::DEBUG);
   if (returned == false)
      return 100;
   return Errors == true ? 100 : 0;
}
									/*}}}*/
