#ifndef PARTIAL_PRIVATE_CMNDLINE_H
#define PARTIAL_PRIVATE_CMNDLINE_H

#include <partial-pkg/cmndline.h>
#include <partial-pkg/macros.h>

#include <vector>

class Configuration;

enum class PARTIAL_CMD {
   DEBPARTIAL,
   DEBCOPY,
};

PARTIAL_PUBLIC void ParseCommandLine(CommandLine &CmdL, std::vector<CommandLine::Args> &Args,
      PARTIAL_CMD const Binary, Configuration * const * const Cnf, int const argc, const char * argv[],
      bool (*ShowHelp)(CommandLine &));
PARTIAL_PUBLIC unsigned short DispatchCommandLine(CommandLine &CmdL, bool (*Handler)(CommandLine &));

PARTIAL_PUBLIC std::vector<CommandLine::Args> getCommandArgs(PARTIAL_CMD const Program);

#endif
