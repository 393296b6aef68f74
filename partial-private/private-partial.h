#ifndef PARTIAL_PRIVATE_PARTIAL_H
#define PARTIAL_PRIVATE_PARTIAL_H

#include <partial-pkg/macros.h>

class CommandLine;

PARTIAL_PUBLIC bool DoPartial(CommandLine &CmdL);

#endif
