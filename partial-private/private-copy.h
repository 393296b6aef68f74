#ifndef PARTIAL_PRIVATE_COPY_H
#define PARTIAL_PRIVATE_COPY_H

#include <partial-pkg/macros.h>

class CommandLine;

PARTIAL_PUBLIC bool DoCopy(CommandLine &CmdL);

#endif
