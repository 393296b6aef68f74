#ifndef PARTIAL_PRIVATE_MAIN_H
#define PARTIAL_PRIVATE_MAIN_H

#include <partial-private/private-cmndline.h>

#include <partial-pkg/macros.h>

PARTIAL_PUBLIC void InitSignals();

#endif
