// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the partial archive library

   This function must be called to configure the config class before
   calling most library functions. It sets the built-in defaults and
   then reads the configuration files on top of them.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_INIT_H
#define PARTLIB_INIT_H

#include <partial-pkg/macros.h>

class Configuration;

PARTIAL_PUBLIC extern const char *pkgVersion;
PARTIAL_PUBLIC extern const char *pkgLibVersion;

PARTIAL_PUBLIC bool partialInitConfig(Configuration &Cnf);

#endif
