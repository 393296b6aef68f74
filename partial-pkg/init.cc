// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the partial archive library

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/init.h>
#include <partial-pkg/macros.h>

#include <cstdlib>
#include <string>

#include <string.h>
									/*}}}*/

#define Stringfy_(x) # x
#define Stringfy(x)  Stringfy_(x)
const char *pkgVersion = PACKAGE_VERSION;
const char *pkgLibVersion = Stringfy(PARTIAL_PKG_MAJOR) "."
                            Stringfy(PARTIAL_PKG_MINOR) "."
                            Stringfy(PARTIAL_PKG_RELEASE);

// partialInitConfig - Initialize the configuration class		/*{{{*/
// ---------------------------------------------------------------------
/* The defaults describe a single 74 minute CD built from the i386 main,
   contrib and non-free sections of unstable. The lists are only filled
   in after the configuration files are read, so a list block in a file
   replaces the default instead of being appended to it. Options given
   on the command line are parsed later and override everything here. */
bool partialInitConfig(Configuration &Cnf)
{
   Cnf.CndSet("Dir::Etc", CONF_DIR);
   Cnf.CndSet("Dir::Etc::main", "debpartial.conf");

   bool Res = true;

   // Read an alternate config file
   const char *Cfg = getenv("DEBPARTIAL_CONFIG");
   if (Cfg != 0 && strlen(Cfg) != 0)
   {
      if (RealFileExists(Cfg) == true)
	 Res &= ReadConfigFile(Cnf,Cfg);
      else
	 _error->WarningE("RealFileExists","Unable to read %s",Cfg);
   }

   // Read the main config file
   std::string FName = Cnf.Find("Dir::Etc::main");
   if (FName.empty() == false && FName[0] != '/')
      FName = flCombine(Cnf.Find("Dir::Etc"), FName);
   if (FName.empty() == false && RealFileExists(FName) == true)
      Res &= ReadConfigFile(Cnf,FName);

   if (Res == false)
      return false;

   // What to read from the archive
   if (Cnf.Exists("Partial::Dist") == false)
      Cnf.Set("Partial::Dist", "unstable");
   if (Cnf.Exists("Partial::Section") == false)
      Cnf.Set("Partial::Section", "main,contrib,non-free");
   if (Cnf.Exists("Partial::Arch") == false)
      Cnf.Set("Partial::Arch", "i386");
   Cnf.CndSet("Partial::Source", true);

   // How to cut it
   if (Cnf.Exists("Partial::Size") == false)
      Cnf.Set("Partial::Size", "CD74");
   Cnf.CndSet("Partial::Limit", 0);
   Cnf.CndSet("Partial::Merge-Source", false);
   Cnf.CndSet("Partial::Ignore-Large", false);

   // Where to write it
   Cnf.CndSet("Partial::DirPrefix", "Debian");
   Cnf.CndSet("Partial::Compress", "gzip");

   Cnf.CndSet("Partial::Copy::Symlink", false);

   if (Cnf.FindB("Debug::partialInitConfig",false) == true)
      Cnf.Dump();

   return true;
}
									/*}}}*/
