// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - option parser feeding the Configuration tree

   A table of Args maps the short and long spelling of every option to
   the configuration item it sets, the words left over after parsing
   end up in FileList. The table is terminated by an all-zero entry:

     CommandLine::Args Args[] = {
	{'S', "size", "Partial::Size", CommandLine::HasArg},
	{'q', "quiet", "quiet", CommandLine::IntLevel},
	{0, 0, 0, 0}};

   Options without flags are booleans. They accept an explicit sense
   after a '=' or in the following word (-m=no, -m false) and a prefix
   on the long form (--no-merge-source). InvBoolean flips the sense of
   the bare option.

   A configuration name ending in "::" adds a list item per use of
   the option instead of replacing the value.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_CMNDLINE_H
#define PARTLIB_CMNDLINE_H

#include <partial-pkg/macros.h>

#include <vector>

class Configuration;

class PARTIAL_PUBLIC CommandLine
{
   public:
   struct Args;

   enum AFlags
   {
      HasArg = (1 << 0),
      /** -q, -qq, -q=2 */
      IntLevel = (1 << 1),
      Boolean = (1 << 2),
      InvBoolean = (1 << 3),
      /** the argument names a configuration file which is read right away */
      ConfigFile = (1 << 4) | HasArg,
      /** the argument is an item=value pair for the configuration */
      ArbItem = (1 << 5) | HasArg
   };

   std::vector<const char *> FileList;

   bool Parse(int argc,const char **argv);
   unsigned int FileSize() const { return FileList.size(); }

   static CommandLine::Args MakeArgs(char ShortOpt, char const *LongOpt,
	 char const *ConfName, unsigned long Flags) PARTIAL_PURE;

   CommandLine(CommandLine const &) = delete;
   CommandLine &operator=(CommandLine const &) = delete;
   CommandLine &operator=(CommandLine &&) = default;

   CommandLine();
   CommandLine(Args *AList,Configuration *Conf);

   private:
   Args *ArgList;
   Configuration *Conf;

   Args const *FindShort(char const Opt) const;
   Args const *FindLong(char const *Begin, char const *End) const;
   bool ParseShort(int &I,int argc,const char **argv);
   bool ParseLong(int &I,int argc,const char **argv);
   bool HandleOpt(Args const *A,const char *Value,bool CanTakeNext,
		  int &I,int argc,const char **argv);
};

struct CommandLine::Args
{
   char ShortOpt;
   const char *LongOpt;
   const char *ConfName;
   unsigned long Flags;

   inline bool end() const {return ShortOpt == 0 && LongOpt == 0;};
   inline bool IsBoolean() const {return Flags == 0 || (Flags & (Boolean|InvBoolean)) != 0;};
};

#endif
