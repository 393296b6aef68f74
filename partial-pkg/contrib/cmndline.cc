// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - option parser feeding the Configuration tree

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <partial-pkg/cmndline.h>
#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/strutl.h>

#include <stdlib.h>
#include <string.h>
#include <string>
									/*}}}*/

CommandLine::CommandLine(Args *AList,Configuration *Conf) : ArgList(AList), Conf(Conf)
{
}
CommandLine::CommandLine() : ArgList(nullptr), Conf(nullptr)
{
}
CommandLine::Args const *CommandLine::FindShort(char const Opt) const
{
   for (Args const *A = ArgList; A->end() == false; ++A)
      if (A->ShortOpt == Opt)
	 return A;
   return nullptr;
}
CommandLine::Args const *CommandLine::FindLong(char const *Begin, char const *End) const
{
   for (Args const *A = ArgList; A->end() == false; ++A)
      if (A->LongOpt != nullptr && stringcasecmp(Begin, End, A->LongOpt, A->LongOpt + strlen(A->LongOpt)) == 0)
	 return A;
   return nullptr;
}
// CommandLine::Parse - Sort argv into options and file names		/*{{{*/
bool CommandLine::Parse(int argc,const char **argv)
{
   FileList.clear();
   for (int I = 1; I < argc; ++I)
   {
      const char * const Word = argv[I];
      if (Word[0] != '-' || Word[1] == '\0')
	 FileList.push_back(Word);
      else if (strcmp(Word, "--") == 0)
      {
	 FileList.insert(FileList.end(), argv + I + 1, argv + argc);
	 break;
      }
      else if (Word[1] != '-')
      {
	 if (ParseShort(I, argc, argv) == false)
	    return false;
      }
      else if (ParseLong(I, argc, argv) == false)
	 return false;
   }
   return true;
}
									/*}}}*/
// CommandLine::ParseShort - a group of letters like -mI or -S=DVD	/*{{{*/
bool CommandLine::ParseShort(int &I,int argc,const char **argv)
{
   const char * const Word = argv[I];
   for (const char *C = Word + 1; *C != '\0'; ++C)
   {
      Args const * const A = FindShort(*C);
      if (A == nullptr)
	 return _error->Error("Command line option '%c' [from %s] is not understood in combination with the other options.", *C, Word);

      const char * const Rest = C + 1;
      const char *Value = nullptr;
      if (*Rest == '=')
	 Value = Rest + 1;
      else if (*Rest != '\0' && ((A->Flags & HasArg) == HasArg ||
	       ((A->Flags & IntLevel) == IntLevel && *Rest >= '0' && *Rest <= '9')))
	 Value = Rest;

      if (HandleOpt(A, Value, *Rest == '\0', I, argc, argv) == false)
	 return false;
      // the rest of the word was the value
      if (Value != nullptr)
	 break;
   }
   return true;
}
									/*}}}*/
// CommandLine::ParseLong - --name, --name=value and --no-name		/*{{{*/
bool CommandLine::ParseLong(int &I,int argc,const char **argv)
{
   const char * const Word = argv[I];
   const char * const Name = Word + 2;
   const char * const Equal = strchrnul(Name, '=');
   const char * const Value = (*Equal == '=') ? Equal + 1 : nullptr;

   Args const *A = FindLong(Name, Equal);
   if (A != nullptr)
      return HandleOpt(A, Value, Value == nullptr, I, argc, argv);

   // a sense prefix like no- or enable- in front of a boolean
   const char * const Dash = static_cast<const char *>(memchr(Name, '-', Equal - Name));
   if (Dash != nullptr)
   {
      A = FindLong(Dash + 1, Equal);
      if (A == nullptr && Equal - Dash == 2)
	 A = FindShort(Dash[1]);
   }
   if (A == nullptr)
      return _error->Error("Command line option %s is not understood in combination with the other options", Word);
   if (A->IsBoolean() == false)
      return _error->Error("Command line option %s is not boolean", Word);

   std::string const Prefix(Name, Dash);
   int const Sense = StringToBool(Prefix);
   if (Sense == -1)
      return _error->Error("Sense %s is not understood, try true or false.", Prefix.c_str());
   Conf->Set(A->ConfName, Sense);
   return true;
}
									/*}}}*/
// CommandLine::HandleOpt - Store one option in the configuration	/*{{{*/
// ---------------------------------------------------------------------
/* Value is the text attached to the option. Without it the following
   word may be taken if CanTakeNext allows it and it isn't an option. */
bool CommandLine::HandleOpt(Args const *A,const char *Value,bool CanTakeNext,
			    int &I,int argc,const char **argv)
{
   const char * const Word = argv[I];
   const char *Next = nullptr;
   if (Value == nullptr && CanTakeNext == true && I + 1 < argc && argv[I + 1][0] != '-')
      Next = argv[I + 1];

   if ((A->Flags & HasArg) == HasArg)
   {
      if (Value == nullptr)
      {
	 if (Next == nullptr)
	    return _error->Error("Option %s requires an argument.", Word);
	 Value = Next;
	 ++I;
      }
      if ((A->Flags & ConfigFile) == ConfigFile)
	 return ReadConfigFile(*Conf, Value);
      if ((A->Flags & ArbItem) == ArbItem)
      {
	 const char * const Equal = strchr(Value, '=');
	 if (Equal == nullptr)
	    return _error->Error("Option %s: Configuration item specification must have an =<val>.", Word);
	 Conf->Set(std::string(Value, Equal), Equal + 1);
	 return true;
      }
      Conf->Set(A->ConfName, Value);
      return true;
   }

   if ((A->Flags & IntLevel) == IntLevel)
   {
      if (Value == nullptr && Next != nullptr && IsDigitString(Next) == true)
      {
	 Value = Next;
	 ++I;
      }
      if (Value == nullptr)
      {
	 Conf->Set(A->ConfName, Conf->FindI(A->ConfName) + 1);
	 return true;
      }
      if (IsDigitString(Value) == false)
	 return _error->Error("Option %s requires an integer argument, not '%s'", Word, Value);
      Conf->Set(A->ConfName, atoi(Value));
      return true;
   }

   int Sense = -1;
   if (Value != nullptr)
   {
      Sense = StringToBool(Value);
      if (Sense == -1)
	 return _error->Error("Sense %s is not understood, try true or false.", Value);
   }
   else if (Next != nullptr && (Sense = StringToBool(Next)) != -1)
      ++I;
   if (Sense == -1)
      Sense = ((A->Flags & InvBoolean) == InvBoolean) ? 0 : 1;
   Conf->Set(A->ConfName, Sense);
   return true;
}
									/*}}}*/
CommandLine::Args CommandLine::MakeArgs(char ShortOpt, char const *LongOpt, char const *ConfName, unsigned long Flags)
{
   return CommandLine::Args{ShortOpt, LongOpt, ConfName, Flags};
}
