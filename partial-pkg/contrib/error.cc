// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - One message list for the whole run

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/error.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
									/*}}}*/

GlobalError *_GetErrorObj()
{
   static GlobalError Obj;
   return &Obj;
}
GlobalError::GlobalError() : PendingFlag(false) {}

static std::string FormatMessage(const char *Description, va_list args)	/*{{{*/
{
   va_list sizing;
   va_copy(sizing, args);
   int const len = vsnprintf(nullptr, 0, Description, sizing);
   va_end(sizing);
   if (len <= 0)
      return std::string();
   std::vector<char> buf(len + 1);
   vsnprintf(buf.data(), buf.size(), Description, args);
   return std::string(buf.data(), len);
}
									/*}}}*/
// GlobalError::Add - Append a formatted message			/*{{{*/
bool GlobalError::Add(MsgType type, std::string &&Text)
{
   Messages.push_back(Item{std::move(Text), type});
   if (type >= ERROR)
      PendingFlag = true;
   if (type == FATAL || type == DEBUG)
   {
      Print(std::clog, Messages.back());
      std::clog << std::endl;
   }
   return false;
}
									/*}}}*/
bool GlobalError::Insert(MsgType type, const char *Description, va_list args)
{
   return Add(type, FormatMessage(Description, args));
}
bool GlobalError::InsertErrno(MsgType type, const char *Function, const char *Description,
			      va_list args, int const errsv)
{
   std::string Text = FormatMessage(Description, args);
   Text.append(" - ").append(Function);
   Text.append(" (").append(std::to_string(errsv)).append(": ").append(strerror(errsv)).append(")");
   return Add(type, std::move(Text));
}

// The public entry points only collect their varargs			/*{{{*/
#define ERRNO_ENTRY(NAME, TYPE) \
bool GlobalError::NAME(const char *Function, const char *Description, ...) \
{ \
   int const errsv = errno; \
   va_list args; \
   va_start(args, Description); \
   InsertErrno(TYPE, Function, Description, args, errsv); \
   va_end(args); \
   return false; \
}
ERRNO_ENTRY(FatalE, FATAL)
ERRNO_ENTRY(Errno, ERROR)
ERRNO_ENTRY(WarningE, WARNING)
#undef ERRNO_ENTRY

#define PLAIN_ENTRY(NAME, TYPE) \
bool GlobalError::NAME(const char *Description, ...) \
{ \
   va_list args; \
   va_start(args, Description); \
   Insert(TYPE, Description, args); \
   va_end(args); \
   return false; \
}
PLAIN_ENTRY(Fatal, FATAL)
PLAIN_ENTRY(Error, ERROR)
PLAIN_ENTRY(Warning, WARNING)
PLAIN_ENTRY(Notice, NOTICE)
PLAIN_ENTRY(Debug, DEBUG)
#undef PLAIN_ENTRY
									/*}}}*/
bool GlobalError::PopMessage(std::string &Text)				/*{{{*/
{
   if (Messages.empty() == true)
      return false;

   Item const First = Messages.front();
   Messages.erase(Messages.begin());
   Text = First.Text;

   PendingFlag = std::any_of(Messages.begin(), Messages.end(),
	 [](Item const &I) { return I.Type >= ERROR; });
   return First.Type >= ERROR;
}
									/*}}}*/
void GlobalError::DumpErrors(std::ostream &out, MsgType const &threshold)
{
   for (auto const &I : Messages)
   {
      if (I.Type < threshold)
	 continue;
      Print(out, I);
      out << std::endl;
   }
   Discard();
}
void GlobalError::Discard()
{
   Messages.clear();
   PendingFlag = false;
}
bool GlobalError::empty(MsgType const &threshold) const
{
   if (PendingFlag == true)
      return false;
   for (auto const &I : Messages)
      if (I.Type >= threshold)
	 return false;
   return true;
}
// GlobalError::Print - "E: text" with continuation lines indented	/*{{{*/
void GlobalError::Print(std::ostream &out, Item const &I)
{
   char Prefix = 'D';
   if (I.Type >= ERROR)
      Prefix = 'E';
   else if (I.Type == WARNING)
      Prefix = 'W';
   else if (I.Type == NOTICE)
      Prefix = 'N';
   out << Prefix << ": ";

   std::string::size_type Start = 0;
   for (std::string::size_type NL = I.Text.find('\n'); NL != std::string::npos;
	NL = I.Text.find('\n', Start))
   {
      out.write(I.Text.data() + Start, NL - Start);
      out << '\n' << "   ";
      Start = NL + 1;
   }
   out << I.Text.c_str() + Start;
}
									/*}}}*/
