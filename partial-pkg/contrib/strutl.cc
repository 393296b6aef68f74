// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   String Util - Helpers shared by the tag file, configuration and
   command line parsers.

   ##################################################################### */
									/*}}}*/
// Includes								/*{{{*/
#include <config.h>

#include <partial-pkg/strutl.h>

#include <algorithm>
#include <string>
#include <vector>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
									/*}}}*/

namespace Partial {
namespace String {

std::string Strip(const std::string &s)
{
   auto const first = std::find_if_not(s.begin(), s.end(), isspace_ascii);
   if (first == s.end())
      return std::string();
   auto const last = std::find_if_not(s.rbegin(), s.rend(), isspace_ascii).base();
   return std::string(first, last);
}

std::string Join(std::vector<std::string> const &list, const std::string &sep)
{
   std::string joined;
   for (size_t i = 0; i < list.size(); ++i)
   {
      if (i != 0)
	 joined.append(sep);
      joined.append(list[i]);
   }
   return joined;
}

}
}

// stringcasecmp - ASCII case insensitive compare of two ranges		/*{{{*/
int stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd)
{
   while (A != AEnd && B != BEnd)
   {
      int const a = tolower_ascii(static_cast<unsigned char>(*A));
      int const b = tolower_ascii(static_cast<unsigned char>(*B));
      if (a != b)
	 return a < b ? -1 : 1;
      ++A;
      ++B;
   }
   if (A != AEnd)
      return 1;
   if (B != BEnd)
      return -1;
   return 0;
}
									/*}}}*/
// StringToBool - Map the usual spellings of a switch to 0 and 1	/*{{{*/
int StringToBool(const std::string &Text,int Default)
{
   if (Text.empty() == false && IsDigitString(Text) == true)
   {
      unsigned long long const Value = strtoull(Text.c_str(), nullptr, 10);
      if (Value <= 1)
	 return static_cast<int>(Value);
      return Default;
   }

   static char const * const Words[][2] = {
      {"no", "yes"}, {"false", "true"}, {"without", "with"},
      {"off", "on"}, {"disable", "enable"}
   };
   for (auto const &Pair : Words)
   {
      if (stringcasecmp(Text, Pair[0]) == 0)
	 return 0;
      if (stringcasecmp(Text, Pair[1]) == 0)
	 return 1;
   }
   return Default;
}
									/*}}}*/
// StrToNum - Numeric value of a fixed width field			/*{{{*/
// ---------------------------------------------------------------------
/* A field of only blanks is zero, trailing garbage is not allowed. */
bool StrToNum(const char *Str,unsigned long long &Res,unsigned Len,unsigned Base)
{
   if (Len >= 30)
      return false;
   std::string const Field(Str, strnlen(Str, Len));
   if (std::all_of(Field.begin(), Field.end(), isspace_ascii) == true)
   {
      Res = 0;
      return true;
   }

   char *End = nullptr;
   Res = strtoull(Field.c_str(), &End, Base);
   if (End == Field.c_str())
      return false;
   while (*End != '\0')
   {
      if (isspace_ascii(*End) == 0)
	 return false;
      ++End;
   }
   return true;
}
									/*}}}*/
bool IsDigitString(std::string_view const Str)
{
   if (Str.empty() == true)
      return false;
   return std::all_of(Str.begin(), Str.end(), [](char const c) { return c >= '0' && c <= '9'; });
}
// VectorizeString - Split at each occurrence of split			/*{{{*/
std::vector<std::string> VectorizeString(std::string const &haystack, char const &split)
{
   std::vector<std::string> Parts;
   if (haystack.empty() == true)
      return Parts;

   std::string::size_type Start = 0;
   while (true)
   {
      std::string::size_type const Pos = haystack.find(split, Start);
      if (Pos == std::string::npos)
      {
	 Parts.emplace_back(haystack, Start);
	 break;
      }
      Parts.emplace_back(haystack, Start, Pos - Start);
      if (Pos + 1 == haystack.length())
	 break;
      Start = Pos + 1;
   }
   return Parts;
}
									/*}}}*/
// ioprintf/strprintf - printf into a stream or a string		/*{{{*/
static std::string vformat(const char *format, va_list args)
{
   va_list copy;
   va_copy(copy, args);
   int const needed = vsnprintf(nullptr, 0, format, copy);
   va_end(copy);
   if (needed <= 0)
      return std::string();

   std::string out(static_cast<size_t>(needed) + 1, '\0');
   vsnprintf(&out[0], out.size(), format, args);
   out.resize(needed);
   return out;
}
void ioprintf(std::ostream &out,const char *format,...)
{
   va_list args;
   va_start(args, format);
   out << vformat(format, args);
   va_end(args);
}
void strprintf(std::string &out,const char *format,...)
{
   va_list args;
   va_start(args, format);
   out = vformat(format, args);
   va_end(args);
}
									/*}}}*/
