// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   String Util - Small helpers for the parsers of index and config files

   Everything in here works on ASCII only, the locale is never asked.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_STRUTL_H
#define PARTLIB_STRUTL_H

#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "macros.h"

namespace Partial {
   namespace String {
      /** \brief s without leading and trailing whitespace */
      PARTIAL_PUBLIC std::string Strip(const std::string &s);
      PARTIAL_PUBLIC std::string Join(std::vector<std::string> const &list, const std::string &sep);
   }
}

/** \brief yes/no, true/false, on/off, ... and 1/0 as a boolean
 *
 *  \return 1 or 0, or Default if Text is none of these */
PARTIAL_PUBLIC int StringToBool(const std::string &Text,int Default = -1);
/** \brief parse the first Len characters of Str as a number */
PARTIAL_PUBLIC bool StrToNum(const char *Str,unsigned long long &Res,unsigned Len,unsigned Base = 0);
/** \brief true if the string is non-empty and made only of the digits 0-9 */
PARTIAL_PUBLIC bool IsDigitString(std::string_view const Str) PARTIAL_PURE;

/** \brief split haystack at every split character
 *
 *  A trailing separator doesn't add an empty element. */
PARTIAL_PUBLIC std::vector<std::string> VectorizeString(std::string const &haystack, char const &split) PARTIAL_PURE;

PARTIAL_PUBLIC void ioprintf(std::ostream &out,const char *format,...) PARTIAL_PRINTF(2);
PARTIAL_PUBLIC void strprintf(std::string &out,const char *format,...) PARTIAL_PRINTF(2);

PARTIAL_PURE static inline int tolower_ascii(int const c)
{
   if (c >= 'A' && c <= 'Z')
      return c - 'A' + 'a';
   return c;
}
PARTIAL_PURE static inline int isspace_ascii(int const c)
{
   return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

PARTIAL_PUBLIC int PARTIAL_PURE stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd);
inline PARTIAL_PURE int stringcasecmp(const std::string& A,const char *B) {return stringcasecmp(A.data(),A.data()+A.size(),B,B+strlen(B));}
inline PARTIAL_PURE int stringcasecmp(const std::string& A,const std::string& B) {return stringcasecmp(A.data(),A.data()+A.size(),B.data(),B.data()+B.size());}
inline PARTIAL_PURE int stringcasecmp(const std::string& A,const char *B,const char *BEnd) {return stringcasecmp(A.data(),A.data()+A.size(),B,BEnd);}

#endif
