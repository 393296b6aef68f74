// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Stanza reader for Packages and Sources indices

   Both index kinds are deb822 files: groups of "Tag: value" lines
   separated by a blank line, with continuation lines starting in
   whitespace. pkgTagFile streams such a file once, front to back, and
   hands each stanza to a pkgTagSection which records where every field
   starts so the lookups afterwards do not rescan the text.

   Comments are not supported.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_TAGFILE_H
#define PARTLIB_TAGFILE_H

#include <partial-pkg/macros.h>

#include <string>
#include <string_view>
#include <vector>

class FileFd;

class PARTIAL_PUBLIC pkgTagSection
{
   struct Field
   {
      unsigned long TagStart;
      unsigned long TagEnd;
      unsigned long ValueStart;
      // previous field with the same bucket, 0 ends the chain
      unsigned int Chain;
   };
   static constexpr unsigned int BucketCount = 64;

   const char *Section = nullptr;
   unsigned long Stop = 0;
   unsigned long Resume = 0;
   std::vector<Field> Fields;
   // index+1 of the newest field per bucket
   unsigned int Buckets[BucketCount];

   static unsigned int Bucket(std::string_view Tag);
   bool Lookup(std::string_view Tag, unsigned int &Idx) const;
   std::string_view Value(unsigned int Idx) const;

   public:
   /** \brief indexes the stanza starting at Start
    *
    * The stanza ends at the first empty line. If that line is not
    * within MaxLength bytes false is returned and the fields seen so
    * far are kept: calling again with Restart disabled on the same
    * (now longer) data continues after the last complete line.
    */
   [[nodiscard]] bool Scan(const char *Start, unsigned long MaxLength, bool const Restart = true);

   std::string_view Find(std::string_view Tag) const;
   std::string FindS(std::string_view Tag) const { return std::string{Find(Tag)}; }
   unsigned long long FindULL(std::string_view Tag, unsigned long long const &Default = 0) const;
   bool Exists(std::string_view Tag) const;

   /** \brief number of fields, a repeated tag counts every time */
   unsigned int Count() const { return Fields.size(); }
   /** \brief bytes consumed by the stanza including its blank line */
   unsigned long size() const { return Stop; }
   /** \brief the stanza text, ending in a single newline */
   std::string Raw() const;

   pkgTagSection();
};

class PARTIAL_PUBLIC pkgTagFile
{
   FileFd *Fd;
   std::vector<char> Buffer;
   unsigned long Start = 0;
   unsigned long End = 0;
   bool Done = false;

   bool Fill();

   public:
   bool Step(pkgTagSection &Section);

   explicit pkgTagFile(FileFd *F, unsigned long long Size = 32*1024);
};

#endif
