// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Stanza reader for Packages and Sources indices

   The file is read in chunks into a growing buffer. A stanza is only
   handed out once its terminating blank line is inside the buffer, so
   the section pointers stay valid until the next Step.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/strutl.h>
#include <partial-pkg/tagfile.h>

#include <string>
#include <string_view>

#include <errno.h>
#include <stdlib.h>
#include <string.h>
									/*}}}*/

// TagSection::pkgTagSection - Constructor				/*{{{*/
pkgTagSection::pkgTagSection()
{
   memset(Buckets, 0, sizeof(Buckets));
}
									/*}}}*/
// TagSection::Bucket - Case-insensitive hash of a tag			/*{{{*/
unsigned int pkgTagSection::Bucket(std::string_view const Tag)
{
   unsigned int Hash = 5381;
   for (char const C : Tag)
      Hash = (Hash * 33) ^ static_cast<unsigned char>(tolower_ascii(C));
   return Hash % BucketCount;
}
									/*}}}*/
// TagSection::Scan - Index the fields of one stanza			/*{{{*/
bool pkgTagSection::Scan(const char *Start, unsigned long MaxLength, bool const Restart)
{
   if (Restart == true)
   {
      Fields.clear();
      memset(Buckets, 0, sizeof(Buckets));
      Resume = 0;
   }
   Section = Start;
   Stop = 0;

   unsigned long Pos = Resume;
   while (Pos < MaxLength)
   {
      const char * const Line = Start + Pos;
      const char * const NL = static_cast<const char *>(memchr(Line, '\n', MaxLength - Pos));
      if (NL == nullptr)
	 break;

      if (NL == Line)
      {
	 Resume = Pos;
	 Stop = Pos + 1;
	 return true;
      }

      // Continuation lines belong to the value of the previous field
      const char * const Colon = (*Line == ' ' || *Line == '\t') ? nullptr :
	 static_cast<const char *>(memchr(Line, ':', NL - Line));
      if (Colon != nullptr)
      {
	 const char *TagEnd = Colon;
	 for (; TagEnd != Line && isspace_ascii(TagEnd[-1]) != 0; --TagEnd);

	 Field F;
	 F.TagStart = Pos;
	 F.TagEnd = TagEnd - Start;
	 F.ValueStart = Colon + 1 - Start;
	 unsigned int const B = Bucket(std::string_view(Line, TagEnd - Line));
	 F.Chain = Buckets[B];
	 Fields.push_back(F);
	 Buckets[B] = Fields.size();
      }
      Pos = NL + 1 - Start;
   }

   Resume = Pos;
   return false;
}
									/*}}}*/
// TagSection::Lookup - Find the newest field with this tag		/*{{{*/
bool pkgTagSection::Lookup(std::string_view const Tag, unsigned int &Idx) const
{
   for (unsigned int I = Buckets[Bucket(Tag)]; I != 0; I = Fields[I - 1].Chain)
   {
      Field const &F = Fields[I - 1];
      if (F.TagEnd - F.TagStart != Tag.size())
	 continue;
      if (stringcasecmp(Section + F.TagStart, Section + F.TagEnd,
		        Tag.data(), Tag.data() + Tag.size()) != 0)
	 continue;
      Idx = I - 1;
      return true;
   }
   return false;
}
									/*}}}*/
// TagSection::Value - Trimmed value of a field				/*{{{*/
std::string_view pkgTagSection::Value(unsigned int const Idx) const
{
   unsigned long End;
   if (Idx + 1 < Fields.size())
      End = Fields[Idx + 1].TagStart;
   else
      End = (Stop != 0) ? Stop - 1 : Resume;

   const char *B = Section + Fields[Idx].ValueStart;
   const char *E = Section + End;
   for (; B < E && isspace_ascii(*B) != 0; ++B);
   for (; E > B && isspace_ascii(E[-1]) != 0; --E);
   return std::string_view(B, E - B);
}
									/*}}}*/
std::string_view pkgTagSection::Find(std::string_view const Tag) const	/*{{{*/
{
   unsigned int Idx;
   if (Lookup(Tag, Idx) == false)
      return std::string_view();
   return Value(Idx);
}
									/*}}}*/
bool pkgTagSection::Exists(std::string_view const Tag) const		/*{{{*/
{
   unsigned int Idx;
   return Lookup(Tag, Idx);
}
									/*}}}*/
// TagSection::FindULL - Leading decimal number of a value		/*{{{*/
unsigned long long pkgTagSection::FindULL(std::string_view const Tag, unsigned long long const &Default) const
{
   std::string_view const V = Find(Tag);
   if (V.empty() == true || V[0] < '0' || V[0] > '9')
      return Default;

   std::string const S(V);
   char *End;
   errno = 0;
   unsigned long long const Res = strtoull(S.c_str(), &End, 10);
   if (errno != 0)
      return Default;
   return Res;
}
									/*}}}*/
std::string pkgTagSection::Raw() const					/*{{{*/
{
   if (Stop < 2)
      return std::string();
   return std::string(Section, Stop - 1);
}
									/*}}}*/

// TagFile::pkgTagFile - Constructor					/*{{{*/
pkgTagFile::pkgTagFile(FileFd * const F, unsigned long long const Size) : Fd(F)
{
   Buffer.resize(Size < 2 ? 2 : Size);
   if (Fd == nullptr || Fd->IsOpen() == false || Fd->Failed() == true)
   {
      Done = true;
      _error->Error("Unable to read index file %s", Fd == nullptr ? "" : Fd->Name().c_str());
   }
}
									/*}}}*/
// TagFile::Fill - Append the next chunk of the file to the buffer	/*{{{*/
/* At the end of the file two newlines are added so the last stanza is
   terminated even if the file ends without one. */
bool pkgTagFile::Fill()
{
   if (Start != 0)
   {
      memmove(Buffer.data(), Buffer.data() + Start, End - Start);
      End -= Start;
      Start = 0;
   }
   if (End + 2 > Buffer.size())
      Buffer.resize(Buffer.size() * 2);

   unsigned long long Actual = 0;
   if (Fd->Read(Buffer.data() + End, Buffer.size() - End, &Actual) == false)
   {
      Done = true;
      return false;
   }
   End += Actual;

   if (Actual == 0)
   {
      Done = true;
      if (End + 2 > Buffer.size())
	 Buffer.resize(End + 2);
      Buffer[End++] = '\n';
      Buffer[End++] = '\n';
   }
   return true;
}
									/*}}}*/
// TagFile::Step - Advance to the next stanza				/*{{{*/
bool pkgTagFile::Step(pkgTagSection &Section)
{
   bool Continue = false;
   while (true)
   {
      if (Continue == false)
	 for (; Start < End && (Buffer[Start] == '\n' || Buffer[Start] == '\r'); ++Start);

      if (Start < End)
      {
	 if (Section.Scan(Buffer.data() + Start, End - Start, Continue == false) == true)
	 {
	    Start += Section.size();
	    return true;
	 }
	 Continue = true;
      }

      if (Done == true)
      {
	 if (Continue == true)
	    return _error->Error("Unable to parse index file %s", Fd->Name().c_str());
	 return false;
      }
      if (Fill() == false)
	 return false;
   }
}
									/*}}}*/
