// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities - Index files and the directories holding them

   FileFd streams a file start to end, optionally through one of the
   compressors of Partial::Configuration::getCompressors(). There is no
   seeking: indices are parsed in one pass and written in one pass.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_FILEUTL_H
#define PARTLIB_FILEUTL_H

#include <partial-pkg/macros.h>
#include <partial-pkg/partialconfiguration.h>

#include <string>

class FileFdPrivate;
class PARTIAL_PUBLIC FileFd
{
   int iFd;
   enum LocalFlags {Fail = (1<<0), DelOnFail = (1<<1), HitEof = (1<<2),
                    Replace = (1<<3), Compressed = (1<<4), WriteMode = (1<<5)};
   unsigned long Flags;
   std::string FileName;
   std::string TemporaryFileName;
   FileFdPrivate *d;

   public:
   enum OpenMode {
	ReadOnly = (1 << 0),
	WriteOnly = (1 << 1),
	Create = (1 << 2),
	Empty = (1 << 3),
	/** written to a temporary file which replaces FileName on Close() */
	Atomic = (1 << 4),

	WriteEmpty = WriteOnly | Create | Empty,
	WriteAtomic = WriteOnly | Create | Atomic
   };
   enum CompressMode
   {
      /** FileName as is, uncompressed */
      None = 'N',
      /** FileName or the first FileName + compressor extension that exists */
      Auto = 'A',
      /** the compressor is chosen by the extension of FileName */
      Extension = 'E'
   };

   /** \brief read Size bytes
    *
    *  With Actual a short read marks the end of the file, without it
    *  a short read is an error. */
   bool Read(void *To,unsigned long long Size,unsigned long long *Actual = 0);
   /** \brief read the next line without its newline
    *
    *  At the end of the file the rest is returned and Eof() turns true.
    */
   bool ReadLine(std::string &To);
   bool Write(const void *From,unsigned long long Size);
   static bool Write(int Fd, const void *From, unsigned long long Size);

   bool Open(std::string FileName,unsigned int const Mode,CompressMode Compress,unsigned long const AccessMode = 0666);
   bool Open(std::string FileName,unsigned int const Mode,Partial::Configuration::Compressor const &compressor,unsigned long const AccessMode = 0666);
   inline bool Open(std::string const &FileName,unsigned int const Mode, unsigned long const AccessMode = 0666) {
      return Open(FileName, Mode, None, AccessMode);
   };
   /** \brief finish the file
    *
    *  A failed file opened with WriteAtomic or after EraseOnFailure()
    *  is removed instead of being put into place. */
   bool Close();

   inline bool IsOpen() const {return iFd >= 0;};
   inline bool Failed() const {return (Flags & Fail) == Fail;};
   inline void EraseOnFailure() {Flags |= DelOnFail;};
   inline void OpFail() {Flags |= Fail;};
   inline bool Eof() const {return (Flags & HitEof) == HitEof;};
   inline bool IsCompressed() const {return (Flags & Compressed) == Compressed;};
   inline std::string &Name() {return FileName;};

   FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode = 0666);
   FileFd();
   virtual ~FileFd();

   private:
   FileFd(const FileFd &) = delete;
   FileFd & operator=(const FileFd &) = delete;

   PARTIAL_HIDDEN bool FileFdErrno(const char* Function, const char* Description,...) PARTIAL_PRINTF(3) PARTIAL_COLD;
   PARTIAL_HIDDEN bool FileFdError(const char* Description,...) PARTIAL_PRINTF(2) PARTIAL_COLD;
   PARTIAL_HIDDEN bool BackendError(char const * const Operation);
};

PARTIAL_PUBLIC bool CopyFile(FileFd &From,FileFd &To);
PARTIAL_PUBLIC bool RemoveFile(char const * const Function, std::string const &FileName);
/** \brief true for anything stat() finds, directories included */
PARTIAL_PUBLIC bool FileExists(std::string const &File);
PARTIAL_PUBLIC bool RealFileExists(std::string const &File);
PARTIAL_PUBLIC bool DirectoryExists(std::string const &Path);
/** \brief create Path and all its parents below the existing Parent */
PARTIAL_PUBLIC bool CreateDirectory(std::string const &Parent, std::string const &Path);

PARTIAL_PUBLIC std::string flNotDir(std::string File);
/** \brief the directory part of File, ending in a slash */
PARTIAL_PUBLIC std::string flNotFile(std::string File);
PARTIAL_PUBLIC std::string flCombine(std::string Dir,std::string File);
/** \brief realpath() of File, empty with an error if it doesn't exist */
PARTIAL_PUBLIC std::string flAbsPath(std::string File);

#endif
