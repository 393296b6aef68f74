// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities - Index files and the directories holding them

   Every FileFd owns a FileFdPrivate which moves the bytes: directly on
   the descriptor or through one of the compression libraries. The
   backends only know how to read, write and finish a stream; partial
   reads, EINTR, line splitting and the atomic replace are handled once
   in FileFd itself.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/macros.h>
#include <partial-pkg/partialconfiguration.h>
#include <partial-pkg/strutl.h>

#include <algorithm>
#include <cstdarg>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef HAVE_ZLIB
	#include <zlib.h>
#endif
#ifdef HAVE_BZ2
	#include <bzlib.h>
#endif
#ifdef HAVE_LZMA
	#include <lzma.h>
#endif
#ifdef HAVE_LZ4
	#include <lz4frame.h>
#endif
									/*}}}*/

using std::string;

// Filesystem helpers							/*{{{*/
bool CopyFile(FileFd &From,FileFd &To)
{
   if (From.IsOpen() == false || To.IsOpen() == false ||
	 From.Failed() == true || To.Failed() == true)
      return false;

   std::vector<char> Buf(PARTIAL_BUFFER_SIZE);
   while (true)
   {
      unsigned long long Got = 0;
      if (From.Read(Buf.data(), Buf.size(), &Got) == false)
	 return false;
      if (Got == 0)
	 return true;
      if (To.Write(Buf.data(), Got) == false)
	 return false;
   }
}
bool RemoveFile(char const * const Function, std::string const &FileName)
{
   if (FileName == "/dev/null" || unlink(FileName.c_str()) == 0 || errno == ENOENT)
      return true;
   return _error->WarningE(Function, "Problem unlinking the file %s", FileName.c_str());
}
static bool StatMode(string const &File, mode_t &Mode)
{
   struct stat Buf;
   if (stat(File.c_str(), &Buf) != 0)
      return false;
   Mode = Buf.st_mode;
   return true;
}
bool FileExists(string const &File)
{
   mode_t Mode;
   return StatMode(File, Mode);
}
bool RealFileExists(string const &File)
{
   mode_t Mode;
   return StatMode(File, Mode) == true && S_ISREG(Mode);
}
bool DirectoryExists(string const &Path)
{
   mode_t Mode;
   return StatMode(Path, Mode) == true && S_ISDIR(Mode);
}
									/*}}}*/
// CreateDirectory - mkdir -p, but never above Parent			/*{{{*/
// ---------------------------------------------------------------------
/* Parent has to exist and has to be a prefix of Path, so a mistyped
   destination can't scatter directories over the filesystem. */
bool CreateDirectory(string const &Parent, string const &Path)
{
   if (Parent.empty() == true || Path.empty() == true)
      return _error->Error("Can't create an unnamed directory");
   if (DirectoryExists(Path) == true)
      return true;
   if (DirectoryExists(Parent) == false)
      return _error->Error("Directory %s does not exist", Parent.c_str());
   if (Path.compare(0, Parent.length(), Parent) != 0)
      return _error->Error("Refusing to create %s outside of %s", Path.c_str(), Parent.c_str());

   string::size_type Pos = Parent.length();
   while (Pos < Path.length())
   {
      string::size_type const Next = Path.find('/', Pos + 1);
      string const Dir = Path.substr(0, Next);
      Pos = (Next == string::npos) ? Path.length() : Next;
      if (Dir.empty() == true || Dir.back() == '/' || DirectoryExists(Dir) == true)
	 continue;
      if (mkdir(Dir.c_str(), 0755) != 0 && errno != EEXIST)
	 return _error->Errno("mkdir", "Failed to create directory %s", Dir.c_str());
   }
   return true;
}
									/*}}}*/
// Path strings								/*{{{*/
string flNotDir(string File)
{
   string::size_type const Slash = File.rfind('/');
   if (Slash == string::npos)
      return File;
   return File.substr(Slash + 1);
}
string flNotFile(string File)
{
   string::size_type const Slash = File.rfind('/');
   if (Slash == string::npos)
      return "./";
   File.erase(Slash + 1);
   return File;
}
// absolute and explicitly relative names are used as they are
string flCombine(string Dir,string File)
{
   if (File.empty() == true)
      return File;
   if (Dir.empty() == true || File[0] == '/' || File.compare(0, 2, "./") == 0)
      return File;
   if (Dir.back() != '/')
      Dir.push_back('/');
   return Dir.append(File);
}
string flAbsPath(string File)
{
   char * const Real = realpath(File.c_str(), nullptr);
   if (Real == nullptr)
   {
      _error->Errno("realpath", "flAbsPath on %s failed", File.c_str());
      return string();
   }
   string const Abs(Real);
   free(Real);
   return Abs;
}
									/*}}}*/

// FileFdPrivate - the byte mover behind a FileFd			/*{{{*/
// ---------------------------------------------------------------------
/* Read and Write return the number of bytes handled, 0 on the end of
   the input and -1 on failure. A failure with errno left at 0 is
   described by LastError(). */
class PARTIAL_HIDDEN FileFdPrivate
{
protected:
   int const iFd;
   Partial::Configuration::Compressor const compressor;
public:
   // ReadLine looks ahead, Read consumes this first
   std::string Pending;

   FileFdPrivate(int const Fd, Partial::Configuration::Compressor const &c) : iFd(Fd), compressor(c) {}
   virtual ~FileFdPrivate() {}

   virtual bool Begin(bool const Writing) = 0;
   virtual ssize_t Read(void * const To, unsigned long long const Size) = 0;
   virtual ssize_t Write(void const * const From, unsigned long long const Size) = 0;
   /** \brief write trailers and give the library state back
    *
    *  Commit is false if the file failed and the trailer isn't needed. */
   virtual bool Finish(bool const Commit) { (void)Commit; return true; }
   /** \brief true if Finish() will close the descriptor */
   virtual bool ClosesDescriptor() const { return false; }
   virtual std::string LastError() const { return "unknown error"; }
};
									/*}}}*/
class PARTIAL_HIDDEN DirectFileFdPrivate : public FileFdPrivate		/*{{{*/
{
public:
   using FileFdPrivate::FileFdPrivate;
   virtual bool Begin(bool const) override { return true; }
   virtual ssize_t Read(void * const To, unsigned long long const Size) override
   {
      return read(iFd, To, Size);
   }
   virtual ssize_t Write(void const * const From, unsigned long long const Size) override
   {
      return write(iFd, From, Size);
   }
};
									/*}}}*/
#ifdef HAVE_ZLIB
class PARTIAL_HIDDEN GzipFileFdPrivate : public FileFdPrivate		/*{{{*/
{
   gzFile gz = nullptr;
public:
   using FileFdPrivate::FileFdPrivate;
   virtual ~GzipFileFdPrivate() { Finish(false); }

   virtual bool Begin(bool const Writing) override
   {
      string const mode = Writing ? "wb" + std::to_string(compressor.Level) : "rb";
      gz = gzdopen(iFd, mode.c_str());
      return gz != nullptr;
   }
   virtual ssize_t Read(void * const To, unsigned long long const Size) override
   {
      return gzread(gz, To, std::min<unsigned long long>(Size, PARTIAL_BUFFER_SIZE));
   }
   virtual ssize_t Write(void const * const From, unsigned long long const Size) override
   {
      int const Res = gzwrite(gz, From, std::min<unsigned long long>(Size, PARTIAL_BUFFER_SIZE));
      return Res == 0 ? -1 : Res;
   }
   virtual bool Finish(bool const) override
   {
      if (gz == nullptr)
	 return true;
      int const Res = gzclose(gz);
      gz = nullptr;
      // empty files report a buffer error on close
      return Res == Z_OK || Res == Z_BUF_ERROR;
   }
   virtual bool ClosesDescriptor() const override { return gz != nullptr; }
   virtual std::string LastError() const override
   {
      int err;
      return gzerror(gz, &err);
   }
};
									/*}}}*/
#endif
#ifdef HAVE_BZ2
class PARTIAL_HIDDEN Bz2FileFdPrivate : public FileFdPrivate		/*{{{*/
{
   BZFILE *bz2 = nullptr;
public:
   using FileFdPrivate::FileFdPrivate;
   virtual ~Bz2FileFdPrivate() { Finish(false); }

   virtual bool Begin(bool const Writing) override
   {
      string const mode = Writing ? "wb" + std::to_string(compressor.Level) : "rb";
      bz2 = BZ2_bzdopen(iFd, mode.c_str());
      return bz2 != nullptr;
   }
   virtual ssize_t Read(void * const To, unsigned long long const Size) override
   {
      return BZ2_bzread(bz2, To, std::min<unsigned long long>(Size, PARTIAL_BUFFER_SIZE));
   }
   virtual ssize_t Write(void const * const From, unsigned long long const Size) override
   {
      return BZ2_bzwrite(bz2, const_cast<void *>(From), std::min<unsigned long long>(Size, PARTIAL_BUFFER_SIZE));
   }
   virtual bool Finish(bool const) override
   {
      if (bz2 != nullptr)
	 BZ2_bzclose(bz2);
      bz2 = nullptr;
      return true;
   }
   virtual bool ClosesDescriptor() const override { return bz2 != nullptr; }
   virtual std::string LastError() const override
   {
      int err;
      return BZ2_bzerror(bz2, &err);
   }
};
									/*}}}*/
#endif
#ifdef HAVE_LZMA
class PARTIAL_HIDDEN LzmaFileFdPrivate : public FileFdPrivate		/*{{{*/
{
   lzma_stream stream = LZMA_STREAM_INIT;
   lzma_ret err = LZMA_OK;
   bool encoding = false;
   bool ended = false;
   uint8_t buffer[PARTIAL_BUFFER_SIZE];

   bool Flush(lzma_action const Action)
   {
      do {
	 stream.next_out = buffer;
	 stream.avail_out = sizeof(buffer);
	 err = lzma_code(&stream, Action);
	 if (err != LZMA_OK && err != LZMA_STREAM_END)
	    return false;
	 if (FileFd::Write(iFd, buffer, sizeof(buffer) - stream.avail_out) == false)
	    return false;
      } while (stream.avail_out == 0 || (Action == LZMA_FINISH && err != LZMA_STREAM_END));
      return true;
   }
public:
   using FileFdPrivate::FileFdPrivate;
   virtual ~LzmaFileFdPrivate() { lzma_end(&stream); }

   virtual bool Begin(bool const Writing) override
   {
      bool const xz = compressor.Name == "xz";
      encoding = Writing;
      if (Writing == true)
      {
	 if (xz == true)
	    err = lzma_easy_encoder(&stream, compressor.Level, LZMA_CHECK_CRC64);
	 else
	 {
	    lzma_options_lzma options;
	    lzma_lzma_preset(&options, compressor.Level);
	    err = lzma_alone_encoder(&stream, &options);
	 }
      }
      else if (xz == true)
	 err = lzma_auto_decoder(&stream, UINT64_MAX, 0);
      else
	 err = lzma_alone_decoder(&stream, UINT64_MAX);
      return err == LZMA_OK;
   }
   virtual ssize_t Read(void * const To, unsigned long long const Size) override
   {
      if (ended == true)
	 return 0;
      unsigned long long const Wanted = std::min<unsigned long long>(Size, PARTIAL_BUFFER_SIZE);
      stream.next_out = static_cast<uint8_t *>(To);
      stream.avail_out = Wanted;
      while (stream.avail_out == Wanted)
      {
	 lzma_action action = LZMA_RUN;
	 if (stream.avail_in == 0)
	 {
	    ssize_t const Got = read(iFd, buffer, sizeof(buffer));
	    if (Got < 0)
	       return -1;
	    stream.next_in = buffer;
	    stream.avail_in = Got;
	    if (Got == 0)
	       action = LZMA_FINISH;
	 }
	 err = lzma_code(&stream, action);
	 if (err == LZMA_STREAM_END)
	 {
	    ended = true;
	    break;
	 }
	 if (err != LZMA_OK)
	 {
	    errno = 0;
	    return -1;
	 }
      }
      return Wanted - stream.avail_out;
   }
   virtual ssize_t Write(void const * const From, unsigned long long const Size) override
   {
      stream.next_in = static_cast<uint8_t const *>(From);
      stream.avail_in = Size;
      while (stream.avail_in != 0)
	 if (Flush(LZMA_RUN) == false)
	 {
	    errno = 0;
	    return -1;
	 }
      return Size;
   }
   virtual bool Finish(bool const Commit) override
   {
      if (encoding == false || Commit == false || ended == true)
	 return true;
      ended = true;
      return Flush(LZMA_FINISH);
   }
   virtual std::string LastError() const override
   {
      return "lzma error " + std::to_string(err);
   }
};
									/*}}}*/
#endif
#ifdef HAVE_LZ4
class PARTIAL_HIDDEN Lz4FileFdPrivate : public FileFdPrivate		/*{{{*/
{
   // frame header and footer on top of the bound for the data
   static constexpr size_t FrameOverhead = 19 + 4;
   LZ4F_compressionContext_t cctx = nullptr;
   LZ4F_decompressionContext_t dctx = nullptr;
   size_t res = 0;
   std::vector<char> buffer;
   size_t inpos = 0;
   size_t inend = 0;
   size_t hint = PARTIAL_BUFFER_SIZE;

   bool Emit()
   {
      return LZ4F_isError(res) == false && FileFd::Write(iFd, buffer.data(), res);
   }
public:
   using FileFdPrivate::FileFdPrivate;
   virtual ~Lz4FileFdPrivate()
   {
      if (cctx != nullptr)
	 LZ4F_freeCompressionContext(cctx);
      if (dctx != nullptr)
	 LZ4F_freeDecompressionContext(dctx);
   }

   virtual bool Begin(bool const Writing) override
   {
      if (Writing == false)
      {
	 res = LZ4F_createDecompressionContext(&dctx, LZ4F_VERSION);
	 buffer.resize(PARTIAL_BUFFER_SIZE);
	 return LZ4F_isError(res) == false;
      }
      res = LZ4F_createCompressionContext(&cctx, LZ4F_VERSION);
      if (LZ4F_isError(res))
	 return false;
      buffer.resize(LZ4F_compressBound(PARTIAL_BUFFER_SIZE, nullptr) + FrameOverhead);
      res = LZ4F_compressBegin(cctx, buffer.data(), buffer.size(), nullptr);
      return Emit();
   }
   virtual ssize_t Read(void * const To, unsigned long long const Size) override
   {
      while (hint != 0)
      {
	 if (inpos == inend)
	 {
	    ssize_t const Got = read(iFd, buffer.data(), std::min(hint, buffer.size()));
	    if (Got < 0)
	       return -1;
	    if (Got == 0)
	    {
	       errno = 0;
	       res = static_cast<size_t>(-1);
	       return -1;
	    }
	    inpos = 0;
	    inend = Got;
	 }
	 size_t in = inend - inpos;
	 size_t out = std::min<unsigned long long>(Size, PARTIAL_BUFFER_SIZE);
	 res = LZ4F_decompress(dctx, To, &out, buffer.data() + inpos, &in, nullptr);
	 if (LZ4F_isError(res))
	 {
	    errno = 0;
	    return -1;
	 }
	 inpos += in;
	 hint = res;
	 if (out != 0)
	    return out;
      }
      return 0;
   }
   virtual ssize_t Write(void const * const From, unsigned long long const Size) override
   {
      size_t const Chunk = std::min<unsigned long long>(Size, PARTIAL_BUFFER_SIZE);
      res = LZ4F_compressUpdate(cctx, buffer.data(), buffer.size(), From, Chunk, nullptr);
      if (Emit() == false)
      {
	 errno = 0;
	 return -1;
      }
      return Chunk;
   }
   virtual bool Finish(bool const Commit) override
   {
      if (cctx == nullptr || Commit == false)
	 return true;
      res = LZ4F_compressEnd(cctx, buffer.data(), buffer.size(), nullptr);
      bool const Ok = Emit();
      LZ4F_freeCompressionContext(cctx);
      cctx = nullptr;
      return Ok;
   }
   virtual std::string LastError() const override
   {
      if (res == static_cast<size_t>(-1))
	 return "Unexpected end of file";
      return LZ4F_getErrorName(res);
   }
};
									/*}}}*/
#endif

// FileFd Constructors							/*{{{*/
FileFd::FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode) : iFd(-1), Flags(0), d(nullptr)
{
   Open(FileName, Mode, None, AccessMode);
}
FileFd::FileFd() : iFd(-1), Flags(0), d(nullptr) {}
FileFd::~FileFd()
{
   Close();
}
									/*}}}*/
// FileFd::Open - Open a file, picking the compressor			/*{{{*/
bool FileFd::Open(string FileName,unsigned int const Mode,CompressMode Compress, unsigned long const AccessMode)
{
   auto const compressors = Partial::Configuration::getCompressors();
   // the first entry is always the uncompressed "."
   auto chosen = compressors.front();

   if (Compress == Auto)
   {
      if ((Mode & WriteOnly) == WriteOnly)
	 return FileFdError("Autodetection on %s only works in ReadOnly openmode!", FileName.c_str());
      for (auto const &c : compressors)
	 if (FileExists(FileName + c.Extension) == true)
	 {
	    chosen = c;
	    FileName.append(c.Extension);
	    break;
	 }
   }
   else if (Compress == Extension)
   {
      string const File = flNotDir(FileName);
      string::size_type const Dot = File.rfind('.');
      if (Dot != string::npos)
	 for (auto const &c : compressors)
	    if (c.Extension == File.substr(Dot))
	    {
	       chosen = c;
	       break;
	    }
   }
   return Open(FileName, Mode, chosen, AccessMode);
}
									/*}}}*/
static FileFdPrivate *NewBackend(int const Fd, Partial::Configuration::Compressor const &c)/*{{{*/
{
   if (c.Name == ".")
      return new DirectFileFdPrivate(Fd, c);
#ifdef HAVE_ZLIB
   if (c.Name == "gzip")
      return new GzipFileFdPrivate(Fd, c);
#endif
#ifdef HAVE_BZ2
   if (c.Name == "bzip2")
      return new Bz2FileFdPrivate(Fd, c);
#endif
#ifdef HAVE_LZMA
   if (c.Name == "xz" || c.Name == "lzma")
      return new LzmaFileFdPrivate(Fd, c);
#endif
#ifdef HAVE_LZ4
   if (c.Name == "lz4")
      return new Lz4FileFdPrivate(Fd, c);
#endif
   return nullptr;
}
									/*}}}*/
// FileFd::Open - Open a file with the given compressor			/*{{{*/
// ---------------------------------------------------------------------
/* With Atomic the data goes to FileName.XXXXXX first, Close() renames
   it over FileName. */
bool FileFd::Open(string FileName,unsigned int const Mode,Partial::Configuration::Compressor const &compressor, unsigned long const AccessMode)
{
   Close();
   Flags = 0;
   this->FileName = FileName;

   bool const Writing = (Mode & WriteOnly) == WriteOnly;
   if (Writing == ((Mode & ReadOnly) == ReadOnly))
      return FileFdError("Opening %s needs exactly one of ReadOnly and WriteOnly", FileName.c_str());
   if (Writing == false && (Mode & (Create | Empty | Atomic)) != 0)
      return FileFdError("ReadOnly mode for %s doesn't accept additional flags!", FileName.c_str());

   if ((Mode & Atomic) == Atomic && FileName != "/dev/null")
   {
      TemporaryFileName = FileName + ".XXXXXX";
      iFd = mkstemp(&TemporaryFileName[0]);
      if (iFd == -1)
      {
	 TemporaryFileName.clear();
	 return FileFdErrno("mkstemp", "Could not create temporary file for %s", FileName.c_str());
      }
      Flags |= Replace;
      mode_t const Mask = umask(0);
      umask(Mask);
      if (fchmod(iFd, AccessMode & ~Mask) != 0)
	 return FileFdErrno("fchmod", "Could not change permissions for temporary file %s", TemporaryFileName.c_str());
   }
   else
   {
      int fileflags = Writing ? O_WRONLY : O_RDONLY;
      if ((Mode & Create) == Create)
	 fileflags |= O_CREAT;
      if ((Mode & Empty) == Empty)
	 fileflags |= O_TRUNC;
      iFd = open(FileName.c_str(), fileflags | O_CLOEXEC, AccessMode);
      if (iFd == -1)
	 return FileFdErrno("open", "Could not open file %s", FileName.c_str());
   }

   if (Writing == true)
      Flags |= WriteMode;
   if (compressor.Name != ".")
      Flags |= Compressed;
   d = NewBackend(iFd, compressor);
   if (d == nullptr)
      return FileFdError("Compressor %s is not supported by this build", compressor.Name.c_str());
   if (d->Begin(Writing) == false)
      return BackendError("open");
   return true;
}
									/*}}}*/
// FileFd::BackendError - report a failed backend call			/*{{{*/
bool FileFd::BackendError(char const * const Operation)
{
   if (errno != 0)
      return FileFdErrno(Operation, "%s error on %s", Operation, FileName.c_str());
   return FileFdError("%s error on %s: %s", Operation, FileName.c_str(), d->LastError().c_str());
}
									/*}}}*/
// FileFd::Read - Read a bit of the file				/*{{{*/
bool FileFd::Read(void *To,unsigned long long Size,unsigned long long *Actual)
{
   if (Actual != nullptr)
      *Actual = 0;
   if (d == nullptr || Failed() == true)
      return false;

   char *Out = static_cast<char *>(To);
   if (d->Pending.empty() == false)
   {
      unsigned long long const Buffered = std::min<unsigned long long>(Size, d->Pending.size());
      memcpy(Out, d->Pending.data(), Buffered);
      d->Pending.erase(0, Buffered);
      Out += Buffered;
      Size -= Buffered;
   }

   while (Size != 0)
   {
      errno = 0;
      ssize_t const Got = d->Read(Out, Size);
      if (Got < 0 && errno == EINTR)
	 continue;
      if (Got < 0)
	 return BackendError("read");
      if (Got == 0)
	 break;
      Out += Got;
      Size -= Got;
   }

   if (Actual != nullptr)
      *Actual = Out - static_cast<char *>(To);
   if (Size == 0)
      return true;
   if (Actual != nullptr)
   {
      Flags |= HitEof;
      return true;
   }
   return FileFdError("read, still have %llu to read but none left", Size);
}
									/*}}}*/
// FileFd::ReadLine - Read a complete line from the file		/*{{{*/
bool FileFd::ReadLine(std::string &To)
{
   To.clear();
   if (d == nullptr || Failed() == true)
      return false;

   std::vector<char> Chunk(4096);
   string::size_type NewLine;
   while ((NewLine = d->Pending.find('\n')) == string::npos)
   {
      errno = 0;
      ssize_t const Got = d->Read(Chunk.data(), Chunk.size());
      if (Got < 0 && errno == EINTR)
	 continue;
      if (Got < 0)
	 return BackendError("read");
      if (Got == 0)
      {
	 Flags |= HitEof;
	 To.swap(d->Pending);
	 return true;
      }
      d->Pending.append(Chunk.data(), Got);
   }
   To.assign(d->Pending, 0, NewLine);
   d->Pending.erase(0, NewLine + 1);
   return true;
}
									/*}}}*/
// FileFd::Write - Write to the file					/*{{{*/
bool FileFd::Write(const void *From,unsigned long long Size)
{
   if (d == nullptr || Failed() == true)
      return false;
   char const *In = static_cast<char const *>(From);
   while (Size != 0)
   {
      errno = 0;
      ssize_t const Done = d->Write(In, Size);
      if (Done < 0 && errno == EINTR)
	 continue;
      if (Done <= 0)
	 return BackendError("write");
      In += Done;
      Size -= Done;
   }
   return true;
}
bool FileFd::Write(int Fd, const void *From, unsigned long long Size)
{
   char const *In = static_cast<char const *>(From);
   while (Size != 0)
   {
      ssize_t const Done = write(Fd, In, Size);
      if (Done < 0 && errno == EINTR)
	 continue;
      if (Done < 0)
	 return _error->Errno("write", "Write error");
      if (Done == 0)
	 return _error->Error("write, still have %llu to write but couldn't", Size);
      In += Done;
      Size -= Done;
   }
   return true;
}
									/*}}}*/
// FileFd::Close - Finish the stream and put the file in place		/*{{{*/
bool FileFd::Close()
{
   if (iFd == -1 && d == nullptr)
      return true;

   bool Res = true;
   bool OwnFd = true;
   if (d != nullptr)
   {
      OwnFd = d->ClosesDescriptor() == false;
      if (d->Finish(Failed() == false) == false)
	 Res = BackendError("close");
      delete d;
      d = nullptr;
   }
   if (OwnFd == true && iFd != -1 && close(iFd) != 0)
      Res = _error->Errno("close", "Problem closing the file %s", FileName.c_str());
   iFd = -1;

   bool const Broken = Failed() == true || Res == false;
   if ((Flags & Replace) == Replace)
   {
      if (Broken == false && rename(TemporaryFileName.c_str(), FileName.c_str()) != 0)
	 Res = _error->Errno("rename", "Problem renaming the file %s to %s", TemporaryFileName.c_str(), FileName.c_str());
      if (Broken == true || Res == false)
	 RemoveFile("FileFd::Close", TemporaryFileName);
      TemporaryFileName.clear();
   }
   else if (Broken == true && (Flags & DelOnFail) == DelOnFail && (Flags & WriteMode) == WriteMode)
      RemoveFile("FileFd::Close", FileName);

   if (Res == false)
      Flags |= Fail;
   return Res;
}
									/*}}}*/
// FileFd::FileFdErrno/FileFdError - mark failed and record		/*{{{*/
bool FileFd::FileFdErrno(const char *Function, const char *Description,...)
{
   int const errsv = errno;
   Flags |= Fail;
   va_list args;
   va_start(args, Description);
   _error->InsertErrno(GlobalError::ERROR, Function, Description, args, errsv);
   va_end(args);
   return false;
}
bool FileFd::FileFdError(const char *Description,...)
{
   Flags |= Fail;
   va_list args;
   va_start(args, Description);
   _error->Insert(GlobalError::ERROR, Description, args);
   va_end(args);
   return false;
}
									/*}}}*/
