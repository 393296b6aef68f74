// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Include Files							/*{{{*/
#include <config.h>

#include <partial-pkg/copier.h>
#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/partialconfiguration.h>
#include <partial-pkg/strutl.h>
#include <partial-pkg/tagfile.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <dirent.h>
#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>
									/*}}}*/

using std::string;

ArchiveCopier::ArchiveCopier(std::string source, std::string dest, bool const symlink)
   : Source(std::move(source)), Dest(std::move(dest)), Symlink(symlink),
     Copied(0), Ignored(0), NotFound(0)
{
}

// IsIndexName - Check for Base or Base plus a compressor extension	/*{{{*/
static bool IsIndexName(string const &Name, string const &Base)
{
   if (Name == Base)
      return true;
   for (auto const &Ext : Partial::Configuration::getCompressorExtensions())
      if (Name == Base + Ext)
	 return true;
   return false;
}
									/*}}}*/
// WalkDir - Recursively collect the index files of a directory		/*{{{*/
static bool WalkDir(string const &Dir, std::vector<string> &Packages, std::vector<string> &Sources)
{
   DIR *D = opendir(Dir.c_str());
   if (D == nullptr)
      return _error->Errno("opendir", "Unable to read %s", Dir.c_str());

   std::vector<string> SubDirs;
   for (struct dirent *Ent = readdir(D); Ent != nullptr; Ent = readdir(D))
   {
      string const Name = Ent->d_name;
      if (Name == "." || Name == "..")
	 continue;
      string const File = flCombine(Dir, Name);
      struct stat St;
      if (lstat(File.c_str(), &St) != 0)
	 continue;
      if (S_ISDIR(St.st_mode))
	 SubDirs.push_back(File);
      else if (IsIndexName(Name, "Packages") == true)
	 Packages.push_back(File);
      else if (IsIndexName(Name, "Sources") == true)
	 Sources.push_back(File);
   }
   closedir(D);

   for (auto const &Sub : SubDirs)
      if (WalkDir(Sub, Packages, Sources) == false)
	 return false;
   return true;
}
									/*}}}*/
// ArchiveCopier::FindIndexFiles - Find the indices to process		/*{{{*/
bool ArchiveCopier::FindIndexFiles(std::vector<string> &Packages, std::vector<string> &Sources) const
{
   Packages.clear();
   Sources.clear();
   string const Dists = flCombine(Dest, "dists");
   if (DirectoryExists(Dists) == false)
      return _error->Error("Directory %s does not exist", Dists.c_str());
   if (WalkDir(Dists, Packages, Sources) == false)
      return false;
   std::sort(Packages.begin(), Packages.end());
   std::sort(Sources.begin(), Sources.end());
   return true;
}
									/*}}}*/
// ArchiveCopier::ProcessPackages - Copy the files of a Packages file	/*{{{*/
bool ArchiveCopier::ProcessPackages(string const &File)
{
   FileFd Fd;
   if (Fd.Open(File, FileFd::ReadOnly, FileFd::Extension) == false)
      return false;
   pkgTagFile Tags(&Fd);
   pkgTagSection Section;
   while (Tags.Step(Section) == true)
   {
      string const Path = Section.FindS("Filename");
      if (Path.empty() == true)
	 continue;
      if (Copy(Path) == false)
	 return false;
   }
   if (Fd.Failed() == true)
      return false;
   return Fd.Close();
}
									/*}}}*/
// ArchiveCopier::ProcessSources - Copy the files of a Sources file	/*{{{*/
// ---------------------------------------------------------------------
/* The files of a source are listed as "<checksum> <size> <name>" in
   Files, or in Checksums-Sha256 if there is no Files field. */
bool ArchiveCopier::ProcessSources(string const &File)
{
   FileFd Fd;
   if (Fd.Open(File, FileFd::ReadOnly, FileFd::Extension) == false)
      return false;
   pkgTagFile Tags(&Fd);
   pkgTagSection Section;
   while (Tags.Step(Section) == true)
   {
      string const Directory = Section.FindS("Directory");
      string Files = Section.FindS("Files");
      if (Files.empty() == true)
	 Files = Section.FindS("Checksums-Sha256");
      std::istringstream Lines(Files);
      for (string Line; std::getline(Lines, Line);)
      {
	 std::istringstream Words(Line);
	 string Hash, Size, Name;
	 if (!(Words >> Hash >> Size >> Name) || IsDigitString(Size) == false)
	    continue;
	 if (Copy(Directory.empty() ? Name : Directory + "/" + Name) == false)
	    return false;
      }
   }
   if (Fd.Failed() == true)
      return false;
   return Fd.Close();
}
									/*}}}*/
// ArchiveCopier::Copy - Copy or link one file				/*{{{*/
bool ArchiveCopier::Copy(string const &Path)
{
   string Rel = Path;
   while (Rel.empty() == false && Rel[0] == '/')
      Rel.erase(0, 1);
   if (Rel.empty() == true)
      return true;

   string const From = flCombine(Source, Rel);
   string const To = flCombine(Dest, Rel);

   struct stat St;
   if (lstat(To.c_str(), &St) == 0)
   {
      ++Ignored;
      return true;
   }
   if (FileExists(From) == false)
   {
      ++NotFound;
      _error->Warning("%s not found.", From.c_str());
      return true;
   }

   if (CreateDirectory(Dest, flNotFile(To)) == false)
      return false;

   if (Symlink == true)
   {
      string const Up = RelativePath(flNotFile(To), Source);
      if (Up.empty() == true)
	 return false;
      string const Target = flCombine(Up, Rel);
      if (symlink(Target.c_str(), To.c_str()) != 0)
	 return _error->Errno("symlink", "Failed to link %s to %s", To.c_str(), Target.c_str());
   }
   else
   {
      FileFd In(From, FileFd::ReadOnly);
      FileFd Out(To, FileFd::WriteAtomic);
      Out.EraseOnFailure();
      if (CopyFile(In, Out) == false)
      {
	 Out.OpFail();
	 return false;
      }
      if (In.Close() == false || Out.Close() == false)
	 return false;
   }
   ++Copied;
   return true;
}
									/*}}}*/
// RelativePath - Path from one directory to another			/*{{{*/
string RelativePath(string const &From, string const &To)
{
   string const AbsFrom = flAbsPath(From);
   string const AbsTo = flAbsPath(To);
   if (AbsFrom.empty() == true || AbsTo.empty() == true)
      return string();

   std::vector<string> FromParts, ToParts;
   for (auto const &P : VectorizeString(AbsFrom, '/'))
      if (P.empty() == false)
	 FromParts.push_back(P);
   for (auto const &P : VectorizeString(AbsTo, '/'))
      if (P.empty() == false)
	 ToParts.push_back(P);

   if (FromParts.empty() == true || ToParts.empty() == true || FromParts[0] != ToParts[0])
      return AbsTo;

   size_t Common = 0;
   while (Common < FromParts.size() && Common < ToParts.size() && FromParts[Common] == ToParts[Common])
      ++Common;

   std::vector<string> Result(FromParts.size() - Common, "..");
   Result.insert(Result.end(), ToParts.begin() + Common, ToParts.end());
   if (Result.empty() == true)
      return ".";
   return Partial::String::Join(Result, "/");
}
									/*}}}*/
