#include <partial-pkg/fileutl.h>

#include <string>

#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

static std::string GetTempDir()
{
   char const * const tmpdir = getenv("TMPDIR");
   if (tmpdir == nullptr || *tmpdir == '\0' || DirectoryExists(tmpdir) == false)
      return "/tmp";
   return tmpdir;
}

void helperCreateTemporaryDirectory(std::string const &id, std::string &dir)
{
   std::string const strtempdir = GetTempDir().append("/partial-tests-").append(id).append(".XXXXXX");
   char * tempdir = strdup(strtempdir.c_str());
   ASSERT_STREQ(tempdir, mkdtemp(tempdir));
   dir = tempdir;
   free(tempdir);
}
void helperRemoveDirectory(std::string const &dir)
{
   // basic sanity check to avoid removing random directories based on earlier failures
   if (dir.find("/partial-tests-") == std::string::npos || dir.find_first_of("*?") != std::string::npos)
      FAIL() << "Directory '" << dir << "' seems invalid. It is therefore not removed!";
   else
      ASSERT_EQ(0, system(std::string("rm -rf ").append(dir).c_str()));
}
void helperCreateFile(std::string const &dir, std::string const &name)
{
   std::string file = dir;
   file.append("/");
   file.append(name);
   int const fd = creat(file.c_str(), 0600);
   ASSERT_NE(-1, fd);
   close(fd);
}
void helperCreateDirectory(std::string const &dir, std::string const &name)
{
   std::string file = dir;
   file.append("/");
   file.append(name);
   ASSERT_TRUE(CreateDirectory(dir, file));
}
void helperCreateLink(std::string const &dir, std::string const &targetname, std::string const &linkname)
{
   std::string target = dir;
   target.append("/");
   target.append(targetname);
   std::string link = dir;
   link.append("/");
   link.append(linkname);
   ASSERT_EQ(0, symlink(target.c_str(), link.c_str()));
}
void helperWriteFile(std::string const &dir, std::string const &name, std::string const &content)
{
   std::string const file = flCombine(dir, name);
   ASSERT_TRUE(CreateDirectory(dir, flNotFile(file)));
   FileFd fd;
   ASSERT_TRUE(fd.Open(file, FileFd::WriteEmpty, FileFd::Extension));
   ASSERT_TRUE(fd.Write(content.data(), content.size()));
   ASSERT_TRUE(fd.Close());
}
std::string readFile(std::string const &file)
{
   FileFd fd;
   std::string content;
   EXPECT_TRUE(fd.Open(file, FileFd::ReadOnly, FileFd::Extension));
   char buffer[4096];
   unsigned long long actual = 0;
   do
   {
      EXPECT_TRUE(fd.Read(buffer, sizeof(buffer), &actual));
      content.append(buffer, actual);
   } while (actual != 0 && fd.Failed() == false);
   EXPECT_TRUE(fd.Close());
   return content;
}

ScopedFileDeleter::ScopedFileDeleter(std::string const &filename) : _filename{filename} {}
ScopedFileDeleter::ScopedFileDeleter(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter& ScopedFileDeleter::operator=(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter::~ScopedFileDeleter() {
   if (not _filename.empty())
      RemoveFile("ScopedFileDeleter", _filename.c_str());
}
ScopedFileDeleter createTemporaryFile(std::string const &id, char const * const content)
{
   std::string const strtempfile = GetTempDir().append("/partial-").append(id).append(".XXXXXX");
   char * tempfile = strdup(strtempfile.c_str());
   int const fd = mkstemp(tempfile);
   std::string const name = tempfile;
   free(tempfile);
   EXPECT_NE(-1, fd);
   if (fd != -1)
   {
      if (content != nullptr)
	 EXPECT_TRUE(FileFd::Write(fd, content, strlen(content)));
      close(fd);
   }
   return ScopedFileDeleter{name};
}
void openTemporaryFile(std::string const &id, FileFd &fd, char const * const content)
{
   auto const file = createTemporaryFile(id, content);
   // the name is gone once file leaves the scope, the descriptor stays usable
   EXPECT_TRUE(fd.Open(file.Name(), FileFd::ReadOnly));
}
