#include "util/file.hpp"
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <vector>
#include <kj/exception.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAreArray;
using ::testing::EndsWith;
using ::testing::IsEmpty;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/snipbox_testdir";

int unlink_cb(const char* fpath, const struct stat* /*unused*/, int /*unused*/,
              struct FTW* /*unused*/) {
  int rv = remove(fpath);
  if (rv) perror(fpath);
  return rv;
}

int rmrf(const char* path) {
  return nftw(path, unlink_cb, 64, FTW_DEPTH | FTW_PHYS);
}

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

bool fileExists(const std::string& path) {
  auto file = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (file < 0) return false;
  close(file);
  return true;
}

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

std::string makeTestDir(const std::string& name) {
  mkdir(test_tmpdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::string testdir = test_tmpdir + "/" + name;
  rmrf(testdir.c_str());
  mkdir(testdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  return testdir;
}

/*
 * ListFiles
 */

// NOLINTNEXTLINE
TEST(File, ListFiles) {
  std::string testdir = makeTestDir("list_files");
  mkdir((testdir + "/sub").c_str(), S_IRWXU);
  std::vector<std::string> files;
  for (auto name : {"file42", "file12", "sub/file68"}) {
    files.push_back(testdir + "/" + name);
    writeFile(files.back(), "fooo");
  }
  EXPECT_THAT(util::File::ListFiles(testdir),
              ElementsAreArray({testdir + "/file12", testdir + "/file42",
                                testdir + "/sub/file68"}));
}

// NOLINTNEXTLINE
TEST(File, ListFilesEmpty) {
  std::string testdir = makeTestDir("list_files");
  EXPECT_THAT(util::File::ListFiles(testdir), IsEmpty());
}

// NOLINTNEXTLINE
TEST(File, ListFilesNoSuchDir) {
  std::string testdir = test_tmpdir + "/lolnope/ahah";
  EXPECT_THAT(util::File::ListFiles(testdir), IsEmpty());
  EXPECT_FALSE(dirExists(testdir));
}

/*
 * Read and Write
 */

// NOLINTNEXTLINE
TEST(File, Read) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  std::string content = "lallabalalla\n";
  writeFile(filepath, content);
  EXPECT_EQ(util::File::Read(filepath), content);
}

// NOLINTNEXTLINE
TEST(File, ReadBigFileWithNulls) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/bigfile";
  std::string content(200 * 1024, 'x');
  content[1234] = '\0';
  writeFile(filepath, content);
  EXPECT_EQ(util::File::Read(filepath), content);
}

// NOLINTNEXTLINE
TEST(File, ReadNoSuchFile) {
  std::string filepath = "/no/such/file";
  EXPECT_THROW(util::File::Read(filepath), std::system_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST(File, ReadFdFromPipe) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  ASSERT_EQ(write(fds[1], "piped", 5), 5);
  close(fds[1]);
  EXPECT_EQ(util::File::ReadFd(fds[0], "pipe"), "piped");
  close(fds[0]);
}

// NOLINTNEXTLINE
TEST(File, Write) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "this is way longer and will be truncated");
  util::File::Write(filepath, "wowowow\n");
  EXPECT_EQ(readFile(filepath), "wowowow\n");
}

// NOLINTNEXTLINE
TEST(File, WriteNoSuchDir) {
  EXPECT_THROW(util::File::Write("/no/such/dir/file", "x"),  // NOLINT
               std::system_error);
}

/*
 * Paths
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("/tmp", "file"), "/tmp/file");
  EXPECT_EQ(util::File::JoinPath("/tmp/", "file"), "/tmp/file");
  EXPECT_EQ(util::File::JoinPath("/tmp", "/abs"), "/abs");
  EXPECT_EQ(util::File::JoinPath("", "file"), "file");
}

// NOLINTNEXTLINE
TEST(File, BaseDirAndName) {
  EXPECT_EQ(util::File::BaseDir("/tmp/dir/file.py"), "/tmp/dir");
  EXPECT_EQ(util::File::BaseName("/tmp/dir/file.py"), "file.py");
  EXPECT_EQ(util::File::BaseDir("file.py"), "");
  EXPECT_EQ(util::File::BaseName("file.py"), "file.py");
}

// NOLINTNEXTLINE
TEST(File, SizeAndExists) {
  std::string testdir = makeTestDir("size");
  writeFile(testdir + "/file", "12345");
  EXPECT_EQ(util::File::Size(testdir + "/file"), 5);
  EXPECT_TRUE(util::File::Exists(testdir + "/file"));
  EXPECT_TRUE(util::File::IsRegular(testdir + "/file"));
  EXPECT_FALSE(util::File::IsRegular(testdir));
  EXPECT_LT(util::File::Size(testdir + "/nope"), 0);
  EXPECT_FALSE(util::File::Exists(testdir + "/nope"));
}

// NOLINTNEXTLINE
TEST(File, CurrentDirectory) {
  std::string testdir = makeTestDir("cwd");
  std::string old = util::File::CurrentDirectory();
  ASSERT_EQ(chdir(testdir.c_str()), 0);
  EXPECT_EQ(util::File::CurrentDirectory(), testdir);
  ASSERT_EQ(chdir(old.c_str()), 0);
}

// NOLINTNEXTLINE
TEST(File, MakeDirs) {
  std::string testdir = makeTestDir("make_dirs");
  util::File::MakeDirs(testdir + "/a/b/c");
  EXPECT_TRUE(dirExists(testdir + "/a/b/c"));
  // Already existing directories are fine.
  util::File::MakeDirs(testdir + "/a/b/c");
}

// NOLINTNEXTLINE
TEST(File, RemoveNoSuchFile) {
  EXPECT_THROW(util::File::Remove(test_tmpdir + "/nope"),  // NOLINT
               std::system_error);
}

/*
 * TempFile
 */

// NOLINTNEXTLINE
TEST(TempFile, NameAndRemoval) {
  std::string testdir = makeTestDir("temp_file");
  std::string path;
  {
    util::TempFile file(testdir, "snippet_", ".py");
    path = file.Path();
    EXPECT_THAT(path, StartsWith(testdir + "/snippet_"));
    EXPECT_THAT(path, EndsWith(".py"));
    EXPECT_EQ(path.size(), (testdir + "/snippet_XXXXXX.py").size());
    EXPECT_TRUE(fileExists(path));
  }
  EXPECT_FALSE(fileExists(path));
}

// NOLINTNEXTLINE
TEST(TempFile, Write) {
  std::string testdir = makeTestDir("temp_file");
  util::TempFile file(testdir, "snippet_", ".py");
  file.Write("print('hi')\n");
  EXPECT_EQ(readFile(file.Path()), "print('hi')\n");
  EXPECT_THROW(file.Write("again"), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST(TempFile, UniqueNames) {
  std::string testdir = makeTestDir("temp_file");
  util::TempFile a(testdir, "snippet_", ".py");
  util::TempFile b(testdir, "snippet_", ".py");
  EXPECT_NE(a.Path(), b.Path());
  EXPECT_EQ(util::File::ListFiles(testdir).size(), 2u);
}

// NOLINTNEXTLINE
TEST(TempFile, CreatesBaseDirectory) {
  std::string testdir = makeTestDir("temp_file");
  util::TempFile file(testdir + "/new/dir", "snippet_", ".py");
  EXPECT_THAT(file.Path(), StartsWith(testdir + "/new/dir/snippet_"));
}

// NOLINTNEXTLINE
TEST(TempFile, Move) {
  std::string testdir = makeTestDir("temp_file");
  std::string path;
  {
    util::TempFile file(testdir, "snippet_", ".py");
    path = file.Path();
    {
      util::TempFile moved(std::move(file));
      EXPECT_EQ(moved.Path(), path);
    }
    EXPECT_FALSE(fileExists(path));
  }
}

// NOLINTNEXTLINE
TEST(TempFile, AlreadyRemoved) {
  std::string testdir = makeTestDir("temp_file");
  {
    util::TempFile file(testdir, "snippet_", ".py");
    util::File::Remove(file.Path());
  }
  EXPECT_THAT(util::File::ListFiles(testdir), IsEmpty());
}

// NOLINTNEXTLINE
TEST(TempFile, UnwritableBase) {
  EXPECT_THROW(util::TempFile("/proc/snipbox", "snippet_", ".py"),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST(TempFile, NameTooLong) {
  std::string testdir = makeTestDir("temp_file_long");
  try {
    util::TempFile file(testdir, std::string(PATH_MAX, 'a'), ".py");
    FAIL() << "The file should not have been created";
  } catch (const std::system_error& exc) {
    EXPECT_EQ(exc.code().value(), ENAMETOOLONG);
  }
  EXPECT_TRUE(util::File::ListFiles(testdir).empty());
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(TempDir, CreateAndRemove) {
  std::string testdir = makeTestDir("temp_dir");
  std::string path;
  {
    util::TempDir dir(testdir);
    path = dir.Path();
    EXPECT_TRUE(dirExists(path));
    writeFile(path + "/file", "content");
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string testdir = makeTestDir("temp_dir");
  std::string path;
  {
    util::TempDir dir(testdir);
    path = dir.Path();
    dir.Keep();
  }
  EXPECT_TRUE(dirExists(path));
}

}  // namespace
