#include "util/which.hpp"
#include <sys/stat.h>
#include <cstdlib>
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/snipbox_testdir";

void createFile(const std::string& path, bool executable = true) {
  { std::ofstream os(path); }
  chmod(path.c_str(), executable ? S_IRWXU : S_IRUSR | S_IWUSR);
}

// Restores $PATH at the end of the scope.
class PathGuard {
 public:
  PathGuard() {
    const char* path = std::getenv("PATH");
    if (path != nullptr) saved_ = path;
  }
  ~PathGuard() { setenv("PATH", saved_.c_str(), 1); }

 private:
  std::string saved_;
};

// NOLINTNEXTLINE
TEST(Which, Which) {
  PathGuard guard;
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createFile(tmpdir1.Path() + "/cmd");
  createFile(tmpdir2.Path() + "/cmd");
  createFile(tmpdir2.Path() + "/cmd2");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd"), tmpdir1.Path() + "/cmd");
  EXPECT_EQ(util::which("cmd2"), tmpdir2.Path() + "/cmd2");
}

// NOLINTNEXTLINE
TEST(Which, WhichSkipsNonExecutable) {
  PathGuard guard;
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createFile(tmpdir1.Path() + "/cmd3", /*executable=*/false);
  createFile(tmpdir2.Path() + "/cmd3");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd3", false), tmpdir2.Path() + "/cmd3");
}

// NOLINTNEXTLINE
TEST(Which, WhichEmptyPath) {
  PathGuard guard;
  unsetenv("PATH");
  EXPECT_EQ(util::which("cmd_not_cached"), "");
}

// NOLINTNEXTLINE
TEST(Which, WhichNotFound) {
  PathGuard guard;
  util::TempDir tmpdir1(test_tmpdir + "/which");
  setenv("PATH", tmpdir1.Path().c_str(), 1);
  EXPECT_EQ(util::which("definitely_not_here"), "");
}

// NOLINTNEXTLINE
TEST(Which, WhichWithSlash) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  createFile(tmpdir1.Path() + "/tool");
  EXPECT_EQ(util::which(tmpdir1.Path() + "/tool"), tmpdir1.Path() + "/tool");
  EXPECT_EQ(util::which(tmpdir1.Path() + "/nope"), "");
}

// NOLINTNEXTLINE
TEST(Which, WhichUsesCache) {
  PathGuard guard;
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createFile(tmpdir1.Path() + "/cached");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("cached");
    EXPECT_EQ(path, tmpdir1.Path() + "/cached");
  }
  EXPECT_EQ(util::which("cached"), path);
}

// NOLINTNEXTLINE
TEST(Which, WhichCacheDisabled) {
  PathGuard guard;
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createFile(tmpdir1.Path() + "/uncached");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("uncached");
    EXPECT_EQ(path, tmpdir1.Path() + "/uncached");
  }
  EXPECT_EQ(util::which("uncached", false), "");
}

}  // namespace
