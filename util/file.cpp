#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";
const constexpr size_t kReadBufSize = 64 * 1024;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

std::vector<std::string> OsListFiles(const std::string& path) {
  thread_local std::vector<std::string> files;
  files.clear();
  int ret = nftw(path.c_str(),
                 [](const char* fpath, const struct stat* /*sb*/,
                    int typeflags, struct FTW* /*ftwbuf*/) {
                   if (typeflags == FTW_F) files.emplace_back(fpath);
                   return 0;
                 },
                 64, FTW_PHYS);
  if (ret == -1) {
    throw std::system_error(errno, std::system_category(), "nftw " + path);
  }
  std::vector<std::string> ret_files = std::move(files);
  files.clear();
  std::sort(ret_files.begin(), ret_files.end());
  return ret_files;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/, struct FTW* /*ftwbuf*/) {
                return remove(fpath);
              },
              64, FTW_DEPTH | FTW_PHYS) != -1;
}

const size_t max_path_len = PATH_MAX;

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  if (tmp.size() >= max_path_len) {
    throw std::system_error(ENAMETOOLONG, std::system_category(), "mkdtemp");
  }
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back('\0');
  if (mkdtemp(data.data()) == nullptr) return "";
  return data.data();
}

kj::AutoCloseFd OsTempFile(const std::string& path, const std::string& suffix,
                           std::string* tmp) {
  *tmp = path + "XXXXXX" + suffix;
  if (tmp->size() >= max_path_len) {
    throw std::system_error(ENAMETOOLONG, std::system_category(), "mkostemps");
  }
  std::vector<char> data(tmp->begin(), tmp->end());
  data.push_back('\0');
  int fd = mkostemps(data.data(), suffix.size(), O_CLOEXEC);
  *tmp = data.data();
  return kj::AutoCloseFd(fd);
}

void WriteAll(int fd, const std::string& contents, const std::string& name) {
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos,  // NOLINT
                            contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      throw std::system_error(errno, std::system_category(), "write " + name);
    }
    pos += written;
  }
}

}  // namespace

namespace util {

std::vector<std::string> File::ListFiles(const std::string& path) {
  if (!Exists(path)) return {};
  return OsListFiles(path);
}

std::string File::Read(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  return ReadFd(fd, path);
}

std::string File::ReadFd(int fd, const std::string& name) {
  std::string content;
  char buf[kReadBufSize];
  while (true) {
    ssize_t amount = read(fd, buf, kReadBufSize);  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + name);
    }
    if (amount == 0) break;
    content.append(buf, amount);
  }
  return content;
}

void File::Write(const std::string& path, const std::string& contents) {
  kj::AutoCloseFd fd{open(path.c_str(),  // NOLINT
                          O_CLOEXEC | O_WRONLY | O_CREAT | O_TRUNC,
                          S_IRUSR | S_IWUSR)};
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  WriteAll(fd, contents, path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove");
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  if (first.empty()) return second;
  if (first.back() == kPathSeparators[0]) return first + second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::IsRegular(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode);
}

std::string File::CurrentDirectory() {
  std::vector<char> buf(max_path_len);
  if (getcwd(buf.data(), buf.size()) == nullptr) {
    throw std::system_error(errno, std::system_category(), "getcwd");
  }
  return buf.data();
}

TempFile::TempFile(const std::string& base, const std::string& prefix,
                   const std::string& suffix) {
  File::MakeDirs(base);
  fd_ = OsTempFile(File::JoinPath(base, prefix), suffix, &path_);
  if (fd_.get() == -1) {
    int error = errno;
    path_.clear();
    throw std::system_error(error, std::system_category(), "mkostemps");
  }
}

const std::string& TempFile::Path() const { return path_; }

void TempFile::Write(const std::string& contents) {
  KJ_REQUIRE(fd_.get() != -1, "Temporary file already written", path_);
  WriteAll(fd_, contents, path_);
  fd_ = nullptr;
}

TempFile::~TempFile() {
  if (moved_ || path_.empty()) return;
  fd_ = nullptr;
  try {
    File::Remove(path_);
  } catch (const std::system_error& exc) {
    KJ_LOG(WARNING, "Cannot remove temporary file", path_, exc.what());
  }
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!keep_ && !moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
