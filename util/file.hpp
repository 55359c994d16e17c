#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <kj/common.h>
#include <kj/io.h>
#include <cstdint>
#include <string>
#include <vector>

namespace util {

class File {
 public:
  // Lists all the regular files in a directory tree, sorted by path. A missing
  // directory has no files.
  static std::vector<std::string> ListFiles(const std::string& path);

  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Reads from fd until EOF. name is only used in error messages.
  static std::string ReadFd(int fd, const std::string& name);

  // Creates (or truncates) the file at path with the given contents.
  static void Write(const std::string& path, const std::string& contents);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  // Returns true if path is a regular file (following symlinks).
  static bool IsRegular(const std::string& path);

  // Returns the current working directory.
  static std::string CurrentDirectory();
};

// Creates a new, uniquely named file in a given folder. The file is removed on
// destruction. Removal errors are logged and ignored.
class TempFile {
 public:
  // The name of the file is prefix, six random characters, and suffix.
  TempFile(const std::string& base, const std::string& prefix,
           const std::string& suffix);

  // Returns the path of the temporary file.
  const std::string& Path() const;

  // Writes contents to the file and closes it. Can be called only once.
  void Write(const std::string& contents);

  ~TempFile();

  TempFile(TempFile&& other) noexcept
      : path_(std::move(other.path_)), fd_(kj::mv(other.fd_)) {
    other.moved_ = true;
  }
  TempFile& operator=(TempFile&& other) = delete;
  KJ_DISALLOW_COPY(TempFile);

 private:
  std::string path_;
  kj::AutoCloseFd fd_;
  bool moved_ = false;
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&& other) noexcept
      : path_(std::move(other.path_)), keep_(other.keep_) {
    other.moved_ = true;
  }
  TempDir& operator=(TempDir&& other) = delete;
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
