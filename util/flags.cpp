#include "util/flags.hpp"
#include <cstdlib>

namespace {
std::string DefaultTempDirectory() {
  const char* tmpdir = std::getenv("TMPDIR");
  if (tmpdir == nullptr || tmpdir[0] == '\0') return "/tmp";
  return tmpdir;
}
}  // namespace

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::temp_directory = DefaultTempDirectory();
double Flags::timeout_seconds = 30;
