#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;

  // run-only flags
  static std::string temp_directory;
  static double timeout_seconds;
};

#endif
