#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// file called cmd in the directories of $PATH, or an empty string. Commands
// containing a slash are returned as they are if they are executable.
// Successful lookups are cached unless use_cache is false; failures never are.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
