#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/main.h>
#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Setters for kj::MainBuilder options.
std::function<bool()> setBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
// Only accepts strictly positive numbers.
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setPositiveDouble(
    double& var);

// Formats a number of seconds without trailing zeros: 2, 0.5, 1.25.
std::string formatSeconds(double seconds);

}  // namespace util
#endif
