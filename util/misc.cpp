#include "util/misc.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p;
    return true;
  };
};

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setPositiveDouble(
    double& var) {
  return [&var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    size_t parsed = 0;
    double value = 0;
    try {
      value = std::stod(std::string(p), &parsed);
    } catch (const std::logic_error&) {
      return kj::str("not a number: ", p);
    }
    if (parsed != p.size() || !std::isfinite(value)) {
      return kj::str("not a number: ", p);
    }
    if (value <= 0) return kj::str("must be positive: ", p);
    var = value;
    return true;
  };
};

std::string formatSeconds(double seconds) {
  std::ostringstream out;
  out << std::setprecision(15) << seconds;
  return out.str();
}

}  // namespace util
