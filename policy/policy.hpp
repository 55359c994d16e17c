#ifndef POLICY_POLICY_HPP
#define POLICY_POLICY_HPP

#include <string>
#include <utility>

namespace policy {

// Result of checking a fragment against a Policy.
struct Verdict {
  bool accepted = false;
  // Human-readable explanation of a rejection. Empty when accepted.
  std::string reason;

  static Verdict Accept() {
    Verdict verdict;
    verdict.accepted = true;
    return verdict;
  }
  static Verdict Reject(std::string reason) {
    Verdict verdict;
    verdict.reason = std::move(reason);
    return verdict;
  }
};

// Decides, before anything is executed, whether a fragment of Python source
// may run. Implementations must be pure functions of the source: the same
// source always gets the same verdict, and checking has no side effects.
class Policy {
 public:
  virtual Verdict Check(const std::string& source) const = 0;

  virtual ~Policy() = default;
  Policy() = default;
  Policy(const Policy&) = delete;
  Policy(Policy&&) = delete;
  Policy& operator=(const Policy&) = delete;
  Policy& operator=(Policy&&) = delete;
};

}  // namespace policy

#endif
