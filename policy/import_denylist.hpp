#ifndef POLICY_IMPORT_DENYLIST_HPP
#define POLICY_IMPORT_DENYLIST_HPP

#include <string>
#include <vector>
#include "policy/policy.hpp"

namespace policy {

// Static filter on the imports of a fragment. The source is parsed with the
// grammar of the embedded Python interpreter:
//  - unparsable source is rejected with "Syntax error: <message>";
//  - every `import a.b` and `from a.b import c` is rejected with
//    "Forbidden import: a.b" when the module name contains one of the tokens
//    as a substring. This over-blocks on purpose: `import osprey` contains
//    "os", `import myopener` contains "open", and both are rejected.
//
// An accepted fragment is NOT safe. Only the import statements are inspected,
// so forbidden capabilities reached at runtime are not detected, for example
// through builtins (`getattr(__builtins__, "ev" + "al")`), through modules the
// fragment is allowed to use (`asyncio.create_subprocess_exec`), or through
// aliases of already imported modules.
class ImportDenylist : public Policy {
 public:
  // {os, subprocess, sys, __import__, eval, exec, open, file, input, compile,
  // reload}
  static const std::vector<std::string>& DefaultTokens();

  ImportDenylist() : ImportDenylist(DefaultTokens()) {}
  explicit ImportDenylist(std::vector<std::string> tokens);

  Verdict Check(const std::string& source) const override;

  // Returns true if module contains any of the tokens.
  bool IsForbidden(const std::string& module) const;

 private:
  std::vector<std::string> tokens_;
};

}  // namespace policy

#endif
