#include "policy/import_denylist.hpp"

#include <kj/debug.h>
#include <pybind11/pybind11.h>
#include "python/interpreter.hpp"

namespace py = pybind11;

namespace policy {

const std::vector<std::string>& ImportDenylist::DefaultTokens() {
  static const std::vector<std::string> tokens = {
      "os",   "subprocess", "sys",   "__import__", "eval",  "exec",
      "open", "file",       "input", "compile",    "reload"};
  return tokens;
}

ImportDenylist::ImportDenylist(std::vector<std::string> tokens)
    : tokens_(std::move(tokens)) {
  for (const std::string& token : tokens_) {
    KJ_REQUIRE(!token.empty(), "An empty token would forbid every import");
  }
}

bool ImportDenylist::IsForbidden(const std::string& module) const {
  for (const std::string& token : tokens_) {
    if (module.find(token) != std::string::npos) return true;
  }
  return false;
}

Verdict ImportDenylist::Check(const std::string& source) const {
  python::EnsureInterpreter();
  py::module_ ast = py::module_::import("ast");

  py::object tree;
  try {
    // Passing bytes lets the parser report invalid UTF-8 as a syntax error.
    tree = ast.attr("parse")(py::bytes(source));
  } catch (py::error_already_set& err) {
    // Null bytes raise ValueError instead of SyntaxError on some versions.
    if (!err.matches(PyExc_SyntaxError) && !err.matches(PyExc_ValueError)) {
      throw;
    }
    return Verdict::Reject("Syntax error: " +
                           py::str(err.value()).cast<std::string>());
  }

  py::object import_type = ast.attr("Import");
  py::object import_from_type = ast.attr("ImportFrom");
  for (py::handle node : ast.attr("walk")(tree)) {
    if (py::isinstance(node, import_type)) {
      for (py::handle alias : node.attr("names")) {
        std::string module = alias.attr("name").cast<std::string>();
        if (IsForbidden(module)) {
          return Verdict::Reject("Forbidden import: " + module);
        }
      }
    } else if (py::isinstance(node, import_from_type)) {
      py::object module = node.attr("module");
      // `from . import x` has no module name.
      if (module.is_none()) continue;
      std::string name = module.cast<std::string>();
      if (IsForbidden(name)) {
        return Verdict::Reject("Forbidden import: " + name);
      }
    }
  }
  return Verdict::Accept();
}

}  // namespace policy
