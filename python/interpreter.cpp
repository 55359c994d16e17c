#include "python/interpreter.hpp"

#include <unistd.h>

#include <kj/debug.h>
#include <pybind11/embed.h>
#include "util/file.hpp"

namespace py = pybind11;

namespace python {

void EnsureInterpreter() {
  if (Py_IsInitialized()) return;
  KJ_LOG(INFO, "Starting the embedded Python interpreter", PY_VERSION);
  py::initialize_interpreter(/*init_signal_handlers=*/false);
}

std::string Version() {
  return std::to_string(PY_MAJOR_VERSION) + "." +
         std::to_string(PY_MINOR_VERSION);
}

std::string ExecutablePath() {
  EnsureInterpreter();
  py::object bindir =
      py::module_::import("sysconfig").attr("get_config_var")("BINDIR");
  if (bindir.is_none()) {
    KJ_LOG(WARNING, "The embedded interpreter has no BINDIR");
    return "";
  }
  std::string dir = bindir.cast<std::string>();
  const std::string names[] = {"python" + Version(), "python3"};
  for (const std::string& name : names) {
    std::string path = util::File::JoinPath(dir, name);
    if (util::File::IsRegular(path) && access(path.c_str(), X_OK) == 0) {
      return path;
    }
  }
  KJ_LOG(WARNING, "No executable for the embedded interpreter", dir,
         Version());
  return "";
}

}  // namespace python
