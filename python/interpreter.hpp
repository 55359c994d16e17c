#ifndef PYTHON_INTERPRETER_HPP
#define PYTHON_INTERPRETER_HPP

#include <string>

namespace python {

// Starts the embedded CPython interpreter, unless it is already running. It is
// never finalized, since pybind11 objects may be cached for the whole lifetime
// of the process. Python's own signal handlers are not installed.
void EnsureInterpreter();

// "<major>.<minor>" of the embedded interpreter, e.g. "3.11".
std::string Version();

// Path of the python executable installed together with the embedded
// interpreter (BINDIR/python<major>.<minor>, then BINDIR/python3), so that
// programs run with the grammar they were validated with. Empty if there is
// no such executable.
std::string ExecutablePath();

}  // namespace python

#endif
