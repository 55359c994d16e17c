#ifndef SANDBOX_PROGRAM_HPP
#define SANDBOX_PROGRAM_HPP

#include <string>

namespace sandbox {

// Builds the script that is actually executed: the fragment becomes the body
// of `async def main()`, run through asyncio.run. Before it, a prelude imports
// asyncio, sys, json and pathlib.Path, and puts library_root first in
// sys.path, so that the fragment can await coroutines, use the prelude modules
// without importing them, and import the modules that live in library_root.
std::string BuildProgram(const std::string& fragment,
                         const std::string& library_root);

// Prefixes every line of text with four spaces per level. Lines made only of
// whitespace are left untouched.
std::string IndentLines(const std::string& text, int levels);

// Returns a double-quoted Python string literal that evaluates to value.
std::string PythonStringLiteral(const std::string& value);

}  // namespace sandbox

#endif
