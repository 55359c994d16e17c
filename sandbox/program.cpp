#include "sandbox/program.hpp"

#include <cstdio>

namespace sandbox {
namespace {

const constexpr char* kIndent = "    ";
const constexpr char* kWhitespace = " \t\n\r\f\v";

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(kWhitespace) == std::string::npos;
}

}  // namespace

std::string IndentLines(const std::string& text, int levels) {
  std::string indent;
  for (int i = 0; i < levels; i++) indent += kIndent;
  std::string result;
  size_t start = 0;
  while (true) {
    size_t end = text.find('\n', start);
    std::string line = text.substr(start, end - start);
    if (!IsBlank(line)) result += indent;
    result += line;
    if (end == std::string::npos) break;
    result += '\n';
    start = end + 1;
  }
  return result;
}

std::string PythonStringLiteral(const std::string& value) {
  std::string literal = "\"";
  for (char c : value) {
    switch (c) {
      case '\\':
        literal += "\\\\";
        break;
      case '"':
        literal += "\\\"";
        break;
      case '\n':
        literal += "\\n";
        break;
      case '\r':
        literal += "\\r";
        break;
      case '\t':
        literal += "\\t";
        break;
      default: {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f) {
          char escaped[5];
          snprintf(escaped, sizeof(escaped), "\\x%02x", byte);  // NOLINT
          literal += escaped;
        } else {
          // Bytes >= 0x80 are part of the UTF-8 encoding of the path.
          literal += c;
        }
      }
    }
  }
  literal += '"';
  return literal;
}

std::string BuildProgram(const std::string& fragment,
                         const std::string& library_root) {
  std::string body = IsBlank(fragment) ? kIndent + std::string("pass")
                                       : IndentLines(fragment, 1);
  std::string program;
  program += "import asyncio\n";
  program += "import sys\n";
  program += "import json\n";
  program += "from pathlib import Path\n";
  program += "\n";
  program += "sys.path.insert(0, " + PythonStringLiteral(library_root) + ")\n";
  program += "\n";
  program += "async def main():\n";
  program += body + "\n";
  program += "\n";
  program += "if __name__ == \"__main__\":\n";
  program += "    asyncio.run(main())\n";
  return program;
}

}  // namespace sandbox
