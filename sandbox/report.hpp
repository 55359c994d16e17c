#ifndef SANDBOX_REPORT_HPP
#define SANDBOX_REPORT_HPP

#include <string>
#include "nlohmann/json.hpp"
#include "sandbox/runner.hpp"

namespace sandbox {

// "rejected", "completed", "timed_out" or "spawn_failed".
const char* TerminationName(Termination termination);

// {"success": bool, "stdout": str, "stderr": str, "exit_code": int,
//  "termination": str}
nlohmann::json ToJson(const ExecutionResult& result);

// Serializes j, replacing invalid UTF-8 (the output of a fragment is arbitrary
// bytes) with U+FFFD.
std::string DumpJson(const nlohmann::json& j);

}  // namespace sandbox

#endif
