#include "sandbox/report.hpp"

#include <kj/debug.h>

namespace sandbox {

const char* TerminationName(Termination termination) {
  switch (termination) {
    case Termination::kRejected:
      return "rejected";
    case Termination::kCompleted:
      return "completed";
    case Termination::kTimedOut:
      return "timed_out";
    case Termination::kSpawnFailed:
      return "spawn_failed";
  }
  KJ_FAIL_ASSERT("Unknown termination", static_cast<int>(termination));
}

nlohmann::json ToJson(const ExecutionResult& result) {
  nlohmann::json j;
  j["success"] = result.succeeded;
  j["stdout"] = result.stdout_data;
  j["stderr"] = result.stderr_data;
  j["exit_code"] = result.exit_status;
  j["termination"] = TerminationName(result.termination);
  return j;
}

std::string DumpJson(const nlohmann::json& j) {
  return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace sandbox
