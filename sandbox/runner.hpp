#ifndef SANDBOX_RUNNER_HPP
#define SANDBOX_RUNNER_HPP

#include <string>

#include <kj/async.h>
#include <kj/time.h>
#include <kj/timer.h>
#include "policy/policy.hpp"
#include "sandbox/launcher.hpp"

namespace sandbox {

// Terminal state of an Execute call.
enum class Termination {
  kRejected,     // The policy refused the fragment, nothing was run.
  kCompleted,    // The interpreter exited (or was killed by a signal).
  kTimedOut,     // The interpreter was killed at the deadline.
  kSpawnFailed,  // The interpreter could not be started.
};

// Outcome of running a fragment. stderr_data always explains a failure.
struct ExecutionResult {
  static const constexpr int kRejectedStatus = 1;
  static const constexpr int kTimeoutStatus = -1;
  static const constexpr int kSpawnFailureStatus = 127;

  // True iff exit_status is 0.
  bool succeeded = false;
  std::string stdout_data;
  std::string stderr_data;
  // Exit code of the interpreter, 128 + signal number if it was killed by a
  // signal, or one of the constants above.
  int exit_status = 0;
  Termination termination = Termination::kCompleted;

  static ExecutionResult Rejected(const std::string& reason);
  // wait_status is a status as returned by waitpid().
  static ExecutionResult Completed(int wait_status, std::string out,
                                   std::string err);
  static ExecutionResult TimedOut(double timeout_seconds);
  static ExecutionResult SpawnFailed(const std::string& description);
};

struct RunnerOptions {
  // Wall-clock limit of each execution. Must be positive.
  double timeout_seconds = 30;
  // Interpreter to run. Empty means the executable of the embedded
  // interpreter the policy parses with, or python3 from $PATH if it has none.
  std::string interpreter;
  // Working directory of the interpreter, and the directory put first in its
  // sys.path. Empty means the current directory at construction.
  std::string working_directory;
  // Where the programs are written. Empty means Flags::temp_directory.
  std::string temp_directory;
};

// Runs fragments of Python source in a separate interpreter process:
//  - the fragment is checked by the policy, and a rejected fragment never
//    reaches the filesystem nor a process;
//  - otherwise it is wrapped by BuildProgram into a uniquely named
//    temporary file and the interpreter is started on it by the launcher;
//  - the whole standard output and error are collected once the interpreter
//    exits, unless the deadline expires first: then its process group is
//    killed and reaped, and whatever it printed is discarded.
// The temporary file is removed in every case. Failures to run the fragment
// are reported in the result, a rejected promise means an internal error.
// Concurrent calls share nothing but the collaborators, which must outlive the
// runner; the runner must outlive the promises it returns.
class Runner {
 public:
  Runner(const RunnerOptions& options, const policy::Policy& policy,
         Launcher& launcher, kj::Timer& timer);

  kj::Promise<ExecutionResult> Execute(const std::string& source);

 private:
  kj::Promise<ExecutionResult> Start(const std::string& source);
  kj::Promise<ExecutionResult> Supervise(kj::Own<ChildProcess> child);

  double timeout_seconds_;
  kj::Duration timeout_;
  std::string interpreter_;
  std::string working_directory_;
  std::string temp_directory_;
  const policy::Policy& policy_;
  Launcher& launcher_;
  kj::Timer& timer_;
};

}  // namespace sandbox

#endif
