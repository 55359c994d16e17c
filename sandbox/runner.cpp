#include "sandbox/runner.hpp"

#include <sys/wait.h>
#include <cmath>
#include <system_error>

#include <kj/array.h>
#include <kj/debug.h>
#include "python/interpreter.hpp"
#include "sandbox/program.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace sandbox {
namespace {

const constexpr char* kDefaultInterpreter = "python3";
const constexpr double kMaxTimeoutSeconds = 1e9;

std::string ToStdString(const kj::String& text) {
  return std::string(text.cStr(), text.size());
}

kj::Duration CheckedTimeout(double seconds) {
  KJ_REQUIRE(std::isfinite(seconds) && seconds > 0 &&
                 seconds < kMaxTimeoutSeconds,
             "Invalid timeout", seconds);
  return static_cast<int64_t>(std::llround(seconds * 1e9)) * kj::NANOSECONDS;
}

}  // namespace

const constexpr int ExecutionResult::kRejectedStatus;
const constexpr int ExecutionResult::kTimeoutStatus;
const constexpr int ExecutionResult::kSpawnFailureStatus;

ExecutionResult ExecutionResult::Rejected(const std::string& reason) {
  ExecutionResult result;
  result.stderr_data = reason;
  result.exit_status = kRejectedStatus;
  result.termination = Termination::kRejected;
  return result;
}

ExecutionResult ExecutionResult::Completed(int wait_status, std::string out,
                                           std::string err) {
  ExecutionResult result;
  if (WIFEXITED(wait_status)) {
    result.exit_status = WEXITSTATUS(wait_status);
  } else if (WIFSIGNALED(wait_status)) {
    result.exit_status = 128 + WTERMSIG(wait_status);
  } else {
    result.exit_status = wait_status;
  }
  result.succeeded = result.exit_status == 0;
  result.stdout_data = std::move(out);
  result.stderr_data = std::move(err);
  result.termination = Termination::kCompleted;
  return result;
}

ExecutionResult ExecutionResult::TimedOut(double timeout_seconds) {
  ExecutionResult result;
  result.stderr_data = "Execution timeout after " +
                       util::formatSeconds(timeout_seconds) + " seconds";
  result.exit_status = kTimeoutStatus;
  result.termination = Termination::kTimedOut;
  return result;
}

ExecutionResult ExecutionResult::SpawnFailed(const std::string& description) {
  ExecutionResult result;
  result.stderr_data = description;
  result.exit_status = kSpawnFailureStatus;
  result.termination = Termination::kSpawnFailed;
  return result;
}

Runner::Runner(const RunnerOptions& options, const policy::Policy& policy,
               Launcher& launcher, kj::Timer& timer)
    : timeout_seconds_(options.timeout_seconds),
      timeout_(CheckedTimeout(options.timeout_seconds)),
      policy_(policy),
      launcher_(launcher),
      timer_(timer) {
  std::string embedded = python::ExecutablePath();
  interpreter_ = options.interpreter;
  if (interpreter_.empty()) interpreter_ = embedded;
  if (interpreter_.empty()) {
    interpreter_ = util::which(kDefaultInterpreter);
    // Let the launch fail, and report it, on every execution.
    if (interpreter_.empty()) interpreter_ = kDefaultInterpreter;
  }
  if (interpreter_ != embedded) {
    KJ_LOG(WARNING, "Fragments are validated with a different interpreter",
           interpreter_, embedded, python::Version());
  }
  working_directory_ = options.working_directory.empty()
                           ? util::File::CurrentDirectory()
                           : options.working_directory;
  temp_directory_ = options.temp_directory.empty() ? Flags::temp_directory
                                                   : options.temp_directory;
  KJ_LOG(INFO, "Runner ready", interpreter_, working_directory_,
         temp_directory_, timeout_seconds_);
}

kj::Promise<ExecutionResult> Runner::Execute(const std::string& source) {
  return kj::evalNow([&]() { return Start(source); });
}

kj::Promise<ExecutionResult> Runner::Start(const std::string& source) {
  policy::Verdict verdict = policy_.Check(source);
  if (!verdict.accepted) {
    KJ_LOG(INFO, "Fragment rejected", verdict.reason);
    return ExecutionResult::Rejected(verdict.reason);
  }

  kj::Own<util::TempFile> program;
  try {
    program = kj::heap<util::TempFile>(temp_directory_, "snippet_", ".py");
    program->Write(BuildProgram(source, working_directory_));
  } catch (const std::system_error& exc) {
    KJ_LOG(WARNING, "Cannot write the program", temp_directory_, exc.what());
    return ExecutionResult::SpawnFailed(
        std::string("Cannot write the program: ") + exc.what());
  }

  LaunchOptions options;
  options.executable = interpreter_;
  options.args = {program->Path()};
  options.working_directory = working_directory_;
  KJ_LOG(INFO, "Executing fragment", program->Path());

  return launcher_.Launch(options)
      .then(
          [this](kj::Own<ChildProcess> child) {
            return Supervise(kj::mv(child));
          },
          [this](kj::Exception&& exc) -> kj::Promise<ExecutionResult> {
            KJ_LOG(WARNING, "Cannot start the interpreter", interpreter_,
                   exc.getDescription());
            return ExecutionResult::SpawnFailed(
                "Cannot start " + interpreter_ + ": " +
                std::string(exc.getDescription().cStr()));
          })
      .then([program = kj::mv(program)](ExecutionResult result) mutable {
        // Removes the program before the result is handed out.
        program = nullptr;
        return result;
      });
}

kj::Promise<ExecutionResult> Runner::Supervise(kj::Own<ChildProcess> child) {
  ChildProcess& process = *child;

  // Both pipes are drained while waiting, or a chatty child would block.
  auto streams = kj::heapArrayBuilder<kj::Promise<kj::String>>(2);
  streams.add(process.ReadStdout());
  streams.add(process.ReadStderr());
  kj::Promise<kj::Array<kj::String>> output =
      kj::joinPromises(streams.finish()).eagerlyEvaluate(nullptr);

  kj::Promise<kj::Maybe<ExecutionResult>> completed = process.OnExit().then(
      [output = kj::mv(output)](int status) mutable {
        return output.then([status](kj::Array<kj::String> texts)
                               -> kj::Maybe<ExecutionResult> {
          return ExecutionResult::Completed(status, ToStdString(texts[0]),
                                            ToStdString(texts[1]));
        });
      });
  kj::Promise<kj::Maybe<ExecutionResult>> deadline =
      timer_.afterDelay(timeout_).then(
          []() -> kj::Maybe<ExecutionResult> { return nullptr; });

  return kj::mv(completed)
      .exclusiveJoin(kj::mv(deadline))
      .then([this, &process](kj::Maybe<ExecutionResult> result)
                -> kj::Promise<ExecutionResult> {
        KJ_IF_MAYBE(finished, result) { return kj::mv(*finished); }
        KJ_LOG(WARNING, "Deadline expired, killing the interpreter",
               process.Pid(), timeout_seconds_);
        process.Kill();
        return process.OnExit().then([this](int /*status*/) {
          return ExecutionResult::TimedOut(timeout_seconds_);
        });
      })
      .attach(kj::mv(child));
}

}  // namespace sandbox
