#ifndef SANDBOX_UNIX_LAUNCHER_HPP
#define SANDBOX_UNIX_LAUNCHER_HPP
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include "sandbox/launcher.hpp"

namespace sandbox {

// Launcher for UNIX-like systems, based on fork and exec. The child gets its
// own session (and process group), an empty signal mask, /dev/null as stdin
// and pipes as stdout and stderr. No other isolation is applied.
// kj::UnixEventPort::captureChildExit() must have been called before the event
// loop was created.
class UnixLauncher : public Launcher {
 public:
  UnixLauncher(kj::LowLevelAsyncIoProvider& provider,
               kj::UnixEventPort& event_port)
      : provider_(provider), event_port_(event_port) {}

  kj::Promise<kj::Own<ChildProcess>> Launch(
      const LaunchOptions& options) override;

  static Launcher* Create(kj::AsyncIoContext& io) {
    return new UnixLauncher(*io.lowLevelProvider, io.unixEventPort);
  }
  static int Score() { return 1; }

  // Exit status of a child that could not exec the program.
  static const constexpr int kExecFailureStatus = 127;

 private:
  kj::Promise<kj::Own<ChildProcess>> Start(const LaunchOptions& options);

  kj::LowLevelAsyncIoProvider& provider_;
  kj::UnixEventPort& event_port_;
};

}  // namespace sandbox
#endif
