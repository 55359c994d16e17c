#ifndef SANDBOX_LAUNCHER_HPP
#define SANDBOX_LAUNCHER_HPP

#include <sys/types.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <kj/async-io.h>
#include <kj/async.h>
#include <kj/string.h>

namespace sandbox {

// What to start.
struct LaunchOptions {
  // Path of the program to exec. It is not looked up in $PATH.
  std::string executable;
  // Arguments after argv[0], which is always executable.
  std::vector<std::string> args;
  // Working directory of the child. Empty means the current one.
  std::string working_directory;
};

// Handle of a running child. Destroying the handle while the child is still
// running kills its process group.
class ChildProcess {
 public:
  virtual pid_t Pid() const = 0;

  // Read the whole standard output/error of the child, up to EOF. Each can be
  // called only once.
  virtual kj::Promise<kj::String> ReadStdout() = 0;
  virtual kj::Promise<kj::String> ReadStderr() = 0;

  // Resolves with the waitpid() status once the child has been reaped. Can be
  // called any number of times.
  virtual kj::Promise<int> OnExit() = 0;

  // Sends SIGKILL to the process group of the child, which also reaches the
  // processes it left behind after exiting.
  virtual void Kill() = 0;

  virtual ~ChildProcess() = default;
  ChildProcess() = default;
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess(ChildProcess&&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;
  ChildProcess& operator=(ChildProcess&&) = delete;
};

// Launcher interface. Implementations need to register themselves by creating
// a global object of type Launcher::Register<LauncherImpl> and should define
// the Create and Score static functions. Create should return a pointer to a
// newly allocated instance of the given implementation, using the given event
// loop, while Score should return a value that defines how "good" that
// launcher is: negative if the launcher should not/cannot be used in the
// current configuration, positive otherwise (a bigger value means a stronger
// isolation). Registering a launcher is not thread-safe and should be done
// before any threads are created.
class Launcher {
 public:
  using create_t = std::function<Launcher*(kj::AsyncIoContext&)>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Launcher> Create(kj::AsyncIoContext& io);

  // Starts a child process. The promise resolves once the executable is
  // running, and is rejected with a kj::Exception describing the problem if it
  // could not be started (in that case the child has already been reaped).
  virtual kj::Promise<kj::Own<ChildProcess>> Launch(
      const LaunchOptions& options) = 0;

  // Constructor and destructors
  virtual ~Launcher() = default;
  Launcher() = default;
  Launcher(const Launcher&) = delete;
  Launcher(Launcher&&) = delete;
  Launcher& operator=(const Launcher&) = delete;
  Launcher& operator=(Launcher&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Launcher::Register_(&T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Launchers_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
