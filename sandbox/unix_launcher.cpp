#include "sandbox/unix_launcher.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <kj/debug.h>

namespace sandbox {
namespace {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr unsigned int kWrapFlags =
    kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
    kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC;

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

kj::Exception LaunchError(kj::String description) {
  return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                       kj::mv(description));
}

class UnixChildProcess : public ChildProcess {
 public:
  UnixChildProcess(pid_t pid, kj::UnixEventPort& event_port,
                   kj::Own<kj::AsyncInputStream> out,
                   kj::Own<kj::AsyncInputStream> err)
      : pid_(pid),
        running_(pid),
        stdout_(kj::mv(out)),
        stderr_(kj::mv(err)),
        exit_(event_port.onChildExit(running_).fork()) {}

  ~UnixChildProcess() override { Kill(); }

  pid_t Pid() const override { return pid_; }

  kj::Promise<kj::String> ReadStdout() override {
    return stdout_->readAllText();
  }
  kj::Promise<kj::String> ReadStderr() override {
    return stderr_->readAllText();
  }

  kj::Promise<int> OnExit() override { return exit_.addBranch(); }

  void Kill() override {
    // The pid is not reused while it is the pgid of a live process, so the
    // group can be killed even after the child has been reaped.
    if (kill(-pid_, SIGKILL) == -1 && errno != ESRCH) {
      KJ_LOG(WARNING, "Cannot kill process group", pid_, strerror(errno));
    }
    // Once the child is reaped its pid may belong to someone else.
    if (running_ == nullptr) return;
    // The group may not exist yet if the child did not reach setsid().
    if (kill(pid_, SIGKILL) == -1 && errno != ESRCH) {
      KJ_LOG(WARNING, "Cannot kill process", pid_, strerror(errno));
    }
  }

 private:
  pid_t pid_;
  kj::Maybe<pid_t> running_;  // Set to nullptr by kj once reaped.
  kj::Own<kj::AsyncInputStream> stdout_;
  kj::Own<kj::AsyncInputStream> stderr_;
  kj::ForkedPromise<int> exit_;
};

// Function that is executed in the child process. Errors are written to
// error_fd as "<prefix>: <strerror>". It must not allocate memory.
[[noreturn]] void Child(const char* executable, char* const* argv,
                        const char* working_directory, int stdout_fd,
                        int stderr_fd, int error_fd) {
  auto die = [error_fd](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    const char* msg = mystrerror(err, buf, kStrErrorBufSize);  // NOLINT
    char out[kStrErrorBufSize + 64 + 3] = {};
    strncat(out, prefix, 64);                // NOLINT
    strncat(out, ": ", 3);                   // NOLINT
    strncat(out, msg, kStrErrorBufSize - 1);  // NOLINT
    size_t len = strlen(out);                // NOLINT
    size_t pos = 0;
    while (pos < len) {
      ssize_t written = write(error_fd, out + pos, len - pos);  // NOLINT
      if (written == -1 && errno == EINTR) continue;
      if (written <= 0) break;
      pos += written;
    }
    _exit(UnixLauncher::kExecFailureStatus);
  };

  // Own session and process group, so that the whole group can be killed and
  // we do not receive Ctrl-Cs from the terminal.
  if (setsid() == -1) die("setsid", errno);

  // kj blocks SIGCHLD in the parent, and ignores SIGPIPE.
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  if (sigprocmask(SIG_SETMASK, &empty_mask, nullptr) == -1) {
    die("sigprocmask", errno);
  }
  if (signal(SIGPIPE, SIG_DFL) == SIG_ERR) die("signal", errno);

  int stdin_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);  // NOLINT
  if (stdin_fd == -1) die("open /dev/null", errno);
  if (dup2(stdin_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fd, STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fd, STDERR_FILENO) == -1) die("redir stderr", errno);

  if (working_directory[0] && chdir(working_directory) == -1) {
    die("chdir", errno);
  }

  execv(executable, argv);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _exit(UnixLauncher::kExecFailureStatus);
}

}  // namespace

const constexpr int UnixLauncher::kExecFailureStatus;

kj::Promise<kj::Own<ChildProcess>> UnixLauncher::Launch(
    const LaunchOptions& options) {
  return kj::evalNow([&]() { return Start(options); });
}

kj::Promise<kj::Own<ChildProcess>> UnixLauncher::Start(
    const LaunchOptions& options) {
  KJ_REQUIRE(!options.executable.empty(), "No executable to launch");

  // Everything the child needs is prepared before forking.
  std::vector<std::vector<char>> args;
  auto add_arg = [&args](const std::string& s) {
    std::vector<char> arg(s.size() + 1);
    std::copy(s.begin(), s.end(), arg.begin());
    arg.back() = '\0';
    args.push_back(std::move(arg));
  };
  add_arg(options.executable);
  for (const std::string& arg : options.args) add_arg(arg);
  std::vector<char*> argv(args.size() + 1);
  for (size_t i = 0; i < args.size(); i++) argv[i] = args[i].data();
  argv.back() = nullptr;

  int stdout_pipe[2];
  int stderr_pipe[2];
  int error_pipe[2];
  KJ_SYSCALL(pipe2(stdout_pipe, O_CLOEXEC));  // NOLINT
  kj::AutoCloseFd stdout_read(stdout_pipe[0]), stdout_write(stdout_pipe[1]);
  KJ_SYSCALL(pipe2(stderr_pipe, O_CLOEXEC));  // NOLINT
  kj::AutoCloseFd stderr_read(stderr_pipe[0]), stderr_write(stderr_pipe[1]);
  KJ_SYSCALL(pipe2(error_pipe, O_CLOEXEC));  // NOLINT
  kj::AutoCloseFd error_read(error_pipe[0]), error_write(error_pipe[1]);

  pid_t pid;
  KJ_SYSCALL(pid = fork());
  if (pid == 0) {
    Child(options.executable.c_str(), argv.data(),
          options.working_directory.c_str(), stdout_write.get(),
          stderr_write.get(), error_write.get());
  }
  KJ_LOG(INFO, "Started child", pid, options.executable);

  // Only the child must keep the write ends open, or we would never see EOF.
  stdout_write = nullptr;
  stderr_write = nullptr;
  error_write = nullptr;

  kj::Own<ChildProcess> child = kj::heap<UnixChildProcess>(
      pid, event_port_,
      provider_.wrapInputFd(stdout_read.release(), kWrapFlags),
      provider_.wrapInputFd(stderr_read.release(), kWrapFlags));

  // The error pipe is closed without data when exec succeeds.
  kj::Own<kj::AsyncInputStream> errors =
      provider_.wrapInputFd(error_read.release(), kWrapFlags);
  kj::Promise<kj::String> error_text = errors->readAllText();
  return error_text.attach(kj::mv(errors))
      .then([child = kj::mv(child)](kj::String error) mutable
            -> kj::Promise<kj::Own<ChildProcess>> {
        if (error.size() == 0) return kj::mv(child);
        kj::Promise<int> exited = child->OnExit();
        return exited.then(
            [child = kj::mv(child), error = kj::mv(error)](
                int /*status*/) mutable -> kj::Promise<kj::Own<ChildProcess>> {
              return LaunchError(kj::mv(error));
            });
      });
}

namespace {
Launcher::Register<UnixLauncher> r;  // NOLINT
}  // namespace

}  // namespace sandbox
