#include "sandbox/main.hpp"
#include <unistd.h>
#include <iostream>
#include <system_error>

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/debug.h>
#include "policy/import_denylist.hpp"
#include "sandbox/launcher.hpp"
#include "sandbox/report.hpp"
#include "sandbox/runner.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace sandbox {

kj::MainBuilder::Validity Main::SetInput(kj::StringPtr path) {
  input_ = path;
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  std::string source;
  try {
    source = input_ == "-" ? util::File::ReadFd(STDIN_FILENO, "stdin")
                           : util::File::Read(input_);
  } catch (const std::system_error& exc) {
    return kj::str("Cannot read the fragment: ", exc.what());
  }

  kj::UnixEventPort::captureChildExit();
  kj::AsyncIoContext io = kj::setupAsyncIo();
  std::unique_ptr<Launcher> launcher = Launcher::Create(io);
  if (!launcher) return "No usable launcher on this system";

  policy::ImportDenylist denylist;
  RunnerOptions options;
  options.timeout_seconds = Flags::timeout_seconds;
  options.temp_directory = Flags::temp_directory;
  Runner runner(options, denylist, *launcher, io.provider->getTimer());

  ExecutionResult result = runner.Execute(source).wait(io.waitScope);
  KJ_LOG(INFO, "Fragment finished", TerminationName(result.termination),
         result.exit_status);
  std::cout << DumpJson(ToJson(result)) << std::endl;
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, util::banner,
                         "Validates a Python fragment and runs it in a "
                         "separate interpreter, under a wall-clock limit. "
                         "The fragment is read from FILE, or from stdin.")
      .addOptionWithArg({'t', "timeout"},
                        util::setPositiveDouble(Flags::timeout_seconds),
                        "<SECONDS>",
                        "Kill the interpreter after this many seconds")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where the programs should be written")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .expectOptionalArg("<FILE>", KJ_BIND_METHOD(*this, SetInput))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace sandbox
