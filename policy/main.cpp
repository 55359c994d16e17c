#include "policy/main.hpp"
#include <unistd.h>
#include <iostream>
#include <system_error>

#include <kj/debug.h>
#include "nlohmann/json.hpp"
#include "policy/import_denylist.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace policy {

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

  ImportDenylist denylist;
  Verdict verdict = denylist.Check(source);
  KJ_LOG(INFO, "Fragment checked", verdict.accepted, verdict.reason);

  nlohmann::json j;
  j["valid"] = verdict.accepted;
  if (verdict.accepted) {
    j["error"] = nullptr;
  } else {
    j["error"] = verdict.reason;
  }
  std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, util::banner,
                         "Checks that a Python fragment parses and does not "
                         "import forbidden modules, without running it. "
                         "The fragment is read from FILE, or from stdin.")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .expectOptionalArg("<FILE>", KJ_BIND_METHOD(*this, SetInput))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace policy
