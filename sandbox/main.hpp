#ifndef SANDBOX_MAIN_HPP
#define SANDBOX_MAIN_HPP
#include <kj/main.h>
#include <string>

namespace sandbox {

// The "run" subcommand: validates a fragment, runs it and prints the result
// as JSON on stdout.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::MainBuilder::Validity SetInput(kj::StringPtr path);

  kj::ProcessContext& context;
  std::string input_ = "-";
};
}  // namespace sandbox
#endif
