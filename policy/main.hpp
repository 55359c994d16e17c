#ifndef POLICY_MAIN_HPP
#define POLICY_MAIN_HPP
#include <kj/main.h>
#include <string>

namespace policy {

// The "check" subcommand: only validates a fragment and prints the verdict as
// JSON on stdout.
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
}  // namespace policy
#endif
