#include "policy/main.hpp"
#include "sandbox/main.hpp"
#include "util/version.hpp"

class SnipboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit SnipboxMain(kj::ProcessContext& context)
      : context(context), rm(&context), cm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, util::banner,
                           "Runs untrusted Python fragments in a time-boxed "
                           "interpreter process.")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "validate and run a fragment")
        .addSubCommand("check", KJ_BIND_METHOD(cm, getMain),
                       "only validate a fragment")
        .build();
  }

 private:
  kj::ProcessContext& context;
  sandbox::Main rm;
  policy::Main cm;
};

KJ_MAIN(SnipboxMain);
