#include "sandbox/launcher.hpp"

#include <kj/debug.h>

namespace sandbox {

Launcher::store_t* Launcher::Launchers_() {
  static store_t* launchers = new store_t;
  return launchers;
}

void Launcher::Register_(Launcher::create_t create, Launcher::score_t score) {
  Launchers_()->emplace_back(create, score);
}

std::unique_ptr<Launcher> Launcher::Create(kj::AsyncIoContext& io) {
  const store_t& launchers = *Launchers_();
  int best_score = 0;
  const create_t* best = nullptr;
  for (const auto& launcher : launchers) {
    int score = launcher.second();
    if (score > best_score) {
      best_score = score;
      best = &launcher.first;
    }
  }
  if (best == nullptr) {
    KJ_LOG(ERROR, "No launcher could be found", launchers.size());
    return nullptr;
  }
  return std::unique_ptr<Launcher>((*best)(io));
}

}  // namespace sandbox
