#include "process/runner.hpp"

#include <mutex>

#include "glog/logging.h"

namespace process {

Runner::store_t* Runner::Runners_() {
  static store_t* runners = new store_t;
  return runners;
}

void Runner::Register_(Runner::create_t create, Runner::score_t score) {
  Runners_()->emplace_back(create, score);
}

std::unique_ptr<Runner> Runner::Create() {
  static std::once_flag choose;
  static unsigned best_runner = -1U;
  const store_t& runners = *Runners_();
  std::call_once(choose, [&runners]() {
    int best_score = 0;
    for (unsigned i = 0; i < runners.size(); i++) {
      int score = runners[i].second();
      if (score > best_score) {
        best_score = score;
        best_runner = i;
      }
    }
  });
  if (best_runner == -1U) {
    LOG(ERROR) << "No process runner could be found";
    return nullptr;
  }
  return std::unique_ptr<Runner>(runners[best_runner].first());
}

}  // namespace process
