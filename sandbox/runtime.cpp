#include "sandbox/runtime.hpp"

#include "glog/logging.h"

namespace sandbox {

Runtime::store_t* Runtime::Runtimes_() {
  static store_t* runtimes = new store_t;
  return runtimes;
}

void Runtime::Register_(const std::string& name, Runtime::create_t create,
                        Runtime::score_t score) {
  Runtimes_()->push_back(Entry{name, std::move(create), std::move(score)});
}

std::unique_ptr<Runtime> Runtime::Create(const std::string& name) {
  const store_t& runtimes = *Runtimes_();
  const Entry* best = nullptr;
  int best_score = 0;
  for (const Entry& entry : runtimes) {
    if (!name.empty() && entry.name != name) continue;
    int score = entry.score();
    if (score > best_score) {
      best_score = score;
      best = &entry;
    }
  }
  if (best == nullptr) {
    if (name.empty()) {
      LOG(ERROR) << "No sandbox runtime could be found";
    } else {
      LOG(ERROR) << "Sandbox runtime " << name << " is not available";
    }
    return nullptr;
  }
  LOG(INFO) << "Using sandbox runtime " << best->name;
  return std::unique_ptr<Runtime>(best->create());
}

}  // namespace sandbox
