#include "session/reaper.hpp"

#include "glog/logging.h"

namespace session {

void Reaper::Start() {
  LOG(INFO) << "Starting reaper: sweeping every " << interval_
            << ", idle timeout " << idle_timeout_;
  thread_ = std::thread(&Reaper::Loop, this);
}

void Reaper::Stop() {
  {
    absl::MutexLock lck(&mutex_);
    stopping_ = true;
  }
  if (thread_.joinable()) {
    thread_.join();
    LOG(INFO) << "Reaper stopped";
  }
}

size_t Reaper::Sweep() { return registry_->Reap(idle_timeout_, clock_()); }

void Reaper::Loop() {
  while (true) {
    {
      absl::MutexLock lck(&mutex_);
      if (mutex_.AwaitWithTimeout(absl::Condition(&stopping_), interval_)) {
        return;
      }
    }
    Sweep();
  }
}

}  // namespace session
