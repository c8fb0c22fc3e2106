#ifndef SESSION_REAPER_HPP
#define SESSION_REAPER_HPP

#include <cstddef>
#include <thread>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "session/registry.hpp"

namespace session {

// Background task that periodically destroys the sessions of the registry
// that have been idle for too long.
class Reaper {
 public:
  Reaper(Registry* registry, absl::Duration interval,
         absl::Duration idle_timeout,
         Registry::Clock clock = absl::Now)
      : registry_(registry),
        interval_(interval),
        idle_timeout_(idle_timeout),
        clock_(std::move(clock)) {}

  // Starts the background thread. Must be called at most once.
  void Start();

  // Wakes the background thread and waits for it to exit. Safe to call
  // more than once, and without a previous Start.
  void Stop();

  // Runs a single pass. Returns the number of removed sessions.
  size_t Sweep();

  ~Reaper() { Stop(); }
  Reaper(const Reaper&) = delete;
  Reaper& operator=(const Reaper&) = delete;
  Reaper(Reaper&&) = delete;
  Reaper& operator=(Reaper&&) = delete;

 private:
  void Loop();

  Registry* registry_;
  const absl::Duration interval_;
  const absl::Duration idle_timeout_;
  Registry::Clock clock_;

  absl::Mutex mutex_;
  bool stopping_ GUARDED_BY(mutex_) = false;
  std::thread thread_;
};

}  // namespace session

#endif
