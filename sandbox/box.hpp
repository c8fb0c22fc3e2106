#ifndef SANDBOX_BOX_HPP
#define SANDBOX_BOX_HPP

#include <string>
#include <utility>

#include "absl/synchronization/mutex.h"

namespace sandbox {

// A running sandbox. Shared between the session that owns it and the
// executions currently using it.
class Box {
 public:
  explicit Box(std::string name) : name_(std::move(name)) {}

  const std::string& Name() const { return name_; }

  // Held for the whole duration of an execution inside this sandbox.
  absl::Mutex* ExecutionMutex() { return &execution_mutex_; }

  Box(const Box&) = delete;
  Box& operator=(const Box&) = delete;
  Box(Box&&) = delete;
  Box& operator=(Box&&) = delete;

 private:
  const std::string name_;
  absl::Mutex execution_mutex_;
};

}  // namespace sandbox

#endif
