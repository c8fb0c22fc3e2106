#ifndef SANDBOX_PROVISIONER_HPP
#define SANDBOX_PROVISIONER_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "absl/random/random.h"
#include "absl/synchronization/mutex.h"
#include "sandbox/box.hpp"
#include "sandbox/runtime.hpp"

namespace sandbox {

class ProvisionError : public std::runtime_error {
 public:
  explicit ProvisionError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ProvisionerOptions {
  std::string image = "python:3.13-alpine";
  std::string workdir = "/workspace";
  std::vector<std::string> keepalive_command = {"sleep", "3600"};
  int64_t memory_limit_mb = 0;
  std::string network;
};

// Starts and destroys sandboxes. A sandbox returned by Create is running and
// has its working directory in place.
class Provisioner {
 public:
  Provisioner(Runtime* runtime, ProvisionerOptions options)
      : runtime_(runtime), options_(std::move(options)) {}

  // Starts a new sandbox with a unique name. Throws ProvisionError if the
  // sandbox could not be started or initialized; in the latter case the
  // sandbox is destroyed before throwing.
  std::shared_ptr<Box> Create();

  // Force-stops and removes a sandbox. Failures are logged and never
  // reported, so it is safe to call it on unknown or destroyed sandboxes.
  void Destroy(const std::string& name);

  Provisioner(const Provisioner&) = delete;
  Provisioner& operator=(const Provisioner&) = delete;
  Provisioner(Provisioner&&) = delete;
  Provisioner& operator=(Provisioner&&) = delete;
  ~Provisioner() = default;

 private:
  std::string NewName();

  Runtime* runtime_;
  const ProvisionerOptions options_;

  absl::Mutex gen_mutex_;
  absl::BitGen gen_ GUARDED_BY(gen_mutex_);
};

}  // namespace sandbox

#endif
