#ifndef SANDBOX_DOCKER_HPP
#define SANDBOX_DOCKER_HPP

#include <string>
#include <utility>

#include "sandbox/runtime.hpp"

namespace sandbox {

// Runtime backed by the docker command-line client. Every sandbox is a
// detached container; commands run in it through `docker exec`.
class Docker : public Runtime {
 public:
  bool Start(const StartOptions& options, std::string* error_msg) override;
  bool Execute(const std::string& name, const ExecutionOptions& options,
               ExecutionInfo* info, std::string* error_msg) override;
  bool Remove(const std::string& name, std::string* error_msg) override;

  static Runtime* Create() { return new Docker(Locate("docker")); }
  static int Score() { return Locate("docker").empty() ? -1 : 2; }

 protected:
  explicit Docker(std::string binary) : binary_(std::move(binary)) {}

  // Full path of the client binary, or an empty string if it is not in PATH.
  static std::string Locate(const std::string& binary);

 private:
  std::string binary_;
};

// Podman accepts the same command line as docker.
class Podman : public Docker {
 public:
  static Runtime* Create() { return new Podman(); }
  static int Score() { return Locate("podman").empty() ? -1 : 1; }

 private:
  Podman() : Docker(Locate("podman")) {}
};

}  // namespace sandbox

#endif
