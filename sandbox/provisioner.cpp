#include "sandbox/provisioner.hpp"

#include "absl/strings/str_format.h"
#include "glog/logging.h"

namespace sandbox {

std::string Provisioner::NewName() {
  absl::MutexLock lck(&gen_mutex_);
  return absl::StrFormat("sandbox-%08x", absl::Uniform<uint32_t>(gen_));
}

std::shared_ptr<Box> Provisioner::Create() {
  std::string name = NewName();
  LOG(INFO) << "Attempting to create sandbox: " << name;

  StartOptions start_options;
  start_options.name = name;
  start_options.image = options_.image;
  start_options.command = options_.keepalive_command;
  start_options.memory_limit_mb = options_.memory_limit_mb;
  start_options.network = options_.network;
  std::string error_msg;
  if (!runtime_->Start(start_options, &error_msg)) {
    LOG(ERROR) << error_msg;
    throw ProvisionError(error_msg);
  }
  LOG(INFO) << "Sandbox " << name << " started successfully.";

  ExecutionOptions mkdir_options({"mkdir", "-p", options_.workdir});
  ExecutionInfo info;
  bool created = runtime_->Execute(name, mkdir_options, &info, &error_msg);
  if (!created || !info.Success()) {
    LOG(ERROR) << "Error creating workspace in " << name << ". Cleaning up.";
    Destroy(name);
    throw ProvisionError("Error creating workspace: " +
                         (created ? info.stderr_data : error_msg));
  }
  LOG(INFO) << "Workspace created in " << name << ".";
  return std::make_shared<Box>(name);
}

void Provisioner::Destroy(const std::string& name) {
  LOG(INFO) << "Destroying sandbox: " << name;
  std::string error_msg;
  if (!runtime_->Remove(name, &error_msg)) {
    LOG(WARNING) << "Failed to destroy sandbox " << name << ": " << error_msg;
  }
}

}  // namespace sandbox
