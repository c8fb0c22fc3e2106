#include "sandbox/docker.hpp"

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/which.hpp"

namespace sandbox {

std::string Docker::Locate(const std::string& binary) {
  try {
    return util::which(binary, /*use_cache=*/false);
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Cannot look for " << binary << ": " << exc.what();
    return "";
  }
}

bool Docker::Start(const StartOptions& options, std::string* error_msg) {
  std::vector<std::string> args = {binary_, "run", "-d", "--name",
                                   options.name};
  if (options.memory_limit_mb != 0) {
    args.push_back("--memory");
    args.push_back(absl::StrCat(options.memory_limit_mb, "m"));
  }
  if (!options.network.empty()) {
    args.push_back("--network");
    args.push_back(options.network);
  }
  args.push_back(options.image);
  args.insert(args.end(), options.command.begin(), options.command.end());
  VLOG(1) << "Running " << absl::StrJoin(args, " ");

  util::ProcessInfo info;
  if (!util::Process::Run(util::ProcessOptions(std::move(args)), &info,
                          error_msg)) {
    *error_msg = "Error starting container: " + *error_msg;
    return false;
  }
  if (!info.Success()) {
    *error_msg = "Error starting container: " + info.stderr_data;
    return false;
  }
  return true;
}

bool Docker::Execute(const std::string& name, const ExecutionOptions& options,
                     ExecutionInfo* info, std::string* error_msg) {
  std::vector<std::string> args = {binary_, "exec"};
  if (!options.stdin_data.empty()) args.push_back("-i");
  if (!options.workdir.empty()) {
    args.push_back("-w");
    args.push_back(options.workdir);
  }
  args.push_back(name);
  args.insert(args.end(), options.args.begin(), options.args.end());

  util::ProcessOptions process_options(std::move(args));
  process_options.stdin_data = options.stdin_data;
  process_options.wall_limit_millis = options.wall_limit_millis;
  process_options.max_output_bytes = options.max_output_bytes;
  return util::Process::Run(process_options, info, error_msg);
}

bool Docker::Remove(const std::string& name, std::string* error_msg) {
  util::ProcessInfo info;
  if (!util::Process::Run(util::ProcessOptions({binary_, "rm", "-f", name}),
                          &info, error_msg)) {
    return false;
  }
  if (!info.Success()) {
    *error_msg = info.stderr_data;
    return false;
  }
  return true;
}

namespace {
Runtime::Register<Docker> r_docker("docker");  // NOLINT
Runtime::Register<Podman> r_podman("podman");  // NOLINT
}  // namespace

}  // namespace sandbox
