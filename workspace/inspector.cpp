#include "workspace/inspector.hpp"

#include "glog/logging.h"

namespace workspace {

const char Inspector::kListingError[] = "Error listing files";

std::string Inspector::List(const sandbox::Box& box) {
  sandbox::ExecutionOptions options({"ls", "-lR", workdir_});
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!runtime_->Execute(box.Name(), options, &info, &error_msg)) {
    LOG(WARNING) << "Failed to list files in workspace for " << box.Name()
                 << ": " << error_msg;
    return kListingError;
  }
  if (!info.Success()) {
    LOG(WARNING) << "Failed to list files in workspace for " << box.Name()
                 << ": " << info.stderr_data;
    return kListingError;
  }
  return info.stdout_data;
}

}  // namespace workspace
