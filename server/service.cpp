#include "server/service.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "nlohmann/json.hpp"

namespace server {

namespace {

// Splits the listing in lines, like str.splitlines does: a trailing newline
// does not produce an empty last line.
std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines = absl::StrSplit(text, '\n');
  if (!lines.empty() && lines.back().empty()) lines.pop_back();
  return lines;
}

}  // namespace

grpc::Status Service::Run(grpc::ServerContext* /*context*/,
                          const proto::RunRequest* request,
                          proto::RunResponse* response) {
  if (request->code().empty() || request->user_id().empty()) {
    LOG(WARNING) << "Bad request: code or user_id missing";
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "Code and user_id required");
  }
  nlohmann::ordered_json variables = nlohmann::ordered_json::object();
  if (!request->data().empty()) {
    try {
      variables = nlohmann::ordered_json::parse(request->data());
    } catch (const nlohmann::json::parse_error& exc) {
      LOG(WARNING) << "Bad request: invalid data: " << exc.what();
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                          std::string("Invalid data: ") + exc.what());
    }
    if (!variables.is_object()) {
      LOG(WARNING) << "Bad request: data is not an object";
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                          "Data must be a JSON object");
    }
  }
  const std::string& user_id = request->user_id();
  LOG(INFO) << "Received run request from user " << user_id;

  std::shared_ptr<sandbox::Box> box;
  try {
    box = registry_->Resolve(user_id);
  } catch (const sandbox::ProvisionError& exc) {
    LOG(ERROR) << "Failed to create a sandbox for user " << user_id << ": "
               << exc.what();
    return grpc::Status(grpc::StatusCode::INTERNAL,
                        std::string("Could not create sandbox: ") + exc.what());
  }

  executor::Outcome outcome;
  try {
    outcome = engine_->Execute(box.get(), request->code(), variables);
  } catch (const std::runtime_error& exc) {
    LOG(ERROR) << exc.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, exc.what());
  }

  response->set_result(outcome.result.dump());
  for (std::string& line : SplitLines(inspector_->List(*box))) {
    response->add_workspace_files(std::move(line));
  }
  if (!outcome.Success()) response->set_error(outcome.error_message);
  return grpc::Status::OK;
}

}  // namespace server
