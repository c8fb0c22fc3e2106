#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpcpp/grpcpp.h"
#include "nlohmann/json.hpp"
#include "proto/sessionbox.grpc.pb.h"
#include "util/file.hpp"

DEFINE_string(server, "localhost:5000", "server to connect to");
DEFINE_string(user_id, "", "session the code runs in");
DEFINE_string(code_file, "-", "file with the code to run, - for stdin");
DEFINE_string(data, "", "JSON object with the variables of the code");

namespace {

std::string ReadCode(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  return util::File::Read(path);
}

// File names in the listing are not guaranteed to be valid UTF-8.
void Print(const nlohmann::json& value) {
  std::cout << value.dump(2, ' ', false,
                          nlohmann::json::error_handler_t::replace)
            << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs code in the sandbox of a session");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  CHECK_NE(FLAGS_user_id, "") << "You need to specify a user!";

  proto::RunRequest request;
  request.set_code(ReadCode(FLAGS_code_file));
  request.set_data(FLAGS_data);
  request.set_user_id(FLAGS_user_id);

  std::unique_ptr<proto::SessionBox::Stub> stub(proto::SessionBox::NewStub(
      grpc::CreateChannel(FLAGS_server, grpc::InsecureChannelCredentials())));
  grpc::ClientContext context;
  proto::RunResponse response;
  grpc::Status status = stub->Run(&context, request, &response);
  if (!status.ok()) {
    nlohmann::json error = {{"error", status.error_message()}};
    Print(error);
    return 1;
  }

  nlohmann::json output;
  try {
    output["result"] = nlohmann::json::parse(response.result());
  } catch (const nlohmann::json::parse_error& exc) {
    LOG(WARNING) << "Invalid result from server: " << exc.what();
    output["result"] = response.result();
  }
  output["workspace_files"] = nlohmann::json::array();
  for (const std::string& line : response.workspace_files()) {
    output["workspace_files"].push_back(line);
  }
  if (response.has_error()) output["error"] = response.error();
  Print(output);
  return response.has_error() ? 2 : 0;
}
