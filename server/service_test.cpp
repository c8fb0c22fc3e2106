#include "server/service.hpp"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/mock_runtime.hpp"

namespace {

using ::testing::_;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StartsWith;

using sandbox::ExecutionOptions;
using sandbox::ReturnFailure;
using sandbox::ReturnOutput;

::testing::Matcher<const ExecutionOptions&> Runs(const std::string& program) {
  return Field(&ExecutionOptions::args, Contains(program));
}

class ServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(runtime_, Start(_, _)).WillByDefault(Return(true));
    ON_CALL(runtime_, Remove(_, _)).WillByDefault(Return(true));
    ON_CALL(runtime_, Execute(_, Runs("mkdir"), _, _))
        .WillByDefault(ReturnOutput("", 0));
    ON_CALL(runtime_, Execute(_, Runs("ls"), _, _))
        .WillByDefault(ReturnOutput(
            std::string("/workspace:\ntotal 0\n\n/workspace/sub:\n"), 0));
    ON_CALL(runtime_, Execute(_, Runs("python3"), _, _))
        .WillByDefault(ReturnOutput("5\n", 0));
  }

  grpc::Status Run(const std::string& code, const std::string& data,
                   const std::string& user_id) {
    proto::RunRequest request;
    request.set_code(code);
    request.set_data(data);
    request.set_user_id(user_id);
    grpc::ServerContext context;
    return service_.Run(&context, &request, &response_);
  }

  NiceMock<sandbox::MockRuntime> runtime_;
  sandbox::Provisioner provisioner_{&runtime_, sandbox::ProvisionerOptions()};
  session::Registry registry_{&provisioner_};
  executor::Engine engine_{&runtime_, executor::EngineOptions()};
  workspace::Inspector inspector_{&runtime_, "/workspace"};
  server::Service service_{&registry_, &engine_, &inspector_};
  proto::RunResponse response_;
};

TEST_F(ServiceTest, TestSuccess) {
  grpc::Status status = Run("result = a + b", R"({"a": 2, "b": 3})", "alice");
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response_.result(), "5");
  EXPECT_FALSE(response_.has_error());
  EXPECT_THAT(response_.workspace_files(),
              ElementsAre("/workspace:", "total 0", "", "/workspace/sub:"));
  EXPECT_EQ(registry_.Size(), 1u);
}

TEST_F(ServiceTest, TestEmptyDataIsAllowed) {
  grpc::Status status = Run("result = 5", "", "alice");
  EXPECT_TRUE(status.ok()) << status.error_message();
}

TEST_F(ServiceTest, TestSessionIsReused) {
  EXPECT_CALL(runtime_, Start(_, _)).Times(1);
  EXPECT_TRUE(Run("result = 5", "", "alice").ok());
  EXPECT_TRUE(Run("result = 5", "", "alice").ok());
  EXPECT_EQ(registry_.Size(), 1u);
}

TEST_F(ServiceTest, TestMissingCode) {
  EXPECT_CALL(runtime_, Start(_, _)).Times(0);
  grpc::Status status = Run("", "", "alice");
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(status.error_message(), "Code and user_id required");
  EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(ServiceTest, TestMissingUser) {
  EXPECT_CALL(runtime_, Start(_, _)).Times(0);
  grpc::Status status = Run("result = 1", "", "");
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(status.error_message(), "Code and user_id required");
}

TEST_F(ServiceTest, TestInvalidData) {
  EXPECT_CALL(runtime_, Start(_, _)).Times(0);
  EXPECT_EQ(Run("result = 1", "{not json", "alice").error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(Run("result = 1", "[1, 2]", "alice").error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(ServiceTest, TestProvisioningFailure) {
  EXPECT_CALL(runtime_, Execute(_, Runs("mkdir"), _, _))
      .WillOnce(ReturnFailure("", "read-only file system", 1));
  EXPECT_CALL(runtime_, Remove(_, _)).Times(1);
  grpc::Status status = Run("result = 1", "", "alice");
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
  EXPECT_THAT(status.error_message(), StartsWith("Could not create sandbox: "));
  EXPECT_THAT(status.error_message(), HasSubstr("read-only file system"));
  EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(ServiceTest, TestExecutionError) {
  EXPECT_CALL(runtime_, Execute(_, Runs("python3"), _, _))
      .WillOnce(ReturnFailure("partial\n", "Traceback\n", 1));
  grpc::Status status = Run("raise Exception()", "", "alice");
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response_.result(), "null");
  ASSERT_TRUE(response_.has_error());
  EXPECT_EQ(response_.error(),
            "Error running code: Traceback\n\nSTDOUT:\npartial\n");
  EXPECT_EQ(response_.workspace_files_size(), 4);
}

TEST_F(ServiceTest, TestParseError) {
  EXPECT_CALL(runtime_, Execute(_, Runs("python3"), _, _))
      .WillOnce(ReturnOutput(std::string("garbage\n"), 0));
  grpc::Status status = Run("print('garbage')", "", "alice");
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response_.result(), "null");
  ASSERT_TRUE(response_.has_error());
  EXPECT_THAT(response_.error(), StartsWith("Could not parse result as JSON"));
}

TEST_F(ServiceTest, TestListingFailure) {
  EXPECT_CALL(runtime_, Execute(_, Runs("ls"), _, _))
      .WillOnce(ReturnFailure("", "No such file or directory", 2));
  grpc::Status status = Run("result = 5", "", "alice");
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response_.result(), "5");
  EXPECT_THAT(response_.workspace_files(), ElementsAre("Error listing files"));
}

// File names and output of the code may be any bytes; the response must still
// reach the client.
TEST_F(ServiceTest, TestNonUtf8ListingReachesClient) {
  EXPECT_CALL(runtime_, Execute(_, Runs("ls"), _, _))
      .WillOnce(ReturnOutput(
          std::string("/workspace:\n-rw-r--r-- 1 root root 0 caf\xe9.txt\n"),
          0));
  ASSERT_TRUE(Run("result = 5", "", "alice").ok());

  std::string wire;
  ASSERT_TRUE(response_.SerializeToString(&wire));
  proto::RunResponse received;
  ASSERT_TRUE(received.ParseFromString(wire));
  EXPECT_EQ(received.result(), "5");
  EXPECT_THAT(received.workspace_files(),
              ElementsAre("/workspace:",
                          "-rw-r--r-- 1 root root 0 caf\xe9.txt"));
}

TEST_F(ServiceTest, TestNonUtf8ErrorReachesClient) {
  EXPECT_CALL(runtime_, Execute(_, Runs("python3"), _, _))
      .WillOnce(ReturnFailure("\xff\xfe\n", "bad \xc3\x28 bytes\n", 1));
  ASSERT_TRUE(Run("import sys; sys.stdout.buffer.write(b'\\xff')", "",
                  "alice")
                  .ok());

  std::string wire;
  ASSERT_TRUE(response_.SerializeToString(&wire));
  proto::RunResponse received;
  ASSERT_TRUE(received.ParseFromString(wire));
  EXPECT_EQ(received.result(), "null");
  ASSERT_TRUE(received.has_error());
  EXPECT_EQ(received.error(),
            "Error running code: bad \xc3\x28 bytes\n\nSTDOUT:\n\xff\xfe\n");
}

TEST_F(ServiceTest, TestNonUtf8ResultIsParseError) {
  EXPECT_CALL(runtime_, Execute(_, Runs("python3"), _, _))
      .WillOnce(ReturnOutput(std::string("\"caf\xe9\"\n"), 0));
  ASSERT_TRUE(Run("result = 1", "", "alice").ok());

  std::string wire;
  ASSERT_TRUE(response_.SerializeToString(&wire));
  proto::RunResponse received;
  ASSERT_TRUE(received.ParseFromString(wire));
  EXPECT_EQ(received.result(), "null");
  EXPECT_THAT(received.error(), StartsWith("Could not parse result as JSON"));
}

TEST_F(ServiceTest, TestRuntimeUnreachable) {
  EXPECT_CALL(runtime_, Execute(_, Runs("python3"), _, _))
      .WillOnce(sandbox::FailExecuteWith(std::string("exec: No such file")));
  grpc::Status status = Run("result = 5", "", "alice");
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
}

}  // namespace
