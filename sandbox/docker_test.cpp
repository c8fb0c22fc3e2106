#include "sandbox/docker.hpp"

#include <cstdlib>
#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/sessionbox_testdir";

// Stands in for the docker client: records its command line and echoes back
// the standard input of `exec -i`.
const char kFakeDocker[] = R"(#!/bin/sh
echo "$@" >> "$(dirname "$0")/calls.log"
case "$1" in
  run)
    if [ "$4" = "broken" ]; then
      echo "Conflict. The container name is already in use" >&2
      exit 125
    fi
    echo 0123456789abcdef
    ;;
  exec)
    if [ "$2" = "-i" ]; then cat; fi
    ;;
  rm)
    if [ "$3" = "missing" ]; then
      echo "Error: No such container: missing" >&2
      exit 1
    fi
    ;;
esac
)";

class DockerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = getenv("PATH");
    old_path_ = path ? path : "";
    util::File::Write(util::File::JoinPath(tmp_.Path(), "docker"),
                      kFakeDocker);
    util::File::MakeExecutable(util::File::JoinPath(tmp_.Path(), "docker"));
    std::string new_path = tmp_.Path() + ":/bin:/usr/bin";
    setenv("PATH", new_path.c_str(), 1);
    runtime_ = sandbox::Runtime::Create("docker");
    ASSERT_TRUE(runtime_);
  }

  void TearDown() override { setenv("PATH", old_path_.c_str(), 1); }

  std::string Calls() {
    return util::File::Read(util::File::JoinPath(tmp_.Path(), "calls.log"));
  }

  util::TempDir tmp_{test_tmpdir + "/docker"};
  std::string old_path_;
  std::unique_ptr<sandbox::Runtime> runtime_;
};

TEST_F(DockerTest, TestStart) {
  sandbox::StartOptions options;
  options.name = "sandbox-00000001";
  options.image = "python:3.13-alpine";
  options.command = {"sleep", "3600"};
  std::string error_msg;
  EXPECT_TRUE(runtime_->Start(options, &error_msg)) << error_msg;
  EXPECT_EQ(Calls(),
            "run -d --name sandbox-00000001 python:3.13-alpine sleep 3600\n");
}

TEST_F(DockerTest, TestStartWithLimits) {
  sandbox::StartOptions options;
  options.name = "sandbox-00000002";
  options.image = "alpine";
  options.command = {"sleep", "10"};
  options.memory_limit_mb = 128;
  options.network = "none";
  std::string error_msg;
  EXPECT_TRUE(runtime_->Start(options, &error_msg)) << error_msg;
  EXPECT_EQ(Calls(),
            "run -d --name sandbox-00000002 --memory 128m --network none "
            "alpine sleep 10\n");
}

TEST_F(DockerTest, TestStartFailure) {
  sandbox::StartOptions options;
  options.name = "broken";
  options.image = "alpine";
  std::string error_msg;
  EXPECT_FALSE(runtime_->Start(options, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("Error starting container: "));
  EXPECT_THAT(error_msg, HasSubstr("already in use"));
}

TEST_F(DockerTest, TestExecuteWithStdin) {
  sandbox::ExecutionOptions options({"python3", "-c", "pass"});
  options.workdir = "/workspace";
  options.stdin_data = "{\"code\": \"\"}";
  sandbox::ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runtime_->Execute("sandbox-00000003", options, &info,
                                &error_msg))
      << error_msg;
  EXPECT_TRUE(info.Success());
  EXPECT_EQ(info.stdout_data, options.stdin_data);
  EXPECT_EQ(Calls(),
            "exec -i -w /workspace sandbox-00000003 python3 -c pass\n");
}

TEST_F(DockerTest, TestExecuteOutputIsCapped) {
  sandbox::ExecutionOptions options({"python3", "-c", "pass"});
  options.stdin_data = std::string(100000, 'x');
  options.max_output_bytes = 10;
  sandbox::ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runtime_->Execute("sandbox-00000006", options, &info,
                                &error_msg))
      << error_msg;
  EXPECT_TRUE(info.Success());
  EXPECT_EQ(info.stdout_data, "xxxxxxxxxx");
  EXPECT_TRUE(info.output_truncated);
}

TEST_F(DockerTest, TestExecuteWithoutStdin) {
  sandbox::ExecutionOptions options({"ls", "-lR", "/workspace"});
  sandbox::ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runtime_->Execute("sandbox-00000004", options, &info,
                                &error_msg))
      << error_msg;
  EXPECT_EQ(Calls(), "exec sandbox-00000004 ls -lR /workspace\n");
}

TEST_F(DockerTest, TestRemove) {
  std::string error_msg;
  EXPECT_TRUE(runtime_->Remove("sandbox-00000005", &error_msg)) << error_msg;
  EXPECT_EQ(Calls(), "rm -f sandbox-00000005\n");
}

TEST_F(DockerTest, TestRemoveMissing) {
  std::string error_msg;
  EXPECT_FALSE(runtime_->Remove("missing", &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("No such container"));
}

TEST(RuntimeTest, TestUnknownRuntime) {
  EXPECT_FALSE(sandbox::Runtime::Create("surely-not-a-runtime"));
}

}  // namespace
