#ifndef SANDBOX_MOCK_RUNTIME_HPP
#define SANDBOX_MOCK_RUNTIME_HPP

#include <string>

#include "gmock/gmock.h"
#include "sandbox/runtime.hpp"

namespace sandbox {

class MockRuntime : public Runtime {
 public:
  MOCK_METHOD(bool, Start,
              (const StartOptions& options, std::string* error_msg),
              (override));
  MOCK_METHOD(bool, Execute,
              (const std::string& name, const ExecutionOptions& options,
               ExecutionInfo* info, std::string* error_msg),
              (override));
  MOCK_METHOD(bool, Remove, (const std::string& name, std::string* error_msg),
              (override));
};

// Action for Execute that reports a completed command with the given output
// and exit status.
ACTION_P2(ReturnOutput, stdout_data, status_code) {
  arg2->stdout_data = stdout_data;
  arg2->stderr_data.clear();
  arg2->status_code = status_code;
  arg2->signal = 0;
  arg2->killed = false;
  return true;
}

// Action for Execute that reports a failed command with the given standard
// output and error.
ACTION_P3(ReturnFailure, stdout_data, stderr_data, status_code) {
  arg2->stdout_data = stdout_data;
  arg2->stderr_data = stderr_data;
  arg2->status_code = status_code;
  arg2->signal = 0;
  arg2->killed = false;
  return true;
}

// Actions for Start and Remove, and for Execute, when the runtime cannot be
// reached at all.
ACTION_P(FailWith, message) {
  *arg1 = message;
  return false;
}

ACTION_P(FailExecuteWith, message) {
  *arg3 = message;
  return false;
}

}  // namespace sandbox

#endif
