#ifndef EXECUTOR_ENGINE_HPP
#define EXECUTOR_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "nlohmann/json.hpp"
#include "sandbox/box.hpp"
#include "sandbox/runtime.hpp"

namespace executor {

struct EngineOptions {
  std::string workdir = "/workspace";
  std::string interpreter = "python3";
  // 0 means no deadline. The sandbox enforces it with a granularity of one
  // second, rounding up.
  int64_t wall_limit_millis = 0;
  // Bytes kept of each of stdout and stderr. 0 means unlimited.
  size_t max_output_bytes = 0;
};

// Result of running a code unit.
struct Outcome {
  enum Status { SUCCESS, EXECUTION_ERROR, RESULT_PARSE_ERROR };

  Status status = SUCCESS;
  // Meaningful only on success; null otherwise.
  nlohmann::json result;
  std::string error_message;

  bool Success() const { return status == SUCCESS; }
};

// Runs code units inside sandboxes. The code and its variables are handed to
// a small bootstrap program as a JSON document on the standard input, so
// they are never spliced into program text. The code must assign a variable
// called result, which is printed as JSON on the last line of the output.
class Engine {
 public:
  Engine(sandbox::Runtime* runtime, EngineOptions options)
      : runtime_(runtime), options_(std::move(options)) {}

  // Runs code in box with the given variables in scope. Executions in the
  // same box are serialized. Throws std::runtime_error if the runtime cannot
  // be invoked at all.
  Outcome Execute(sandbox::Box* box, const std::string& code,
                  const nlohmann::ordered_json& variables);

  // The document written to the standard input of the bootstrap program.
  static std::string ComposePayload(const std::string& code,
                                    const nlohmann::ordered_json& variables);

  // Extracts the outcome from the execution of the bootstrap program.
  static Outcome ParseOutput(const sandbox::ExecutionInfo& info);

  // Whether the execution was stopped because it ran past wall_limit_millis,
  // either by the runtime client or inside the sandbox.
  static bool DeadlineExpired(const sandbox::ExecutionInfo& info,
                              int64_t wall_limit_millis);

  static int64_t DeadlineSeconds(int64_t wall_limit_millis) {
    return (wall_limit_millis + 999) / 1000;
  }

  // Python program run with -c that executes the payload.
  static const char kBootstrap[];

  // How long the runtime client waits past the deadline of the sandbox before
  // it is killed.
  static const int64_t kDeadlineGraceMillis;

 private:
  sandbox::Runtime* runtime_;
  const EngineOptions options_;
};

}  // namespace executor

#endif
