#include "executor/engine.hpp"

#include <csignal>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "glog/logging.h"

namespace executor {

const char Engine::kBootstrap[] =
    "import json, sys\n"
    "payload = json.load(sys.stdin)\n"
    "namespace = {'__name__': '__main__', '__builtins__': __builtins__,\n"
    "             'json': json}\n"
    "namespace.update(payload['variables'])\n"
    "exec(payload['code'], namespace)\n"
    "print(json.dumps(namespace['result'], allow_nan=False))\n";

const int64_t Engine::kDeadlineGraceMillis = 5000;

namespace {

// Exit status of `timeout -s KILL` and of the runtime client when the program
// was killed inside the sandbox.
const int kTimeoutStatus = 124;
const int kKilledStatus = 128 + SIGKILL;

}  // namespace

bool Engine::DeadlineExpired(const sandbox::ExecutionInfo& info,
                             int64_t wall_limit_millis) {
  if (info.killed) return true;
  if (wall_limit_millis == 0 || info.wall_time_millis < wall_limit_millis) {
    return false;
  }
  return info.status_code == kTimeoutStatus ||
         info.status_code == kKilledStatus || info.signal == SIGKILL;
}

std::string Engine::ComposePayload(const std::string& code,
                                   const nlohmann::ordered_json& variables) {
  nlohmann::ordered_json payload;
  payload["code"] = code;
  payload["variables"] =
      variables.is_null() ? nlohmann::ordered_json::object() : variables;
  return payload.dump(-1, ' ', false,
                      nlohmann::ordered_json::error_handler_t::replace);
}

Outcome Engine::ParseOutput(const sandbox::ExecutionInfo& info) {
  Outcome outcome;
  if (info.killed) {
    outcome.status = Outcome::EXECUTION_ERROR;
    outcome.error_message = info.message;
    return outcome;
  }
  if (!info.Success()) {
    outcome.status = Outcome::EXECUTION_ERROR;
    outcome.error_message = "Error running code: " + info.stderr_data +
                            "\nSTDOUT:\n" + info.stdout_data;
    return outcome;
  }

  std::vector<absl::string_view> lines = absl::StrSplit(info.stdout_data, '\n');
  absl::string_view last_line;
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    absl::string_view line = absl::StripAsciiWhitespace(*it);
    if (!line.empty()) {
      last_line = line;
      break;
    }
  }
  if (last_line.empty()) return outcome;

  try {
    outcome.result = nlohmann::json::parse(last_line.begin(), last_line.end());
  } catch (const nlohmann::json::parse_error& exc) {
    outcome.status = Outcome::RESULT_PARSE_ERROR;
    outcome.error_message = std::string("Could not parse result as JSON: ") +
                            exc.what() + "\nRaw output:\n" + info.stdout_data;
  }
  return outcome;
}

Outcome Engine::Execute(sandbox::Box* box, const std::string& code,
                        const nlohmann::ordered_json& variables) {
  std::vector<std::string> args;
  if (options_.wall_limit_millis > 0) {
    // The deadline is enforced inside the sandbox: killing the runtime client
    // does not stop the program it started there.
    args = {"timeout", "-s", "KILL",
            std::to_string(DeadlineSeconds(options_.wall_limit_millis))};
  }
  args.push_back(options_.interpreter);
  args.push_back("-c");
  args.push_back(kBootstrap);
  sandbox::ExecutionOptions options(std::move(args));
  options.workdir = options_.workdir;
  options.stdin_data = ComposePayload(code, variables);
  if (options_.wall_limit_millis > 0) {
    options.wall_limit_millis =
        DeadlineSeconds(options_.wall_limit_millis) * 1000 +
        kDeadlineGraceMillis;
  }
  options.max_output_bytes = options_.max_output_bytes;
  VLOG(1) << "Payload for " << box->Name() << ": " << options.stdin_data;

  sandbox::ExecutionInfo info;
  std::string error_msg;
  {
    absl::MutexLock lck(box->ExecutionMutex());
    LOG(INFO) << "Executing code in sandbox " << box->Name();
    if (!runtime_->Execute(box->Name(), options, &info, &error_msg)) {
      throw std::runtime_error("Cannot execute code in " + box->Name() + ": " +
                               error_msg);
    }
  }

  if (DeadlineExpired(info, options_.wall_limit_millis)) {
    info.killed = true;
    info.message = "Wall limit exceeded";
  }
  if (info.output_truncated) {
    LOG(WARNING) << "Output of the code in " << box->Name() << " exceeded "
                 << options_.max_output_bytes << " bytes and was truncated";
  }
  Outcome outcome = ParseOutput(info);
  switch (outcome.status) {
    case Outcome::SUCCESS:
      LOG(INFO) << "Code executed successfully in " << box->Name();
      break;
    case Outcome::EXECUTION_ERROR:
      LOG(ERROR) << "Code execution failed in " << box->Name()
                 << ". Details: " << outcome.error_message;
      break;
    case Outcome::RESULT_PARSE_ERROR:
      LOG(ERROR) << "JSON parsing failed for output from " << box->Name()
                 << ". Details: " << outcome.error_message;
      break;
  }
  return outcome;
}

}  // namespace executor
