#ifndef UTIL_PROCESS_HPP
#define UTIL_PROCESS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace util {

// Settings to run a process.
struct ProcessOptions {
  // Optional values
  std::string cwd;
  std::string stdin_data;
  int64_t wall_limit_millis = 0;
  // Bytes kept of each of stdout and stderr. 0 means unlimited.
  size_t max_output_bytes = 0;

  // Required values. args[0] is looked up in PATH.
  std::vector<std::string> args;
  explicit ProcessOptions(std::vector<std::string> args_)
      : args(std::move(args_)) {}
};

// Results of the execution.
struct ProcessInfo {
  std::string stdout_data;
  std::string stderr_data;
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  bool killed = false;
  // Set if some output was discarded because of max_output_bytes.
  bool output_truncated = false;
  std::string message;

  bool Success() const { return status_code == 0 && signal == 0; }
};

class Process {
 public:
  // Runs the specified command, feeding stdin_data to its standard input and
  // collecting its standard output and error. Returns true if the program was
  // started and ran to completion (or was killed because of the wall limit),
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  static bool Run(const ProcessOptions& options, ProcessInfo* info,
                  std::string* error_msg);
};

}  // namespace util

#endif
