#ifndef SANDBOX_RUNTIME_HPP
#define SANDBOX_RUNTIME_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "util/process.hpp"

namespace sandbox {

// Settings to start a new sandbox.
struct StartOptions {
  std::string name;
  std::string image;
  // Long-lived placeholder process that keeps the sandbox alive.
  std::vector<std::string> command;

  // Optional values
  int64_t memory_limit_mb = 0;
  std::string network;
};

// Settings to execute a program inside a running sandbox.
struct ExecutionOptions {
  // Optional values
  std::string workdir;
  std::string stdin_data;
  int64_t wall_limit_millis = 0;
  // Bytes kept of each of stdout and stderr. 0 means unlimited.
  size_t max_output_bytes = 0;

  // Required values
  std::vector<std::string> args;
  explicit ExecutionOptions(std::vector<std::string> args_)
      : args(std::move(args_)) {}
};

// Results of the execution.
using ExecutionInfo = util::ProcessInfo;

// Interface to the external runtime that hosts the sandboxes.
// Implementations need to register themselves by creating a global object of
// type Runtime::Register<RuntimeImpl> and should define the Create and Score
// static functions. Create should return a pointer to a newly allocated
// instance of the given implementation, while Score should return a value
// that defines how "good" that runtime is: negative if the runtime
// should not/cannot be used in the current configuration, positive otherwise
// (a bigger value means a better runtime).
// Registering a runtime is not thread-safe and should be done before any
// threads are created.
// All the operations may be called concurrently from multiple threads.
class Runtime {
 public:
  using create_t = std::function<Runtime*()>;
  using score_t = std::function<int()>;

  // Creates the runtime with the given name, or the best available one if
  // name is empty. Returns nullptr if no usable runtime is found.
  static std::unique_ptr<Runtime> Create(const std::string& name = "");

  // Starts a sandbox called options.name. Returns false and sets error_msg if
  // the sandbox could not be started.
  virtual bool Start(const StartOptions& options, std::string* error_msg) = 0;

  // Runs the specified command inside the sandbox. Returns true if the
  // runtime ran the command, and sets fields in info; a failing command is
  // still reported through info. Otherwise, returns false and sets error_msg.
  virtual bool Execute(const std::string& name,
                       const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Force-stops and removes the sandbox. Returns false and sets error_msg if
  // the runtime reported a failure, including an unknown name.
  virtual bool Remove(const std::string& name, std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Runtime() = default;
  Runtime() = default;
  Runtime(const Runtime&) = delete;
  Runtime(Runtime&&) = delete;
  Runtime& operator=(const Runtime&) = delete;
  Runtime& operator=(Runtime&&) = delete;

  template <typename T>
  class Register {
   public:
    explicit Register(const std::string& name) {
      Runtime::Register_(name, &T::Create, &T::Score);
    }
  };

 private:
  struct Entry {
    std::string name;
    create_t create;
    score_t score;
  };
  using store_t = std::vector<Entry>;
  static store_t* Runtimes_();
  static void Register_(const std::string& name, create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
