#ifndef WORKSPACE_INSPECTOR_HPP
#define WORKSPACE_INSPECTOR_HPP

#include <string>
#include <utility>

#include "sandbox/box.hpp"
#include "sandbox/runtime.hpp"

namespace workspace {

// Lists the contents of the working directory of a sandbox. Purely
// diagnostic: failures never propagate.
class Inspector {
 public:
  static const char kListingError[];

  Inspector(sandbox::Runtime* runtime, std::string workdir)
      : runtime_(runtime), workdir_(std::move(workdir)) {}

  // Returns the output of `ls -lR` on the working directory, or
  // kListingError if it could not be obtained.
  std::string List(const sandbox::Box& box);

 private:
  sandbox::Runtime* runtime_;
  const std::string workdir_;
};

}  // namespace workspace

#endif
