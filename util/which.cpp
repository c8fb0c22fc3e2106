#include "util/which.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "util/file.hpp"

namespace {
absl::Mutex cmd_cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache
    GUARDED_BY(cmd_cache_mutex);
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");
  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());

  absl::MutexLock lck(&cmd_cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (File::Exists(fullpath)) return cmd_cache[cmd] = fullpath;
  }
  return "";
}

}  // namespace util
