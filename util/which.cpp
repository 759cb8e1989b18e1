#include "util/which.hpp"

#include <cstdlib>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <unistd.h>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;
std::mutex cmd_cache_mutex;

bool is_executable(const std::string& path) {
  return access(path.c_str(), X_OK) == 0 && util::File::Size(path) >= 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return is_executable(cmd) ? cmd : "";
  }

  std::lock_guard<std::mutex> lck(cmd_cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";
  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());

  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (is_executable(fullpath)) return cmd_cache[cmd] = fullpath;
  }

  // Misses are not cached.
  return "";
}

}  // namespace util
