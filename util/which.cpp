#include "util/which.hpp"

#include <sys/stat.h>

#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::mutex cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache;

bool is_executable(const std::string& path) {
  struct stat buffer {};
  return stat(path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode) &&
         (buffer.st_mode & S_IXUSR);
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return is_executable(cmd) ? cmd : "";
  }
  std::lock_guard<std::mutex> lck(cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";
  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());
  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (is_executable(fullpath)) {
      if (use_cache) cmd_cache[cmd] = fullpath;
      return fullpath;
    }
  }
  return "";
}

}  // namespace util
