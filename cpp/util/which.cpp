#include "util/which.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <mutex>
#include <unordered_map>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/misc.hpp"

namespace util {
namespace {

std::mutex cache_mutex;
std::unordered_map<std::string, std::string> resolved;

bool IsExecutable(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
         access(path.c_str(), X_OK) == 0;
}

}  // namespace

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return IsExecutable(cmd) ? cmd : "";
  }

  std::lock_guard<std::mutex> lck(cache_mutex);
  auto cached = resolved.find(cmd);
  if (cached != resolved.end()) {
    if (use_cache && IsExecutable(cached->second)) return cached->second;
    resolved.erase(cached);
  }

  const char* path = std::getenv("PATH");
  KJ_REQUIRE(path != nullptr, "PATH is not set", cmd.c_str());
  for (const std::string& dir : split(path, ':')) {
    std::string candidate = File::JoinPath(dir, cmd);
    if (!IsExecutable(candidate)) continue;
    resolved[cmd] = candidate;
    return candidate;
  }
  return "";
}

}  // namespace util
