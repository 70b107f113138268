#include "sandbox/artifact.hpp"

#include <kj/debug.h>

#include "util/file.hpp"

namespace sandbox {
namespace artifact {

void Prepare(const std::string& path) {
  if (path.empty()) return;
  if (util::File::RemoveIfExists(path)) {
    KJ_LOG(INFO, "Removed stale artifact", path);
  }
  util::File::MakeDirs(util::File::BaseDir(path));
}

void Discard(const std::string& path) {
  if (path.empty()) return;
  if (util::File::RemoveIfExists(path)) {
    KJ_LOG(INFO, "Removed artifact of failed execution", path);
  }
}

std::string Finalize(const std::string& path, const ResultPayload& payload) {
  if (path.empty()) return "";
  if (!util::File::Exists(path)) {
    util::File::WriteAll(path, PayloadToJson(payload));
  }
  return path;
}

}  // namespace artifact
}  // namespace sandbox
