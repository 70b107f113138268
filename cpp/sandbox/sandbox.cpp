#include "sandbox/sandbox.hpp"

#include <cstring>

#include "sandbox/unix.hpp"

namespace sandbox {

std::unique_ptr<Sandbox> Sandbox::Create() {
  return std::make_unique<Unix>();
}

std::string DescribeExit(const ExecutionInfo& info) {
  if (info.signal != 0) {
    std::string message = "Killed by signal " + std::to_string(info.signal);
    const char* name = strsignal(info.signal);
    if (name != nullptr) message += std::string(" (") + name + ")";
    if (info.killed) message += ", limits exceeded";
    return message;
  }
  if (info.status_code != 0) {
    return "Exited with status " + std::to_string(info.status_code);
  }
  return "";
}

}  // namespace sandbox
