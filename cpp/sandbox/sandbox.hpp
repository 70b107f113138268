#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// A host program to run, such as the docker client, with its OS limits.
// Zero limits are not enforced. The address space is never limited.
struct ExecutionOptions {
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;

  // Paths are resolved before changing to root. Without a stdin_file the
  // program reads from /dev/null; without the other two it shares ours.
  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;
  // Arguments after argv[0], which is always the executable.
  std::vector<std::string> args;

  // Working directory of the program.
  std::string root;
  std::string executable;

  ExecutionOptions(std::string root_, std::string executable_)
      : root(std::move(root_)), executable(std::move(executable_)) {}
};

// How a program ended.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the program was killed for exceeding the wall-clock or CPU limit.
  bool killed = false;
  // Empty after a clean exit.
  std::string message;
};

// Runs host programs under OS limits.
class Sandbox {
 public:
  // The implementation for the current platform.
  static std::unique_ptr<Sandbox> Create();

  // Runs the program to completion. Returns true if it was started and fills
  // info; otherwise returns false and sets error_msg. An instance runs one
  // program at a time.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

// Human-readable description of an exit, empty for a clean one.
std::string DescribeExit(const ExecutionInfo& info);

}  // namespace sandbox

#endif
