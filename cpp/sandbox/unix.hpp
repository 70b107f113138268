#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <chrono>
#include <string>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// fork and exec, with setrlimit ceilings applied in the child and the
// wall-clock limit enforced by killing its whole session.
class Unix : public Sandbox {
 public:
  Unix() = default;
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;

 private:
  using Clock = std::chrono::steady_clock;

  // Body of the child. Only async-signal-safe calls are allowed, as the
  // parent may be multi-threaded. Setup failures are written to error_fd.
  [[noreturn]] static void Child(const ExecutionOptions& options,
                                 char* const* argv, int error_fd);

  // Returns true, after reaping the child, if it reported a setup failure.
  static bool ChildFailed(int error_fd, pid_t pid, std::string* error_msg);

  static bool Wait(pid_t pid, Clock::time_point start,
                   int64_t wall_limit_millis, ExecutionInfo* info,
                   std::string* error_msg);
};

}  // namespace sandbox

#endif
