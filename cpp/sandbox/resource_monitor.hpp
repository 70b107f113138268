#ifndef SANDBOX_RESOURCE_MONITOR_HPP
#define SANDBOX_RESOURCE_MONITOR_HPP

#include <sys/resource.h>

#include <atomic>
#include <cstdint>
#include <functional>

#include <kj/common.h>

#include "sandbox/execution.hpp"

namespace sandbox {

struct ResourceLimits {
  // Zero disables the corresponding limit.
  int64_t memory_limit_bytes = 0;
  int64_t cpu_time_limit_millis = 0;
  int64_t wall_limit_millis = 0;
};

enum class LimitBreach { NONE, MEMORY, CPU_TIME, WALL_CLOCK };

// Cooperative cancellation flag handed to the monitored function.
class CancellationToken {
 public:
  bool IsCancelled() const { return cancelled_.load(); }
  void Cancel() { cancelled_.store(true); }

 private:
  std::atomic<bool> cancelled_{false};
};

struct MonitoredRun {
  LimitBreach breach = LimitBreach::NONE;
  ResourceUsage usage;
};

// Restores a soft resource limit on destruction.
class ScopedRlimit {
 public:
  using Resource = decltype(RLIMIT_AS);

  // Lowers the soft limit of resource to value. The limit is never raised and
  // the hard limit is left untouched.
  ScopedRlimit(Resource resource, rlim_t value);
  ~ScopedRlimit();
  KJ_DISALLOW_COPY(ScopedRlimit);

 private:
  Resource resource_;
  struct rlimit previous_ {};
};

// Runs a function in the current process under memory, CPU time and
// wall-clock limits. Only one monitored run can be active in a process, since
// the memory and CPU limits are process-wide; concurrent callers wait.
class ResourceMonitor {
 public:
  using Function = std::function<void(const CancellationToken&)>;

  // Runs fn. The function signals memory exhaustion by throwing
  // std::bad_alloc. When a limit is breached the token is cancelled and
  // interrupt is called repeatedly, from another thread, until fn returns.
  // Exceptions other than std::bad_alloc are propagated after every limit has
  // been restored.
  static MonitoredRun Run(const Function& fn, const ResourceLimits& limits,
                          const std::function<void()>& interrupt);

  // Current virtual memory size of the process, in bytes.
  static int64_t AddressSpaceBytes();

  // CPU time (user + system) consumed by the process so far.
  static int64_t ProcessCpuMillis();
};

}  // namespace sandbox

#endif
