#include "sandbox/resource_monitor.hpp"

#include <signal.h>
#include <time.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <cstring>
#include <fstream>
#include <memory>
#include <mutex>
#include <new>
#include <thread>

#include <kj/debug.h>

namespace sandbox {
namespace {

const constexpr auto kPollInterval = std::chrono::milliseconds(10);
const constexpr auto kInterruptInterval = std::chrono::milliseconds(50);

std::mutex run_mutex;
std::atomic<bool> xcpu_received{false};

void OnSigXcpu(int /*signum*/) { xcpu_received = true; }

int64_t ElapsedMillis(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

// Replaces the handler of a signal for the lifetime of the object.
class ScopedSignalHandler {
 public:
  ScopedSignalHandler(int signum, void (*handler)(int)) : signum_(signum) {
    struct sigaction action {};
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    KJ_SYSCALL(sigaction(signum_, &action, &previous_));
  }
  ~ScopedSignalHandler() {
    if (sigaction(signum_, &previous_, nullptr) == -1) {
      KJ_LOG(ERROR, "Failed to restore signal handler", signum_,
             strerror(errno));
    }
  }
  KJ_DISALLOW_COPY(ScopedSignalHandler);

 private:
  int signum_;
  struct sigaction previous_ {};
};

// Watches the deadlines of a run from a separate thread. Once a limit is
// breached, cancels the token and calls interrupt every kInterruptInterval
// until destroyed.
class Watchdog {
 public:
  Watchdog(const ResourceLimits& limits, int64_t cpu_start_millis,
           const std::function<void()>& interrupt, CancellationToken* token)
      : limits_(limits),
        cpu_start_millis_(cpu_start_millis),
        interrupt_(interrupt),
        token_(token),
        start_(std::chrono::steady_clock::now()),
        thread_([this]() { Loop(); }) {}

  ~Watchdog() {
    {
      std::lock_guard<std::mutex> lck(mutex_);
      done_ = true;
    }
    cv_.notify_all();
    thread_.join();
  }
  KJ_DISALLOW_COPY(Watchdog);

  LimitBreach Breach() const { return breach_.load(); }

 private:
  void Loop() {
    auto last_interrupt = std::chrono::steady_clock::time_point();
    std::unique_lock<std::mutex> lck(mutex_);
    while (!done_) {
      if (breach_ == LimitBreach::NONE) {
        if (limits_.wall_limit_millis > 0 &&
            ElapsedMillis(start_) >= limits_.wall_limit_millis) {
          breach_ = LimitBreach::WALL_CLOCK;
        } else if (limits_.cpu_time_limit_millis > 0 &&
                   (xcpu_received ||
                    ResourceMonitor::ProcessCpuMillis() - cpu_start_millis_ >=
                        limits_.cpu_time_limit_millis)) {
          breach_ = LimitBreach::CPU_TIME;
        }
        if (breach_ != LimitBreach::NONE) token_->Cancel();
      }
      auto now = std::chrono::steady_clock::now();
      if (breach_ != LimitBreach::NONE &&
          now - last_interrupt >= kInterruptInterval) {
        last_interrupt = now;
        lck.unlock();
        KJ_IF_MAYBE(exception, kj::runCatchingExceptions(interrupt_)) {
          KJ_LOG(WARNING, "Interrupting the monitored run failed", *exception);
        }
        lck.lock();
        continue;
      }
      cv_.wait_for(lck, kPollInterval, [this]() { return done_; });
    }
  }

  ResourceLimits limits_;
  int64_t cpu_start_millis_;
  const std::function<void()>& interrupt_;
  CancellationToken* token_;
  std::chrono::steady_clock::time_point start_;
  std::atomic<LimitBreach> breach_{LimitBreach::NONE};
  std::mutex mutex_;
  std::condition_variable cv_;
  bool done_ = false;
  std::thread thread_;
};

}  // namespace

ScopedRlimit::ScopedRlimit(Resource resource, rlim_t value)
    : resource_(resource) {
  KJ_SYSCALL(getrlimit(resource_, &previous_));
  if (previous_.rlim_cur != RLIM_INFINITY && value > previous_.rlim_cur) {
    value = previous_.rlim_cur;
  }
  struct rlimit lowered = previous_;
  lowered.rlim_cur = value;
  KJ_SYSCALL(setrlimit(resource_, &lowered), value);
}

ScopedRlimit::~ScopedRlimit() {
  if (setrlimit(resource_, &previous_) == -1) {
    KJ_LOG(ERROR, "Failed to restore resource limit", resource_,
           strerror(errno));
  }
}

int64_t ResourceMonitor::AddressSpaceBytes() {
  std::ifstream statm("/proc/self/statm");
  int64_t pages = 0;
  KJ_REQUIRE(static_cast<bool>(statm >> pages),
             "Unable to read /proc/self/statm");
  return pages * sysconf(_SC_PAGESIZE);
}

int64_t ResourceMonitor::ProcessCpuMillis() {
  struct timespec ts {};
  KJ_SYSCALL(clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &ts));
  return ts.tv_sec * 1000LL + ts.tv_nsec / 1000000;
}

MonitoredRun ResourceMonitor::Run(const Function& fn,
                                  const ResourceLimits& limits,
                                  const std::function<void()>& interrupt) {
  std::lock_guard<std::mutex> lck(run_mutex);
  MonitoredRun run;
  CancellationToken token;
  xcpu_received = false;
  int64_t cpu_start = ProcessCpuMillis();
  auto start = std::chrono::steady_clock::now();
  bool out_of_memory = false;
  {
    // Destroyed in reverse order: the limits are restored before the
    // watchdog stops, and SIGXCPU is handled until the CPU limit is gone.
    ScopedSignalHandler xcpu(SIGXCPU, OnSigXcpu);
    Watchdog watchdog(limits, cpu_start, interrupt, &token);
    std::unique_ptr<ScopedRlimit> memory_limit;
    std::unique_ptr<ScopedRlimit> cpu_limit;
    if (limits.memory_limit_bytes > 0) {
      memory_limit = std::make_unique<ScopedRlimit>(
          RLIMIT_AS, AddressSpaceBytes() + limits.memory_limit_bytes);
    }
    if (limits.cpu_time_limit_millis > 0) {
      // RLIMIT_CPU counts the whole process and has a granularity of one
      // second: the watchdog enforces the precise limit, this is a backstop.
      cpu_limit = std::make_unique<ScopedRlimit>(
          RLIMIT_CPU,
          (cpu_start + limits.cpu_time_limit_millis + 999) / 1000 + 1);
    }
    try {
      fn(token);
    } catch (const std::bad_alloc&) {
      out_of_memory = true;
    }
    run.breach = watchdog.Breach();
  }

  run.usage.wall_time_millis = ElapsedMillis(start);
  run.usage.cpu_time_millis = ProcessCpuMillis() - cpu_start;
  struct rusage usage {};
  if (getrusage(RUSAGE_SELF, &usage) == 0) {
    run.usage.peak_memory_kb = usage.ru_maxrss;
  }

  if (run.breach == LimitBreach::NONE) {
    if (out_of_memory) {
      run.breach = LimitBreach::MEMORY;
    } else if (limits.wall_limit_millis > 0 &&
               run.usage.wall_time_millis > limits.wall_limit_millis) {
      run.breach = LimitBreach::WALL_CLOCK;
    } else if (limits.cpu_time_limit_millis > 0 &&
               run.usage.cpu_time_millis > limits.cpu_time_limit_millis) {
      run.breach = LimitBreach::CPU_TIME;
    }
  }
  return run;
}

}  // namespace sandbox
