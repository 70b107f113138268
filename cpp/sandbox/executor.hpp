#ifndef SANDBOX_EXECUTOR_HPP
#define SANDBOX_EXECUTOR_HPP

#include <string>

#include "sandbox/execution.hpp"

namespace sandbox {

// An execution backend. Implementations run source that already passed
// static validation and must report every outcome through the returned
// status; host-side failures may be thrown and are turned into
// INFRASTRUCTURE_FAULT by the caller.
class Executor {
 public:
  virtual ExecutionResult Execute(const std::string& source,
                                  const std::string& artifact_path,
                                  const ExecutionLimits& limits) = 0;

  virtual ~Executor() = default;
  Executor() = default;
  Executor(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace sandbox

#endif
