#ifndef SANDBOX_RESTRICTED_EXECUTOR_HPP
#define SANDBOX_RESTRICTED_EXECUTOR_HPP

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "sandbox/executor.hpp"

namespace sandbox {

// Runs code with a reduced set of builtins, in a child forked from the
// embedded interpreter of the current process. The child enforces the limits
// with a ResourceMonitor and sends the result back as a Cap'n Proto message;
// it is killed if it outlives the timeout by more than a short grace period.
// Executions are serialized.
class RestrictedExecutor : public Executor {
 public:
  // Only modules in allowed_modules (or whose top-level package is) can be
  // imported or are pre-bound in the namespace.
  explicit RestrictedExecutor(std::set<std::string> allowed_modules);

  ExecutionResult Execute(const std::string& source,
                          const std::string& artifact_path,
                          const ExecutionLimits& limits) override;

  // Names under which modules are pre-bound, with the module they refer to.
  static const std::vector<std::pair<std::string, std::string>>& Bindings();

  // Builtins available to executed code, besides __import__.
  static const std::vector<std::string>& SafeBuiltins();

 private:
  bool IsAllowed(const std::string& module) const;

  std::set<std::string> allowed_modules_;
};

}  // namespace sandbox

#endif
