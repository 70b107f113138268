#ifndef SANDBOX_SANDBOX_MANAGER_HPP
#define SANDBOX_SANDBOX_MANAGER_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "sandbox/config.hpp"
#include "sandbox/execution.hpp"
#include "sandbox/executor.hpp"
#include "validator/static_validator.hpp"

namespace sandbox {

// Snapshot of the counters of a SandboxManager.
struct SandboxStats {
  uint64_t submissions = 0;
  uint64_t validated = 0;
  uint64_t rejected = 0;
  uint64_t succeeded = 0;
  uint64_t runtime_errors = 0;
  uint64_t timeouts = 0;
  uint64_t memory_breaches = 0;
  uint64_t cpu_breaches = 0;
  uint64_t contract_violations = 0;
  uint64_t infrastructure_faults = 0;
  // Wall time spent executing validated submissions.
  int64_t total_execution_millis = 0;

  // Fractions of all the submissions. Zero when there were none.
  double SuccessRate() const;
  double RejectionRate() const;
  // Mean execution time of validated submissions.
  double AverageExecutionMillis() const;
};

// Entry point of the engine: validates submissions, dispatches them to the
// backend of their mode and normalizes the outcome. Thread-safe.
class SandboxManager {
 public:
  // Uses the given backends, either of which can be null if disabled.
  SandboxManager(SandboxConfig config, std::unique_ptr<Executor> restricted,
                 std::unique_ptr<Executor> isolated);

  // Creates the backends enabled in config.
  explicit SandboxManager(SandboxConfig config);

  ExecutionResult ExecuteSubmission(const CodeSubmission& submission);

  validator::ValidationReport Validate(const std::string& source) const {
    return validator_.Validate(source);
  }
  const validator::ValidationPolicy& Policy() const {
    return validator_.Policy();
  }

  // Limits of the submission, with defaults and maxima applied.
  ExecutionLimits NormalizeLimits(const CodeSubmission& submission) const;

  SandboxStats Stats() const;
  void ResetStats();

  KJ_DISALLOW_COPY(SandboxManager);

 private:
  ExecutionResult Dispatch(const CodeSubmission& submission,
                           const ExecutionLimits& limits);
  void Record(const ExecutionResult& result);

  SandboxConfig config_;
  validator::StaticValidator validator_;
  std::unique_ptr<Executor> restricted_;
  std::unique_ptr<Executor> isolated_;

  mutable std::mutex stats_mutex_;
  SandboxStats stats_;
};

}  // namespace sandbox

#endif
