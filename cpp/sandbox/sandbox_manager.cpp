#include "sandbox/sandbox_manager.hpp"

#include <cmath>
#include <exception>

#include <kj/debug.h>

#include "sandbox/artifact.hpp"
#include "sandbox/container_executor.hpp"
#include "sandbox/interpreter.hpp"
#include "sandbox/restricted_executor.hpp"

namespace sandbox {
namespace {

const constexpr size_t kReportedViolations = 3;

std::string RejectionMessage(const validator::ValidationReport& report) {
  std::string message = "Code rejected by static validation: ";
  for (size_t i = 0; i < report.violations.size(); i++) {
    if (i == kReportedViolations) {
      message += "; and " +
                 std::to_string(report.violations.size() - i) + " more";
      break;
    }
    const validator::Violation& violation = report.violations[i];
    if (i != 0) message += "; ";
    message += "line " + std::to_string(violation.location.line) + ": " +
               violation.message;
  }
  return message;
}

}  // namespace

double SandboxStats::SuccessRate() const {
  return submissions == 0 ? 0 : static_cast<double>(succeeded) / submissions;
}

double SandboxStats::RejectionRate() const {
  return submissions == 0 ? 0 : static_cast<double>(rejected) / submissions;
}

double SandboxStats::AverageExecutionMillis() const {
  return validated == 0 ? 0
                        : static_cast<double>(total_execution_millis) /
                              validated;
}

SandboxManager::SandboxManager(SandboxConfig config,
                               std::unique_ptr<Executor> restricted,
                               std::unique_ptr<Executor> isolated)
    : config_(std::move(config)),
      validator_(config_.policy, &Interpreter::CheckSyntax),
      restricted_(std::move(restricted)),
      isolated_(std::move(isolated)) {}

SandboxManager::SandboxManager(SandboxConfig config)
    : SandboxManager(std::move(config), nullptr, nullptr) {
  if (config_.restricted_enabled) {
    restricted_ =
        std::make_unique<RestrictedExecutor>(config_.policy.allowed_modules);
  }
  if (config_.isolated_enabled) {
    isolated_ = std::make_unique<ContainerExecutor>(
        config_.container, config_.policy.allowed_modules);
  }
}

ExecutionLimits SandboxManager::NormalizeLimits(
    const CodeSubmission& submission) const {
  double timeout = submission.timeout_seconds;
  if (!std::isfinite(timeout) || timeout <= 0) {
    timeout = config_.default_timeout_seconds;
  }
  if (timeout > config_.max_timeout_seconds) {
    timeout = config_.max_timeout_seconds;
  }
  int64_t memory = submission.memory_limit_bytes;
  if (memory <= 0) memory = config_.default_memory_limit_bytes;
  if (memory > config_.max_memory_limit_bytes) {
    memory = config_.max_memory_limit_bytes;
  }
  ExecutionLimits limits;
  limits.timeout_millis = std::llround(timeout * 1000);
  if (limits.timeout_millis <= 0) limits.timeout_millis = 1;
  limits.memory_limit_bytes = memory;
  return limits;
}

ExecutionResult SandboxManager::Dispatch(const CodeSubmission& submission,
                                         const ExecutionLimits& limits) {
  Executor* executor = submission.mode == ExecutionMode::RESTRICTED
                           ? restricted_.get()
                           : isolated_.get();
  if (executor == nullptr) {
    KJ_LOG(ERROR, "Execution backend disabled", ModeName(submission.mode));
    return MakeFailure(ExecutionStatus::INFRASTRUCTURE_FAULT,
                       std::string("The ") + ModeName(submission.mode) +
                           " backend is disabled");
  }
  ExecutionResult result;
  try {
    result = executor->Execute(submission.source, submission.artifact_path,
                               limits);
  } catch (const kj::Exception& exc) {
    KJ_LOG(ERROR, "Execution failed", ModeName(submission.mode), exc);
    return MakeFailure(ExecutionStatus::INFRASTRUCTURE_FAULT,
                       exc.getDescription().cStr());
  } catch (const std::exception& exc) {
    KJ_LOG(ERROR, "Execution failed", ModeName(submission.mode), exc.what());
    return MakeFailure(ExecutionStatus::INFRASTRUCTURE_FAULT, exc.what());
  }
  return result;
}

ExecutionResult SandboxManager::ExecuteSubmission(
    const CodeSubmission& submission) {
  ExecutionLimits limits = NormalizeLimits(submission);
  validator::ValidationReport report = validator_.Validate(submission.source);

  ExecutionResult result;
  if (!report.is_safe) {
    result.status = ExecutionStatus::VALIDATION_FAILED;
    result.error = ErrorDetail{RejectionMessage(report), ""};
    result.violations = std::move(report.violations);
    KJ_LOG(INFO, "Submission rejected", result.violations.size());
  } else {
    result = Dispatch(submission, limits);
  }

  // An artifact is left at the destination only after a success.
  try {
    if (result.status == ExecutionStatus::SUCCESS) {
      result.artifact_path =
          artifact::Finalize(submission.artifact_path, result.payload);
    } else {
      artifact::Discard(submission.artifact_path);
      result.artifact_path.clear();
    }
  } catch (const std::exception& exc) {
    KJ_LOG(ERROR, "Unable to store the artifact", submission.artifact_path,
           exc.what());
    result = MakeFailure(ExecutionStatus::INFRASTRUCTURE_FAULT,
                         std::string("Unable to store the artifact: ") +
                             exc.what());
  }

  Record(result);
  KJ_LOG(INFO, "Submission done", ModeName(submission.mode),
         StatusName(result.status), result.usage.wall_time_millis);
  return result;
}

void SandboxManager::Record(const ExecutionResult& result) {
  std::lock_guard<std::mutex> lck(stats_mutex_);
  stats_.submissions++;
  if (result.status == ExecutionStatus::VALIDATION_FAILED) {
    stats_.rejected++;
    return;
  }
  stats_.validated++;
  stats_.total_execution_millis += result.usage.wall_time_millis;
  switch (result.status) {
    case ExecutionStatus::SUCCESS:
      stats_.succeeded++;
      break;
    case ExecutionStatus::RUNTIME_ERROR:
      stats_.runtime_errors++;
      break;
    case ExecutionStatus::TIMEOUT:
      stats_.timeouts++;
      break;
    case ExecutionStatus::RESOURCE_EXCEEDED:
      if (result.exceeded_resource == ResourceKind::MEMORY) {
        stats_.memory_breaches++;
      } else {
        stats_.cpu_breaches++;
      }
      break;
    case ExecutionStatus::CONTRACT_VIOLATION:
      stats_.contract_violations++;
      break;
    case ExecutionStatus::INFRASTRUCTURE_FAULT:
      stats_.infrastructure_faults++;
      break;
    case ExecutionStatus::VALIDATION_FAILED:
      break;
  }
}

SandboxStats SandboxManager::Stats() const {
  std::lock_guard<std::mutex> lck(stats_mutex_);
  return stats_;
}

void SandboxManager::ResetStats() {
  std::lock_guard<std::mutex> lck(stats_mutex_);
  stats_ = SandboxStats();
}

}  // namespace sandbox
