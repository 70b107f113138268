#ifndef SANDBOX_EXECUTION_HPP
#define SANDBOX_EXECUTION_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <kj/common.h>

#include "sandbox/payload.hpp"
#include "validator/static_validator.hpp"

namespace sandbox {

enum class ExecutionMode { RESTRICTED, ISOLATED };

// Captured output beyond this size is truncated.
static const constexpr size_t kMaxOutputBytes = 1 << 20;

// One unit of untrusted generated code, with its limits.
struct CodeSubmission {
  std::string source;
  // Where the produced artifact must be stored.
  std::string artifact_path;
  double timeout_seconds = 0;
  int64_t memory_limit_bytes = 0;
  ExecutionMode mode = ExecutionMode::RESTRICTED;
};

enum class ExecutionStatus {
  SUCCESS,
  VALIDATION_FAILED,
  RUNTIME_ERROR,
  TIMEOUT,
  RESOURCE_EXCEEDED,
  CONTRACT_VIOLATION,
  INFRASTRUCTURE_FAULT
};

enum class ResourceKind { NONE, MEMORY, CPU_TIME, WALL_CLOCK };

struct ErrorDetail {
  std::string message;
  std::string trace;
};

struct ResourceUsage {
  int64_t wall_time_millis = 0;
  int64_t cpu_time_millis = 0;
  int64_t peak_memory_kb = 0;
};

// Limits a backend enforces on a single execution.
struct ExecutionLimits {
  int64_t timeout_millis = 0;
  int64_t memory_limit_bytes = 0;
};

struct ExecutionResult {
  ExecutionStatus status = ExecutionStatus::INFRASTRUCTURE_FAULT;
  std::string output;
  // Empty when no artifact was stored.
  std::string artifact_path;
  ResultPayload payload;
  kj::Maybe<ErrorDetail> error;
  ResourceKind exceeded_resource = ResourceKind::NONE;
  std::vector<validator::Violation> violations;
  ResourceUsage usage;
};

const char* StatusName(ExecutionStatus status);
const char* ResourceName(ResourceKind resource);
const char* ModeName(ExecutionMode mode);

// Parses "restricted" or "isolated". Returns false on unknown names.
bool ParseMode(const std::string& name, ExecutionMode* mode);

// A one-line, human-readable description of the outcome.
std::string StatusMessage(const ExecutionResult& result);

// Cuts output to kMaxOutputBytes, marking the truncation.
std::string TruncateOutput(std::string output);

// Builds a result with the given status and error message.
ExecutionResult MakeFailure(ExecutionStatus status, const std::string& message,
                            const std::string& trace = "");

}  // namespace sandbox

#endif
