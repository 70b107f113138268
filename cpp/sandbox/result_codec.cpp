#include "sandbox/result_codec.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

namespace sandbox {
namespace {

template <typename T, typename Value>
std::string EncodeJson(const Value& value) {
  capnp::JsonCodec codec;
  codec.setPrettyPrint(true);
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<T>();
  ToCapnp(value, root);
  return codec.encode(root.asReader()).cStr();
}

void UsageToCapnp(const ResourceUsage& usage,
                  capnproto::ResourceUsage::Builder builder) {
  builder.setWallTimeMillis(usage.wall_time_millis);
  builder.setCpuTimeMillis(usage.cpu_time_millis);
  builder.setPeakMemoryKb(usage.peak_memory_kb);
}

ExecutionStatus FromCapnp(capnproto::ExecutionResult::Status status) {
  using Status = capnproto::ExecutionResult::Status;
  switch (status) {
    case Status::SUCCESS:
      return ExecutionStatus::SUCCESS;
    case Status::VALIDATION_FAILED:
      return ExecutionStatus::VALIDATION_FAILED;
    case Status::RUNTIME_ERROR:
      return ExecutionStatus::RUNTIME_ERROR;
    case Status::TIMEOUT:
      return ExecutionStatus::TIMEOUT;
    case Status::RESOURCE_EXCEEDED:
      return ExecutionStatus::RESOURCE_EXCEEDED;
    case Status::CONTRACT_VIOLATION:
      return ExecutionStatus::CONTRACT_VIOLATION;
    case Status::INFRASTRUCTURE_FAULT:
      return ExecutionStatus::INFRASTRUCTURE_FAULT;
  }
  KJ_FAIL_REQUIRE("Unknown execution status", static_cast<int>(status));
}

ResourceKind FromCapnp(capnproto::ExecutionResult::Resource resource) {
  using Resource = capnproto::ExecutionResult::Resource;
  switch (resource) {
    case Resource::NONE:
      return ResourceKind::NONE;
    case Resource::MEMORY:
      return ResourceKind::MEMORY;
    case Resource::CPU_TIME:
      return ResourceKind::CPU_TIME;
    case Resource::WALL_CLOCK:
      return ResourceKind::WALL_CLOCK;
  }
  KJ_FAIL_REQUIRE("Unknown resource", static_cast<int>(resource));
}

validator::ViolationCategory FromCapnp(
    capnproto::Violation::Category category) {
  using Category = capnproto::Violation::Category;
  switch (category) {
    case Category::SYNTAX:
      return validator::ViolationCategory::SYNTAX;
    case Category::IMPORTS:
      return validator::ViolationCategory::IMPORT;
    case Category::CALL:
      return validator::ViolationCategory::CALL;
    case Category::ATTRIBUTE:
      return validator::ViolationCategory::ATTRIBUTE;
    case Category::PATTERN:
      return validator::ViolationCategory::PATTERN;
  }
  KJ_FAIL_REQUIRE("Unknown violation category", static_cast<int>(category));
}

}  // namespace

capnproto::ExecutionResult::Status ToCapnp(ExecutionStatus status) {
  using Status = capnproto::ExecutionResult::Status;
  switch (status) {
    case ExecutionStatus::SUCCESS:
      return Status::SUCCESS;
    case ExecutionStatus::VALIDATION_FAILED:
      return Status::VALIDATION_FAILED;
    case ExecutionStatus::RUNTIME_ERROR:
      return Status::RUNTIME_ERROR;
    case ExecutionStatus::TIMEOUT:
      return Status::TIMEOUT;
    case ExecutionStatus::RESOURCE_EXCEEDED:
      return Status::RESOURCE_EXCEEDED;
    case ExecutionStatus::CONTRACT_VIOLATION:
      return Status::CONTRACT_VIOLATION;
    case ExecutionStatus::INFRASTRUCTURE_FAULT:
      return Status::INFRASTRUCTURE_FAULT;
  }
  KJ_UNREACHABLE;
}

capnproto::ExecutionResult::Resource ToCapnp(ResourceKind resource) {
  using Resource = capnproto::ExecutionResult::Resource;
  switch (resource) {
    case ResourceKind::NONE:
      return Resource::NONE;
    case ResourceKind::MEMORY:
      return Resource::MEMORY;
    case ResourceKind::CPU_TIME:
      return Resource::CPU_TIME;
    case ResourceKind::WALL_CLOCK:
      return Resource::WALL_CLOCK;
  }
  KJ_UNREACHABLE;
}

capnproto::Violation::Category ToCapnp(validator::ViolationCategory category) {
  using Category = capnproto::Violation::Category;
  switch (category) {
    case validator::ViolationCategory::SYNTAX:
      return Category::SYNTAX;
    case validator::ViolationCategory::IMPORT:
      return Category::IMPORTS;
    case validator::ViolationCategory::CALL:
      return Category::CALL;
    case validator::ViolationCategory::ATTRIBUTE:
      return Category::ATTRIBUTE;
    case validator::ViolationCategory::PATTERN:
      return Category::PATTERN;
  }
  KJ_UNREACHABLE;
}

void ToCapnp(const validator::Violation& violation,
             capnproto::Violation::Builder builder) {
  builder.setCategory(ToCapnp(violation.category));
  builder.setSymbol(violation.symbol.c_str());
  builder.getLocation().setLine(violation.location.line);
  builder.getLocation().setColumn(violation.location.column);
  builder.setMessage(violation.message.c_str());
}

void ToCapnp(const validator::ValidationReport& report,
             capnproto::ValidationReport::Builder builder) {
  builder.setIsSafe(report.is_safe);
  auto violations = builder.initViolations(report.violations.size());
  for (size_t i = 0; i < report.violations.size(); i++) {
    ToCapnp(report.violations[i], violations[i]);
  }
  auto warnings = builder.initWarnings(report.warnings.size());
  for (size_t i = 0; i < report.warnings.size(); i++) {
    warnings.set(i, report.warnings[i].c_str());
  }
  builder.setValidationTimeMicros(report.validation_time_micros);
}

void ToCapnp(const ExecutionResult& result,
             capnproto::ExecutionResult::Builder builder) {
  builder.setStatus(ToCapnp(result.status));
  builder.setMessage(StatusMessage(result).c_str());
  builder.setOutput(result.output.c_str());
  builder.setArtifactPath(result.artifact_path.c_str());
  auto payload = builder.initPayload(result.payload.size());
  size_t i = 0;
  for (const auto& entry : result.payload) {
    payload[i].setKey(entry.first.c_str());
    payload[i].setValue(entry.second.c_str());
    i++;
  }
  KJ_IF_MAYBE(error, result.error) {
    auto detail = builder.initError();
    detail.setMessage(error->message.c_str());
    detail.setTrace(error->trace.c_str());
  }
  builder.setExceededResource(ToCapnp(result.exceeded_resource));
  auto violations = builder.initViolations(result.violations.size());
  for (size_t i = 0; i < result.violations.size(); i++) {
    ToCapnp(result.violations[i], violations[i]);
  }
  UsageToCapnp(result.usage, builder.initUsage());
}

void ToCapnp(const SandboxStats& stats,
             capnproto::SandboxStats::Builder builder) {
  builder.setSubmissions(stats.submissions);
  builder.setValidated(stats.validated);
  builder.setRejected(stats.rejected);
  builder.setSucceeded(stats.succeeded);
  builder.setRuntimeErrors(stats.runtime_errors);
  builder.setTimeouts(stats.timeouts);
  builder.setMemoryBreaches(stats.memory_breaches);
  builder.setCpuBreaches(stats.cpu_breaches);
  builder.setContractViolations(stats.contract_violations);
  builder.setInfrastructureFaults(stats.infrastructure_faults);
  builder.setTotalExecutionMillis(stats.total_execution_millis);
  builder.setSuccessRate(stats.SuccessRate());
  builder.setRejectionRate(stats.RejectionRate());
  builder.setAverageExecutionMillis(stats.AverageExecutionMillis());
}

ExecutionResult FromCapnp(capnproto::ExecutionResult::Reader reader) {
  ExecutionResult result;
  result.status = FromCapnp(reader.getStatus());
  result.output = reader.getOutput().cStr();
  result.artifact_path = reader.getArtifactPath().cStr();
  for (auto entry : reader.getPayload()) {
    result.payload[entry.getKey().cStr()] = entry.getValue().cStr();
  }
  if (reader.hasError()) {
    result.error = ErrorDetail{reader.getError().getMessage().cStr(),
                               reader.getError().getTrace().cStr()};
  }
  result.exceeded_resource = FromCapnp(reader.getExceededResource());
  for (auto v : reader.getViolations()) {
    validator::Violation violation;
    violation.category = FromCapnp(v.getCategory());
    violation.symbol = v.getSymbol().cStr();
    violation.location.line = v.getLocation().getLine();
    violation.location.column = v.getLocation().getColumn();
    violation.message = v.getMessage().cStr();
    result.violations.push_back(std::move(violation));
  }
  result.usage.wall_time_millis = reader.getUsage().getWallTimeMillis();
  result.usage.cpu_time_millis = reader.getUsage().getCpuTimeMillis();
  result.usage.peak_memory_kb = reader.getUsage().getPeakMemoryKb();
  return result;
}

std::string ToJson(const ExecutionResult& result) {
  return EncodeJson<capnproto::ExecutionResult>(result);
}

std::string ToJson(const validator::ValidationReport& report) {
  return EncodeJson<capnproto::ValidationReport>(report);
}

std::string ToJson(const SandboxStats& stats) {
  return EncodeJson<capnproto::SandboxStats>(stats);
}

}  // namespace sandbox
