#ifndef SANDBOX_RESULT_CODEC_HPP
#define SANDBOX_RESULT_CODEC_HPP

#include <string>

#include "capnp/execution.capnp.h"
#include "sandbox/execution.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "validator/static_validator.hpp"

namespace sandbox {

capnproto::ExecutionResult::Status ToCapnp(ExecutionStatus status);
capnproto::ExecutionResult::Resource ToCapnp(ResourceKind resource);
capnproto::Violation::Category ToCapnp(validator::ViolationCategory category);

void ToCapnp(const validator::Violation& violation,
             capnproto::Violation::Builder builder);
void ToCapnp(const validator::ValidationReport& report,
             capnproto::ValidationReport::Builder builder);
// The message field is filled with StatusMessage(result).
void ToCapnp(const ExecutionResult& result,
             capnproto::ExecutionResult::Builder builder);
void ToCapnp(const SandboxStats& stats,
             capnproto::SandboxStats::Builder builder);

// Inverse of ToCapnp for results sent between processes.
ExecutionResult FromCapnp(capnproto::ExecutionResult::Reader reader);

// Pretty-printed JSON forms of the schema structs.
std::string ToJson(const ExecutionResult& result);
std::string ToJson(const validator::ValidationReport& report);
std::string ToJson(const SandboxStats& stats);

}  // namespace sandbox

#endif
