#include "sandbox/execution.hpp"

#include <sstream>

namespace sandbox {

const char* StatusName(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::SUCCESS:
      return "SUCCESS";
    case ExecutionStatus::VALIDATION_FAILED:
      return "VALIDATION_FAILED";
    case ExecutionStatus::RUNTIME_ERROR:
      return "RUNTIME_ERROR";
    case ExecutionStatus::TIMEOUT:
      return "TIMEOUT";
    case ExecutionStatus::RESOURCE_EXCEEDED:
      return "RESOURCE_EXCEEDED";
    case ExecutionStatus::CONTRACT_VIOLATION:
      return "CONTRACT_VIOLATION";
    case ExecutionStatus::INFRASTRUCTURE_FAULT:
      return "INFRASTRUCTURE_FAULT";
  }
  return "UNKNOWN";
}

const char* ResourceName(ResourceKind resource) {
  switch (resource) {
    case ResourceKind::NONE:
      return "NONE";
    case ResourceKind::MEMORY:
      return "MEMORY";
    case ResourceKind::CPU_TIME:
      return "CPU_TIME";
    case ResourceKind::WALL_CLOCK:
      return "WALL_CLOCK";
  }
  return "UNKNOWN";
}

const char* ModeName(ExecutionMode mode) {
  return mode == ExecutionMode::RESTRICTED ? "restricted" : "isolated";
}

bool ParseMode(const std::string& name, ExecutionMode* mode) {
  if (name == "restricted") {
    *mode = ExecutionMode::RESTRICTED;
  } else if (name == "isolated") {
    *mode = ExecutionMode::ISOLATED;
  } else {
    return false;
  }
  return true;
}

std::string StatusMessage(const ExecutionResult& result) {
  std::ostringstream out;
  switch (result.status) {
    case ExecutionStatus::SUCCESS:
      out << "Execution succeeded";
      break;
    case ExecutionStatus::VALIDATION_FAILED:
      out << "Code rejected by static validation ("
          << result.violations.size() << " violations)";
      break;
    case ExecutionStatus::RUNTIME_ERROR:
      out << "Execution failed with a runtime error";
      break;
    case ExecutionStatus::TIMEOUT:
      out << "Execution exceeded the wall-clock limit";
      break;
    case ExecutionStatus::RESOURCE_EXCEEDED:
      out << "Execution exceeded the "
          << (result.exceeded_resource == ResourceKind::MEMORY ? "memory"
                                                               : "CPU time")
          << " limit";
      break;
    case ExecutionStatus::CONTRACT_VIOLATION:
      out << "Execution did not honor the result contract";
      break;
    case ExecutionStatus::INFRASTRUCTURE_FAULT:
      out << "The execution backend failed";
      break;
  }
  KJ_IF_MAYBE(error, result.error) {
    if (!error->message.empty()) out << ": " << error->message;
  }
  return out.str();
}

std::string TruncateOutput(std::string output) {
  if (output.size() > kMaxOutputBytes) {
    output.resize(kMaxOutputBytes);
    output += "\n[output truncated]";
  }
  return output;
}

ExecutionResult MakeFailure(ExecutionStatus status, const std::string& message,
                            const std::string& trace) {
  ExecutionResult result;
  result.status = status;
  result.error = ErrorDetail{message, trace};
  return result;
}

}  // namespace sandbox
