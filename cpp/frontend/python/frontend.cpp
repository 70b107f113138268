#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#pragma GCC diagnostic pop

#include <kj/exception.h>

#include "sandbox/config.hpp"
#include "sandbox/result_codec.hpp"
#include "sandbox/sandbox_manager.hpp"

using namespace pybind11::literals;

namespace {

pybind11::object ErrorField(const sandbox::ExecutionResult& result,
                            std::string sandbox::ErrorDetail::*field) {
  KJ_IF_MAYBE(error, result.error) { return pybind11::str((*error).*field); }
  return pybind11::none();
}

}  // namespace

PYBIND11_MODULE(codebox_frontend, m) {
  m.doc() = "Codebox frontend module";

  pybind11::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const kj::Exception& exc) {
      PyErr_SetString(PyExc_ValueError, exc.getDescription().cStr());
    }
  });

  pybind11::enum_<sandbox::ExecutionMode>(m, "ExecutionMode")
      .value("RESTRICTED", sandbox::ExecutionMode::RESTRICTED)
      .value("ISOLATED", sandbox::ExecutionMode::ISOLATED);

  pybind11::enum_<sandbox::ExecutionStatus>(m, "ExecutionStatus")
      .value("SUCCESS", sandbox::ExecutionStatus::SUCCESS)
      .value("VALIDATION_FAILED", sandbox::ExecutionStatus::VALIDATION_FAILED)
      .value("RUNTIME_ERROR", sandbox::ExecutionStatus::RUNTIME_ERROR)
      .value("TIMEOUT", sandbox::ExecutionStatus::TIMEOUT)
      .value("RESOURCE_EXCEEDED", sandbox::ExecutionStatus::RESOURCE_EXCEEDED)
      .value("CONTRACT_VIOLATION",
             sandbox::ExecutionStatus::CONTRACT_VIOLATION)
      .value("INFRASTRUCTURE_FAULT",
             sandbox::ExecutionStatus::INFRASTRUCTURE_FAULT);

  pybind11::enum_<sandbox::ResourceKind>(m, "ResourceKind")
      .value("NONE", sandbox::ResourceKind::NONE)
      .value("MEMORY", sandbox::ResourceKind::MEMORY)
      .value("CPU_TIME", sandbox::ResourceKind::CPU_TIME)
      .value("WALL_CLOCK", sandbox::ResourceKind::WALL_CLOCK);

  pybind11::enum_<validator::ViolationCategory>(m, "ViolationCategory")
      .value("SYNTAX", validator::ViolationCategory::SYNTAX)
      .value("IMPORT", validator::ViolationCategory::IMPORT)
      .value("CALL", validator::ViolationCategory::CALL)
      .value("ATTRIBUTE", validator::ViolationCategory::ATTRIBUTE)
      .value("PATTERN", validator::ViolationCategory::PATTERN);

  pybind11::class_<validator::Violation>(m, "Violation")
      .def_readonly("category", &validator::Violation::category)
      .def_readonly("symbol", &validator::Violation::symbol)
      .def_readonly("message", &validator::Violation::message)
      .def_property_readonly(
          "line", [](const validator::Violation& v) { return v.location.line; })
      .def_property_readonly(
          "column",
          [](const validator::Violation& v) { return v.location.column; })
      .def("__repr__", [](const validator::Violation& v) {
        return std::string("<Violation ") +
               validator::CategoryName(v.category) + " " + v.symbol + " at " +
               std::to_string(v.location.line) + ":" +
               std::to_string(v.location.column) + ">";
      });

  pybind11::class_<validator::ValidationReport>(m, "ValidationReport")
      .def_readonly("is_safe", &validator::ValidationReport::is_safe)
      .def_readonly("violations", &validator::ValidationReport::violations)
      .def_readonly("warnings", &validator::ValidationReport::warnings)
      .def_readonly("validation_time_micros",
                    &validator::ValidationReport::validation_time_micros)
      .def("to_json", [](const validator::ValidationReport& report) {
        return sandbox::ToJson(report);
      });

  pybind11::class_<validator::ValidationPolicy>(m, "ValidationPolicy")
      .def_static("default", &validator::ValidationPolicy::Default)
      .def_static("from_json", &validator::ValidationPolicy::FromJson,
                  "json"_a)
      .def_static("from_file", &validator::ValidationPolicy::FromFile,
                  "path"_a)
      .def_readwrite("allowed_modules",
                     &validator::ValidationPolicy::allowed_modules)
      .def_readwrite("denied_modules",
                     &validator::ValidationPolicy::denied_modules)
      .def_readwrite("denied_calls", &validator::ValidationPolicy::denied_calls)
      .def_readwrite("denied_attributes",
                     &validator::ValidationPolicy::denied_attributes)
      .def("to_json", &validator::ValidationPolicy::ToJson)
      .def("summary", &validator::ValidationPolicy::Summary);

  pybind11::class_<sandbox::CodeSubmission>(m, "CodeSubmission")
      .def(pybind11::init([](std::string source, std::string artifact_path,
                             double timeout_seconds,
                             int64_t memory_limit_bytes,
                             sandbox::ExecutionMode mode) {
             sandbox::CodeSubmission submission;
             submission.source = std::move(source);
             submission.artifact_path = std::move(artifact_path);
             submission.timeout_seconds = timeout_seconds;
             submission.memory_limit_bytes = memory_limit_bytes;
             submission.mode = mode;
             return submission;
           }),
           "source"_a, "artifact_path"_a = "", "timeout_seconds"_a = 0,
           "memory_limit_bytes"_a = 0,
           "mode"_a = sandbox::ExecutionMode::RESTRICTED)
      .def_readwrite("source", &sandbox::CodeSubmission::source)
      .def_readwrite("artifact_path", &sandbox::CodeSubmission::artifact_path)
      .def_readwrite("timeout_seconds",
                     &sandbox::CodeSubmission::timeout_seconds)
      .def_readwrite("memory_limit_bytes",
                     &sandbox::CodeSubmission::memory_limit_bytes)
      .def_readwrite("mode", &sandbox::CodeSubmission::mode);

  pybind11::class_<sandbox::ExecutionResult>(m, "ExecutionResult")
      .def_readonly("status", &sandbox::ExecutionResult::status)
      .def_readonly("output", &sandbox::ExecutionResult::output)
      .def_readonly("artifact_path", &sandbox::ExecutionResult::artifact_path)
      .def_readonly("payload", &sandbox::ExecutionResult::payload)
      .def_readonly("exceeded_resource",
                    &sandbox::ExecutionResult::exceeded_resource)
      .def_readonly("violations", &sandbox::ExecutionResult::violations)
      .def_property_readonly("success",
                             [](const sandbox::ExecutionResult& r) {
                               return r.status ==
                                      sandbox::ExecutionStatus::SUCCESS;
                             })
      .def_property_readonly("error_message",
                             [](const sandbox::ExecutionResult& r) {
                               return ErrorField(
                                   r, &sandbox::ErrorDetail::message);
                             })
      .def_property_readonly("error_trace",
                             [](const sandbox::ExecutionResult& r) {
                               return ErrorField(r,
                                                 &sandbox::ErrorDetail::trace);
                             })
      .def_property_readonly(
          "wall_time_millis",
          [](const sandbox::ExecutionResult& r) {
            return r.usage.wall_time_millis;
          })
      .def_property_readonly(
          "cpu_time_millis",
          [](const sandbox::ExecutionResult& r) {
            return r.usage.cpu_time_millis;
          })
      .def_property_readonly(
          "peak_memory_kb",
          [](const sandbox::ExecutionResult& r) {
            return r.usage.peak_memory_kb;
          })
      .def("message", &sandbox::StatusMessage)
      .def("to_json", [](const sandbox::ExecutionResult& r) {
        return sandbox::ToJson(r);
      })
      .def("__repr__", [](const sandbox::ExecutionResult& r) {
        return std::string("<ExecutionResult ") + sandbox::StatusName(r.status) +
               ">";
      });

  pybind11::class_<sandbox::SandboxStats>(m, "SandboxStats")
      .def_readonly("submissions", &sandbox::SandboxStats::submissions)
      .def_readonly("validated", &sandbox::SandboxStats::validated)
      .def_readonly("rejected", &sandbox::SandboxStats::rejected)
      .def_readonly("succeeded", &sandbox::SandboxStats::succeeded)
      .def_readonly("runtime_errors", &sandbox::SandboxStats::runtime_errors)
      .def_readonly("timeouts", &sandbox::SandboxStats::timeouts)
      .def_readonly("memory_breaches", &sandbox::SandboxStats::memory_breaches)
      .def_readonly("cpu_breaches", &sandbox::SandboxStats::cpu_breaches)
      .def_readonly("contract_violations",
                    &sandbox::SandboxStats::contract_violations)
      .def_readonly("infrastructure_faults",
                    &sandbox::SandboxStats::infrastructure_faults)
      .def_readonly("total_execution_millis",
                    &sandbox::SandboxStats::total_execution_millis)
      .def_property_readonly("success_rate",
                             &sandbox::SandboxStats::SuccessRate)
      .def_property_readonly("rejection_rate",
                             &sandbox::SandboxStats::RejectionRate)
      .def_property_readonly("average_execution_millis",
                             &sandbox::SandboxStats::AverageExecutionMillis)
      .def("to_json",
           [](const sandbox::SandboxStats& s) { return sandbox::ToJson(s); });

  pybind11::class_<sandbox::ContainerOptions>(m, "ContainerOptions")
      .def(pybind11::init<>())
      .def_readwrite("docker", &sandbox::ContainerOptions::docker)
      .def_readwrite("image", &sandbox::ContainerOptions::image)
      .def_readwrite("python", &sandbox::ContainerOptions::python)
      .def_readwrite("cpus", &sandbox::ContainerOptions::cpus)
      .def_readwrite("memory_cap_bytes",
                     &sandbox::ContainerOptions::memory_cap_bytes)
      .def_readwrite("pids_limit", &sandbox::ContainerOptions::pids_limit)
      .def_readwrite("user", &sandbox::ContainerOptions::user)
      .def_readwrite("temp_directory",
                     &sandbox::ContainerOptions::temp_directory)
      .def_readwrite("keep_sandboxes",
                     &sandbox::ContainerOptions::keep_sandboxes)
      .def_readwrite("max_concurrency",
                     &sandbox::ContainerOptions::max_concurrency)
      .def_readwrite("startup_grace_millis",
                     &sandbox::ContainerOptions::startup_grace_millis);

  pybind11::class_<sandbox::SandboxConfig>(m, "SandboxConfig")
      .def(pybind11::init<>())
      .def_readwrite("default_timeout_seconds",
                     &sandbox::SandboxConfig::default_timeout_seconds)
      .def_readwrite("default_memory_limit_bytes",
                     &sandbox::SandboxConfig::default_memory_limit_bytes)
      .def_readwrite("max_timeout_seconds",
                     &sandbox::SandboxConfig::max_timeout_seconds)
      .def_readwrite("max_memory_limit_bytes",
                     &sandbox::SandboxConfig::max_memory_limit_bytes)
      .def_readwrite("restricted_enabled",
                     &sandbox::SandboxConfig::restricted_enabled)
      .def_readwrite("isolated_enabled",
                     &sandbox::SandboxConfig::isolated_enabled)
      .def_readwrite("policy", &sandbox::SandboxConfig::policy)
      .def_readwrite("container", &sandbox::SandboxConfig::container);

  pybind11::class_<sandbox::SandboxManager>(m, "SandboxManager")
      .def(pybind11::init<sandbox::SandboxConfig>(),
           "config"_a = sandbox::SandboxConfig())
      .def("execute_submission", &sandbox::SandboxManager::ExecuteSubmission,
           pybind11::call_guard<pybind11::gil_scoped_release>(),
           "submission"_a)
      .def("validate", &sandbox::SandboxManager::Validate,
           pybind11::call_guard<pybind11::gil_scoped_release>(), "source"_a)
      .def("policy", &sandbox::SandboxManager::Policy)
      .def("stats", &sandbox::SandboxManager::Stats)
      .def("reset_stats", &sandbox::SandboxManager::ResetStats);
}
