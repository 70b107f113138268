#include "sandbox/result_codec.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using sandbox::ErrorDetail;
using sandbox::ExecutionResult;
using sandbox::ExecutionStatus;
using sandbox::ResourceKind;
using sandbox::SandboxStats;
using ::testing::HasSubstr;

// NOLINTNEXTLINE
TEST(ResultCodec, Success) {
  ExecutionResult result;
  result.status = ExecutionStatus::SUCCESS;
  result.output = "hello\n";
  result.artifact_path = "/tmp/chart.png";
  result.payload["answer"] = "42";
  result.payload["name"] = "\"pi\"";
  result.usage.wall_time_millis = 120;
  result.usage.cpu_time_millis = 100;
  result.usage.peak_memory_kb = 2048;

  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::ExecutionResult>();
  sandbox::ToCapnp(result, builder);
  auto reader = builder.asReader();
  EXPECT_EQ(reader.getStatus(), capnproto::ExecutionResult::Status::SUCCESS);
  EXPECT_EQ(reader.getMessage(), "Execution succeeded");
  EXPECT_EQ(reader.getOutput(), "hello\n");
  EXPECT_EQ(reader.getArtifactPath(), "/tmp/chart.png");
  EXPECT_FALSE(reader.hasError());
  ASSERT_EQ(reader.getPayload().size(), 2u);
  EXPECT_EQ(reader.getPayload()[0].getKey(), "answer");
  EXPECT_EQ(reader.getPayload()[0].getValue(), "42");
  EXPECT_EQ(reader.getPayload()[1].getKey(), "name");
  EXPECT_EQ(reader.getPayload()[1].getValue(), "\"pi\"");
  EXPECT_EQ(reader.getUsage().getWallTimeMillis(), 120);
  EXPECT_EQ(reader.getUsage().getCpuTimeMillis(), 100);
  EXPECT_EQ(reader.getUsage().getPeakMemoryKb(), 2048);
}

// NOLINTNEXTLINE
TEST(ResultCodec, ErrorAndResource) {
  ExecutionResult result;
  result.status = ExecutionStatus::RESOURCE_EXCEEDED;
  result.exceeded_resource = ResourceKind::MEMORY;
  result.error = ErrorDetail{"MemoryError: memory limit exceeded", "trace"};

  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::ExecutionResult>();
  sandbox::ToCapnp(result, builder);
  auto reader = builder.asReader();
  EXPECT_EQ(reader.getStatus(),
            capnproto::ExecutionResult::Status::RESOURCE_EXCEEDED);
  EXPECT_EQ(reader.getExceededResource(),
            capnproto::ExecutionResult::Resource::MEMORY);
  ASSERT_TRUE(reader.hasError());
  EXPECT_EQ(reader.getError().getMessage(),
            "MemoryError: memory limit exceeded");
  EXPECT_EQ(reader.getError().getTrace(), "trace");
  EXPECT_THAT(reader.getMessage().cStr(), HasSubstr("memory limit"));
}

// NOLINTNEXTLINE
TEST(ResultCodec, FromCapnpRestoresTheResult) {
  ExecutionResult result;
  result.status = ExecutionStatus::RESOURCE_EXCEEDED;
  result.exceeded_resource = ResourceKind::CPU_TIME;
  result.output = "partial";
  result.payload["n"] = "1";
  result.error = ErrorDetail{"CPU time limit exceeded", "trace"};
  result.usage.wall_time_millis = 30;
  result.usage.peak_memory_kb = 512;

  capnp::MallocMessageBuilder message;
  sandbox::ToCapnp(result, message.initRoot<capnproto::ExecutionResult>());
  ExecutionResult decoded = sandbox::FromCapnp(
      message.getRoot<capnproto::ExecutionResult>().asReader());
  EXPECT_EQ(decoded.status, ExecutionStatus::RESOURCE_EXCEEDED);
  EXPECT_EQ(decoded.exceeded_resource, ResourceKind::CPU_TIME);
  EXPECT_EQ(decoded.output, "partial");
  EXPECT_EQ(decoded.payload, result.payload);
  EXPECT_EQ(decoded.usage.wall_time_millis, 30);
  EXPECT_EQ(decoded.usage.peak_memory_kb, 512);
  KJ_IF_MAYBE(error, decoded.error) {
    EXPECT_EQ(error->message, "CPU time limit exceeded");
    EXPECT_EQ(error->trace, "trace");
  } else {
    ADD_FAILURE() << "missing error detail";
  }

  capnp::MallocMessageBuilder empty;
  empty.initRoot<capnproto::ExecutionResult>().setStatus(
      capnproto::ExecutionResult::Status::SUCCESS);
  ExecutionResult bare = sandbox::FromCapnp(
      empty.getRoot<capnproto::ExecutionResult>().asReader());
  EXPECT_TRUE(bare.error == nullptr);
}

// NOLINTNEXTLINE
TEST(ResultCodec, ViolationsSurviveJson) {
  validator::ValidationReport report;
  report.is_safe = false;
  validator::Violation violation;
  violation.category = validator::ViolationCategory::IMPORT;
  violation.symbol = "os";
  violation.location.line = 3;
  violation.location.column = 7;
  violation.message = "Import of module 'os' is not allowed";
  report.violations.push_back(violation);
  report.warnings.push_back("code does not define result");
  report.validation_time_micros = 42;

  std::string json = sandbox::ToJson(report);
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnproto::ValidationReport>();
  codec.decode(kj::ArrayPtr<const char>(json.data(), json.size()), root);
  auto reader = root.asReader();
  EXPECT_FALSE(reader.getIsSafe());
  ASSERT_EQ(reader.getViolations().size(), 1u);
  EXPECT_EQ(reader.getViolations()[0].getCategory(),
            capnproto::Violation::Category::IMPORTS);
  EXPECT_EQ(reader.getViolations()[0].getSymbol(), "os");
  EXPECT_EQ(reader.getViolations()[0].getLocation().getLine(), 3u);
  EXPECT_EQ(reader.getViolations()[0].getLocation().getColumn(), 7u);
  EXPECT_THAT(json, HasSubstr("imports"));
  ASSERT_EQ(reader.getWarnings().size(), 1u);
  EXPECT_EQ(reader.getWarnings()[0], "code does not define result");
  EXPECT_EQ(reader.getValidationTimeMicros(), 42);
}

// NOLINTNEXTLINE
TEST(ResultCodec, Stats) {
  SandboxStats stats;
  stats.submissions = 4;
  stats.validated = 3;
  stats.rejected = 1;
  stats.succeeded = 2;
  stats.timeouts = 1;
  stats.total_execution_millis = 300;

  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::SandboxStats>();
  sandbox::ToCapnp(stats, builder);
  auto reader = builder.asReader();
  EXPECT_EQ(reader.getSubmissions(), 4u);
  EXPECT_EQ(reader.getTimeouts(), 1u);
  EXPECT_DOUBLE_EQ(reader.getSuccessRate(), 0.5);
  EXPECT_DOUBLE_EQ(reader.getRejectionRate(), 0.25);
  EXPECT_DOUBLE_EQ(reader.getAverageExecutionMillis(), 100.0);
}

// NOLINTNEXTLINE
TEST(ResultCodec, StatusNamesInJson) {
  ExecutionResult result;
  result.status = ExecutionStatus::TIMEOUT;
  result.exceeded_resource = ResourceKind::WALL_CLOCK;
  std::string json = sandbox::ToJson(result);
  EXPECT_THAT(json, HasSubstr("timeout"));
  EXPECT_THAT(json, HasSubstr("wallClock"));
}

}  // namespace
