#include <csignal>
#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/config.hpp"
#include "sandbox/resource_monitor.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace {

const char* test_tmpdir = "/tmp/codebox_testdir";

using ::testing::HasSubstr;
using ::testing::StartsWith;

using namespace sandbox;  // NOLINT

// Runs the helper programs built next to the tests.
class UnixTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sandbox_ = Sandbox::Create();
    ASSERT_TRUE(sandbox_);
  }

  static ExecutionOptions Helper(const std::string& name,
                                 const std::string& arg) {
    ExecutionOptions options("sandbox/test", name);
    options.args.push_back(arg);
    return options;
  }

  // Runs a program that is expected to start.
  ExecutionInfo Run(const ExecutionOptions& options) {
    ExecutionInfo info;
    std::string error_msg;
    EXPECT_TRUE(sandbox_->Execute(options, &info, &error_msg)) << error_msg;
    EXPECT_EQ(error_msg, "");
    return info;
  }

  // Runs a program that is expected not to start.
  std::string RunError(const ExecutionOptions& options) {
    ExecutionInfo info;
    std::string error_msg;
    EXPECT_FALSE(sandbox_->Execute(options, &info, &error_msg));
    return error_msg;
  }

  std::unique_ptr<Sandbox> sandbox_;
};

// NOLINTNEXTLINE
TEST_F(UnixTest, MissingRoot) {
  EXPECT_THAT(RunError(ExecutionOptions("no/such/dir", "return_arg1")),
              StartsWith("chdir:"));
}

// NOLINTNEXTLINE
TEST_F(UnixTest, MissingExecutable) {
  EXPECT_THAT(RunError(ExecutionOptions("sandbox/test", "no_such_program")),
              StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST_F(UnixTest, MissingStdin) {
  ExecutionOptions options = Helper("copy_int", "");
  options.stdin_file = "/nonexistent/stdin";
  EXPECT_THAT(RunError(options), StartsWith("open:"));
}

// NOLINTNEXTLINE
TEST_F(UnixTest, ExitStatus) {
  ExecutionInfo info = Run(Helper("return_arg1", "15"));
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_EQ(info.message, "Exited with status 15");

  info = Run(Helper("return_arg1", "0"));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(info.message, "");
}

// NOLINTNEXTLINE
TEST_F(UnixTest, Signal) {
  ExecutionInfo info = Run(Helper("signal_arg1", std::to_string(SIGABRT)));
  EXPECT_EQ(info.signal, SIGABRT);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_THAT(info.message, StartsWith("Killed by signal 6"));
}

// NOLINTNEXTLINE
TEST_F(UnixTest, SleepUsesNoCpu) {
  ExecutionInfo info = Run(Helper("wait_arg1", "0.1"));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.wall_time_millis, 90);
  EXPECT_LE(info.wall_time_millis, 500);
  EXPECT_LE(info.cpu_time_millis, 50);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, BusyWaitUsesCpu) {
  ExecutionInfo info = Run(Helper("busywait_arg1", "0.2"));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 180);
  EXPECT_GE(info.wall_time_millis, 180);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, PeakMemory) {
  ExecutionInfo info = Run(Helper("malloc_arg1", "40"));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.memory_usage_kb, 40 * 1024);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, LoweredSoftLimitsAreNotInherited) {
  // As during a monitored run in this process.
  ScopedRlimit memory(RLIMIT_AS,
                      ResourceMonitor::AddressSpaceBytes() + 64 * kMiB);
  ExecutionInfo info = Run(Helper("malloc_arg1", "200"));
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, FileLimits) {
  util::TempDir tmp(test_tmpdir);
  ExecutionOptions options("sandbox/test", "copy_int");
  options.stdin_file = util::File::JoinPath(tmp.Path(), "in");
  options.stdout_file = util::File::JoinPath(tmp.Path(), "out");
  util::File::WriteAll(options.stdin_file, "10");
  options.max_files = 16;
  options.max_file_size_kb = 1;
  ExecutionInfo info = Run(options);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::ReadAll(options.stdout_file), "10\n");
}

// NOLINTNEXTLINE
TEST_F(UnixTest, WallLimitNotReached) {
  ExecutionOptions options = Helper("wait_arg1", "0.1");
  options.wall_limit_millis = 1000;
  ExecutionInfo info = Run(options);
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.killed);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, WallLimitKills) {
  ExecutionOptions options = Helper("wait_arg1", "5");
  options.wall_limit_millis = 100;
  ExecutionInfo info = Run(options);
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_TRUE(info.killed);
  EXPECT_THAT(info.message, HasSubstr("limits exceeded"));
  EXPECT_GE(info.wall_time_millis, 100);
  EXPECT_LE(info.wall_time_millis, 1000);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, CpuLimitKills) {
  ExecutionOptions options = Helper("busywait_arg1", "10");
  options.cpu_limit_millis = 1000;
  ExecutionInfo info = Run(options);
  EXPECT_TRUE(info.killed);
  EXPECT_EQ(info.signal, SIGXCPU);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 900);
  EXPECT_LE(info.cpu_time_millis + info.sys_time_millis, 2500);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, Redirects) {
  util::TempDir tmp(test_tmpdir);
  ExecutionOptions options("sandbox/test", "copy_int");
  options.stdin_file = util::File::JoinPath(tmp.Path(), "in");
  options.stdout_file = util::File::JoinPath(tmp.Path(), "out");
  options.stderr_file = util::File::JoinPath(tmp.Path(), "err");
  util::File::WriteAll(options.stdin_file, "10");

  ExecutionInfo info = Run(options);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::ReadAll(options.stdout_file), "10\n");
  EXPECT_EQ(util::File::ReadAll(options.stderr_file), "20\n");
}

// NOLINTNEXTLINE
TEST_F(UnixTest, StdinDefaultsToDevNull) {
  util::TempDir tmp(test_tmpdir);
  ExecutionOptions options("sandbox/test", "copy_int");
  options.stdout_file = util::File::JoinPath(tmp.Path(), "out");
  ExecutionInfo info = Run(options);
  EXPECT_EQ(info.status_code, 1);
  EXPECT_EQ(util::File::ReadAll(options.stdout_file), "");
}

}  // namespace
