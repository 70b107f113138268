#ifndef SANDBOX_CONTAINER_EXECUTOR_HPP
#define SANDBOX_CONTAINER_EXECUTOR_HPP

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "sandbox/executor.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

struct ContainerOptions {
  // Name or path of the docker command line client.
  std::string docker = "docker";
  std::string image = "python:3.11-slim";
  // Interpreter inside the image.
  std::string python = "python3";
  std::string cpus = "0.5";
  // Upper bound for the memory ceiling of a container, 0 for none.
  int64_t memory_cap_bytes = 0;
  int32_t pids_limit = 64;
  std::string user = "65534:65534";
  // Where the per-execution scratch directories are created.
  std::string temp_directory = "/tmp/codebox";
  bool keep_sandboxes = false;
  int32_t max_concurrency = 4;
  // Time allowed for container creation on top of the execution timeout.
  int64_t startup_grace_millis = 3000;
};

// Runs code inside an ephemeral, network-disabled container, driven through
// the docker command line. Each execution uses a fresh container that is
// always removed afterwards. At most max_concurrency containers run at the
// same time.
class ContainerExecutor : public Executor {
 public:
  ContainerExecutor(ContainerOptions options,
                    std::set<std::string> allowed_modules);

  ExecutionResult Execute(const std::string& source,
                          const std::string& artifact_path,
                          const ExecutionLimits& limits) override;

  // The arguments of the docker run invocation, after the docker executable.
  std::vector<std::string> RunArguments(const std::string& name,
                                        const std::string& code_dir,
                                        const std::string& out_dir,
                                        const std::string& artifact_name,
                                        const ExecutionLimits& limits) const;

  // Python program that runs the code inside the container.
  static const char* Harness();

  // Exit codes of the harness.
  static const constexpr int kRuntimeFault = 1;
  static const constexpr int kContractViolation = 2;

 private:
  class Slot;

  // Runs docker with the given arguments. Returns false and sets error_msg if
  // the client could not be started.
  bool RunDocker(const std::string& dir, const std::vector<std::string>& args,
                 int64_t wall_limit_millis, ExecutionInfo* info,
                 std::string* error_msg);

  // Reads a single line printed by a docker command.
  std::string QueryDocker(const std::string& dir,
                          const std::vector<std::string>& args);

  // Forcibly removes a container, whatever its state.
  void Teardown(const std::string& dir, const std::string& name);

  ExecutionResult Collect(const std::string& dir, const std::string& name,
                          const std::string& artifact_path,
                          const ExecutionInfo& info,
                          const ExecutionLimits& limits);

  ContainerOptions options_;
  std::set<std::string> allowed_modules_;

  std::mutex slots_mutex_;
  std::condition_variable slots_cv_;
  int32_t free_slots_;
};

}  // namespace sandbox

#endif
