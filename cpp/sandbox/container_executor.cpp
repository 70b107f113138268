#include "sandbox/container_executor.hpp"

#include <csignal>
#include <memory>
#include <random>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include "capnp/execution.capnp.h"
#include "sandbox/artifact.hpp"
#include "sandbox/restricted_executor.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace sandbox {
namespace {

const constexpr char* kCodeMount = "/sandbox/code";
const constexpr char* kOutMount = "/sandbox/out";
const constexpr int64_t kDockerCommandMillis = 30000;
// Limits of the docker client process itself.
const constexpr int32_t kClientMaxFiles = 1024;
const constexpr int64_t kClientMaxFileSizeKb = 64 * 1024;
const constexpr uint64_t kMaxResultBytes = 16 << 20;

const constexpr char* kHarness = R"PY(import importlib
import json
import os
import resource
import sys
import time
import traceback

CODE_DIR, OUT_DIR, ARTIFACT, CPU_SECONDS = sys.argv[1:5]
RUNTIME_FAULT = 1
CONTRACT_VIOLATION = 2
START = time.monotonic()


def dump(name, value):
    with open(os.path.join(OUT_DIR, name), "w") as f:
        json.dump(value, f, allow_nan=False)


def write_usage():
    # Int64 values are strings in the Cap'n Proto JSON mapping.
    usage = resource.getrusage(resource.RUSAGE_SELF)
    dump("usage.json", {
        "wallTimeMillis": str(int((time.monotonic() - START) * 1000)),
        "cpuTimeMillis": str(int((usage.ru_utime + usage.ru_stime) * 1000)),
        "peakMemoryKb": str(usage.ru_maxrss),
    })


def fail(code, kind, message, trace=""):
    write_usage()
    dump("error.json", {"type": kind, "message": message, "trace": trace})
    return code


def to_json(value):
    if hasattr(value, "tolist"):
        return value.tolist()
    return str(value)


def main():
    seconds = int(CPU_SECONDS)
    resource.setrlimit(resource.RLIMIT_CPU, (seconds, seconds + 1))
    sys.stderr = sys.stdout
    output_path = os.path.join(OUT_DIR, ARTIFACT) if ARTIFACT else ""
    namespace = {"__name__": "__main__", "output_path": output_path}
    with open(os.path.join(CODE_DIR, "bindings.json")) as f:
        for name, module in json.load(f):
            try:
                namespace[name] = importlib.import_module(module)
            except ImportError:
                pass
    with open(os.path.join(CODE_DIR, "main.py")) as f:
        source = f.read()
    # From here on, exit statuses are the code's own.
    open(os.path.join(OUT_DIR, "started"), "w").close()
    try:
        exec(compile(source, "<generated>", "exec"), namespace)
    except BaseException as e:
        return fail(RUNTIME_FAULT, type(e).__name__, str(e),
                    traceback.format_exc())
    result = namespace.get("result", {})
    if not isinstance(result, dict):
        return fail(CONTRACT_VIOLATION, "ContractViolation",
                    "result must be a dict, got " + type(result).__name__)
    try:
        text = json.dumps(result, default=to_json, allow_nan=False)
    except (TypeError, ValueError) as e:
        return fail(CONTRACT_VIOLATION, "ContractViolation",
                    "result is not JSON serializable: " + str(e))
    plt = sys.modules.get("matplotlib.pyplot")
    if (output_path and not os.path.exists(output_path) and plt is not None
            and plt.get_fignums()):
        plt.savefig(output_path)
    with open(os.path.join(OUT_DIR, "result.json"), "w") as f:
        f.write(text)
    write_usage()
    return 0


if __name__ == "__main__":
    status = main()
    sys.stdout.flush()
    sys.exit(status)
)PY";

std::string ContainerName() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  static const char* digits = "0123456789abcdef";
  std::string name = "codebox-";
  uint64_t value = engine();
  for (int i = 0; i < 16; i++) {
    name += digits[value & 0xf];
    value >>= 4;
  }
  return name;
}

std::string BindingsJson(const std::set<std::string>& allowed) {
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();
  std::vector<std::pair<std::string, std::string>> bindings;
  for (const auto& binding : RestrictedExecutor::Bindings()) {
    const std::string& module = binding.second;
    if (allowed.count(module) ||
        allowed.count(module.substr(0, module.find('.')))) {
      bindings.push_back(binding);
    }
  }
  auto list = root.initArray(bindings.size());
  for (size_t i = 0; i < bindings.size(); i++) {
    auto pair = list[i].initArray(2);
    pair[0].setString(bindings[i].first.c_str());
    pair[1].setString(bindings[i].second.c_str());
  }
  return codec.encodeRaw(root.asReader()).cStr();
}

// Decodes a JSON file written by the harness. Returns false if the file is
// missing or malformed.
template <typename T>
bool DecodeFile(const std::string& path, typename T::Builder builder) {
  if (!util::File::Exists(path)) return false;
  std::string json = util::File::ReadAll(path, kMaxResultBytes);
  capnp::JsonCodec codec;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                codec.decode(
                    kj::ArrayPtr<const char>(json.data(), json.size()),
                    builder);
              })) {
    KJ_LOG(WARNING, "Malformed harness file", path, *exception);
    return false;
  }
  return true;
}

void WriteFile(const std::string& path, const std::string& content,
               mode_t mode) {
  util::File::WriteAll(path, content);
  util::File::SetMode(path, mode);
}

}  // namespace

// Holds one of the concurrency slots of an executor.
class ContainerExecutor::Slot {
 public:
  explicit Slot(ContainerExecutor* executor) : executor_(executor) {
    std::unique_lock<std::mutex> lck(executor_->slots_mutex_);
    executor_->slots_cv_.wait(lck,
                              [this]() { return executor_->free_slots_ > 0; });
    executor_->free_slots_--;
  }
  ~Slot() {
    {
      std::lock_guard<std::mutex> lck(executor_->slots_mutex_);
      executor_->free_slots_++;
    }
    executor_->slots_cv_.notify_one();
  }
  KJ_DISALLOW_COPY(Slot);

 private:
  ContainerExecutor* executor_;
};

ContainerExecutor::ContainerExecutor(ContainerOptions options,
                                     std::set<std::string> allowed_modules)
    : options_(std::move(options)),
      allowed_modules_(std::move(allowed_modules)),
      free_slots_(options_.max_concurrency) {
  KJ_REQUIRE(options_.max_concurrency > 0, "Invalid container concurrency",
             options_.max_concurrency);
  KJ_REQUIRE(!options_.image.empty(), "No container image given");
}

const char* ContainerExecutor::Harness() { return kHarness; }

std::vector<std::string> ContainerExecutor::RunArguments(
    const std::string& name, const std::string& code_dir,
    const std::string& out_dir, const std::string& artifact_name,
    const ExecutionLimits& limits) const {
  int64_t memory = limits.memory_limit_bytes;
  if (options_.memory_cap_bytes > 0 &&
      (memory <= 0 || memory > options_.memory_cap_bytes)) {
    memory = options_.memory_cap_bytes;
  }
  int64_t cpu_seconds = (limits.timeout_millis + 999) / 1000;
  std::vector<std::string> args = {"run",
                                   "--name",
                                   name,
                                   "--network",
                                   "none",
                                   "--cpus",
                                   options_.cpus,
                                   "--pids-limit",
                                   std::to_string(options_.pids_limit),
                                   "--read-only",
                                   "--tmpfs",
                                   "/tmp:rw,size=64m",
                                   "--user",
                                   options_.user,
                                   "--cap-drop",
                                   "ALL",
                                   "--security-opt",
                                   "no-new-privileges",
                                   "-e",
                                   "MPLBACKEND=Agg",
                                   "-e",
                                   "MPLCONFIGDIR=/tmp",
                                   "-e",
                                   "HOME=/tmp",
                                   "-v",
                                   code_dir + ":" + kCodeMount + ":ro",
                                   "-v",
                                   out_dir + ":" + kOutMount + ":rw",
                                   "-w",
                                   kOutMount};
  if (memory > 0) {
    // Equal memory and swap ceilings disable swapping.
    std::string bytes = std::to_string(memory) + "b";
    args.insert(args.begin() + 5, {"--memory", bytes, "--memory-swap", bytes});
  }
  args.push_back(options_.image);
  args.push_back(options_.python);
  args.push_back(std::string(kCodeMount) + "/harness.py");
  args.push_back(kCodeMount);
  args.push_back(kOutMount);
  args.push_back(artifact_name);
  // The CPU ceiling is a backstop: the wall-clock limit fires first for
  // single-threaded code.
  args.push_back(std::to_string((cpu_seconds > 0 ? cpu_seconds : 1) + 1));
  return args;
}

bool ContainerExecutor::RunDocker(const std::string& dir,
                                  const std::vector<std::string>& args,
                                  int64_t wall_limit_millis,
                                  ExecutionInfo* info,
                                  std::string* error_msg) {
  std::string docker = util::which(options_.docker);
  if (docker.empty()) {
    *error_msg = "docker client not found: " + options_.docker;
    return false;
  }
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  if (!sandbox) {
    *error_msg = "No process sandbox available";
    return false;
  }
  ExecutionOptions options(dir, docker);
  options.args = args;
  options.wall_limit_millis = wall_limit_millis;
  // The client mostly waits: its CPU time is bounded by the wall time.
  options.cpu_limit_millis = wall_limit_millis;
  options.max_files = kClientMaxFiles;
  options.max_file_size_kb = kClientMaxFileSizeKb;
  options.stdout_file = util::File::JoinPath(dir, args.front() + ".stdout");
  options.stderr_file = util::File::JoinPath(dir, args.front() + ".stderr");
  return sandbox->Execute(options, info, error_msg);
}

std::string ContainerExecutor::QueryDocker(
    const std::string& dir, const std::vector<std::string>& args) {
  ExecutionInfo info;
  std::string error_msg;
  if (!RunDocker(dir, args, kDockerCommandMillis, &info, &error_msg)) {
    KJ_LOG(WARNING, "docker query failed", args.front(), error_msg);
    return "";
  }
  return util::trim(util::File::ReadAll(
      util::File::JoinPath(dir, args.front() + ".stdout"), 4096));
}

void ContainerExecutor::Teardown(const std::string& dir,
                                 const std::string& name) {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                ExecutionInfo info;
                std::string error_msg;
                if (!RunDocker(dir, {"rm", "-f", name}, kDockerCommandMillis,
                               &info, &error_msg)) {
                  KJ_LOG(ERROR, "Failed to remove container", name, error_msg);
                } else if (info.status_code != 0 || info.signal != 0) {
                  KJ_LOG(ERROR, "Failed to remove container", name,
                         util::File::ReadAll(
                             util::File::JoinPath(dir, "rm.stderr"), 4096));
                }
              })) {
    KJ_LOG(ERROR, "Failed to remove container", name, *exception);
  }
}

ExecutionResult ContainerExecutor::Collect(const std::string& dir,
                                           const std::string& name,
                                           const std::string& artifact_path,
                                           const ExecutionInfo& info,
                                           const ExecutionLimits& limits) {
  std::string out_dir = util::File::JoinPath(dir, "out");
  std::string client_errors =
      util::File::ReadAll(util::File::JoinPath(dir, "run.stderr"), 64 * 1024);
  ExecutionResult result;
  result.output = TruncateOutput(util::File::ReadAll(
      util::File::JoinPath(dir, "run.stdout"), kMaxOutputBytes + 1));
  result.usage.wall_time_millis = info.wall_time_millis;
  {
    capnp::MallocMessageBuilder message;
    auto usage = message.initRoot<capnproto::ResourceUsage>();
    if (DecodeFile<capnproto::ResourceUsage>(
            util::File::JoinPath(out_dir, "usage.json"), usage)) {
      result.usage.wall_time_millis = usage.getWallTimeMillis();
      result.usage.cpu_time_millis = usage.getCpuTimeMillis();
      result.usage.peak_memory_kb = usage.getPeakMemoryKb();
    }
  }

  if (info.signal == SIGXCPU || info.status_code == 128 + SIGXCPU) {
    result.status = ExecutionStatus::RESOURCE_EXCEEDED;
    result.exceeded_resource = ResourceKind::CPU_TIME;
    result.error = ErrorDetail{"CPU time limit exceeded", ""};
    return result;
  }
  if (info.killed) {
    result.status = ExecutionStatus::TIMEOUT;
    result.exceeded_resource = ResourceKind::WALL_CLOCK;
    result.error = ErrorDetail{"Execution timed out after " +
                                   std::to_string(limits.timeout_millis) +
                                   " ms",
                               ""};
    return result;
  }
  // docker reports its own failures as 125 to 127, before the harness starts.
  bool started = util::File::Exists(util::File::JoinPath(out_dir, "started"));
  if (!started && info.status_code >= 125 && info.status_code <= 127) {
    result.status = ExecutionStatus::INFRASTRUCTURE_FAULT;
    result.error = ErrorDetail{"docker run failed with status " +
                                   std::to_string(info.status_code) + ": " +
                                   util::trim(client_errors),
                               ""};
    return result;
  }
  if (info.status_code != 0 &&
      QueryDocker(dir, {"inspect", "--format", "{{.State.OOMKilled}}",
                        name}) == "true") {
    result.status = ExecutionStatus::RESOURCE_EXCEEDED;
    result.exceeded_resource = ResourceKind::MEMORY;
    result.error = ErrorDetail{"Container killed by the OOM killer", ""};
    return result;
  }

  capnp::MallocMessageBuilder message;
  auto error = message.initRoot<capnproto::HarnessError>();
  if (info.status_code != 0 &&
      DecodeFile<capnproto::HarnessError>(
          util::File::JoinPath(out_dir, "error.json"), error)) {
    std::string type = error.getType().cStr();
    std::string detail = error.getMessage().cStr();
    if (type == "MemoryError") {
      result.status = ExecutionStatus::RESOURCE_EXCEEDED;
      result.exceeded_resource = ResourceKind::MEMORY;
      result.error = ErrorDetail{"MemoryError: memory limit exceeded",
                                 error.getTrace().cStr()};
    } else if (info.status_code == kContractViolation) {
      result.status = ExecutionStatus::CONTRACT_VIOLATION;
      result.error = ErrorDetail{detail, ""};
    } else {
      result.status = ExecutionStatus::RUNTIME_ERROR;
      result.error = ErrorDetail{detail.empty() ? type : type + ": " + detail,
                                 error.getTrace().cStr()};
    }
    return result;
  }
  if (info.status_code != 0 || info.signal != 0) {
    result.status = ExecutionStatus::RUNTIME_ERROR;
    result.error = ErrorDetail{
        "Container exited with status " + std::to_string(info.status_code) +
            (info.message.empty() ? "" : " (" + info.message + ")"),
        util::trim(client_errors)};
    return result;
  }

  std::string result_file = util::File::JoinPath(out_dir, "result.json");
  if (!util::File::Exists(result_file)) {
    result.status = ExecutionStatus::CONTRACT_VIOLATION;
    result.error = ErrorDetail{"The execution did not produce a result", ""};
    return result;
  }
  std::string error_msg;
  if (!ParsePayload(util::File::ReadAll(result_file, kMaxResultBytes),
                    &result.payload, &error_msg)) {
    result.status = ExecutionStatus::CONTRACT_VIOLATION;
    result.error = ErrorDetail{error_msg, ""};
    return result;
  }
  result.status = ExecutionStatus::SUCCESS;
  if (!artifact_path.empty()) {
    std::string produced =
        util::File::JoinPath(out_dir, util::File::BaseName(artifact_path));
    if (util::File::Exists(produced)) {
      util::File::Copy(produced, artifact_path, /*overwrite=*/true);
      result.artifact_path = artifact_path;
    }
  }
  return result;
}

ExecutionResult ContainerExecutor::Execute(const std::string& source,
                                           const std::string& artifact_path,
                                           const ExecutionLimits& limits) {
  Slot slot(this);
  artifact::Prepare(artifact_path);
  if (util::which(options_.docker).empty()) {
    KJ_LOG(ERROR, "docker client not found", options_.docker);
    return MakeFailure(ExecutionStatus::INFRASTRUCTURE_FAULT,
                       "docker client not found: " + options_.docker);
  }

  util::TempDir tmp(options_.temp_directory);
  if (options_.keep_sandboxes) {
    tmp.Keep();
    KJ_LOG(INFO, "Keeping sandbox", tmp.Path());
  }
  util::File::SetMode(tmp.Path(), 0711);
  std::string code_dir = util::File::JoinPath(tmp.Path(), "code");
  std::string out_dir = util::File::JoinPath(tmp.Path(), "out");
  util::File::MakeDirs(code_dir);
  util::File::MakeDirs(out_dir);
  WriteFile(util::File::JoinPath(code_dir, "main.py"), source, 0644);
  WriteFile(util::File::JoinPath(code_dir, "harness.py"), kHarness, 0644);
  WriteFile(util::File::JoinPath(code_dir, "bindings.json"),
            BindingsJson(allowed_modules_), 0644);
  util::File::SetMode(code_dir, 0755);
  // The container user writes here.
  util::File::SetMode(out_dir, 0777);

  std::string name = ContainerName();
  std::string artifact_name =
      artifact_path.empty() ? "" : util::File::BaseName(artifact_path);
  KJ_DEFER(Teardown(tmp.Path(), name));

  ExecutionInfo info;
  std::string error_msg;
  if (!RunDocker(tmp.Path(),
                 RunArguments(name, code_dir, out_dir, artifact_name, limits),
                 limits.timeout_millis + options_.startup_grace_millis, &info,
                 &error_msg)) {
    KJ_LOG(ERROR, "Unable to start the container", name, error_msg);
    return MakeFailure(ExecutionStatus::INFRASTRUCTURE_FAULT,
                       "Unable to start the container: " + error_msg);
  }
  return Collect(tmp.Path(), name, artifact_path, info, limits);
}

}  // namespace sandbox
