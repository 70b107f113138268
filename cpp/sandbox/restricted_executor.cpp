#include "sandbox/restricted_executor.hpp"

#include <pybind11/pybind11.h>

#include <signal.h>
#include <sys/mman.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <mutex>
#include <new>
#include <thread>

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>
#include <kj/io.h>

#include "sandbox/artifact.hpp"
#include "sandbox/interpreter.hpp"
#include "sandbox/resource_monitor.hpp"
#include "sandbox/result_codec.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace py = pybind11;

namespace sandbox {
namespace {

const constexpr char* kSourceName = "<generated>";
// The child is killed this long after the timeout, as code can swallow the
// interruption or keep the interpreter from ever handling it.
const constexpr int64_t kKillGraceMillis = 1000;
const constexpr auto kWaitInterval = std::chrono::milliseconds(5);
// Exit status of a child that failed before producing a result.
const constexpr int kChildFault = 70;

std::mutex execute_mutex;

// What happened inside the monitored call. running and thread_id are only
// accessed with the GIL held.
struct RunState {
  bool running = false;
  unsigned long thread_id = 0;  // NOLINT(runtime/int)
  bool interrupted = false;
  bool out_of_memory = false;
  kj::Maybe<ErrorDetail> runtime_error;
  kj::Maybe<std::string> contract_error;
  ResultPayload payload;
};

// Python objects of one execution. They are released with the GIL held, and
// the process output streams are put back if still redirected.
class PythonState {
 public:
  PythonState() = default;
  ~PythonState() {
    py::gil_scoped_acquire acquire;
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([this]() {
                  RestoreStreams();
                })) {
      KJ_LOG(ERROR, "Failed to restore output streams", *exception);
    }
    globals = py::object();
    buffer = py::object();
    saved_stdout = py::object();
    saved_stderr = py::object();
  }
  KJ_DISALLOW_COPY(PythonState);

  void RedirectStreams() {
    py::module_ sys = py::module_::import("sys");
    buffer = py::module_::import("io").attr("StringIO")();
    saved_stdout = sys.attr("stdout");
    saved_stderr = sys.attr("stderr");
    sys.attr("stdout") = buffer;
    sys.attr("stderr") = buffer;
    redirected_ = true;
  }

  void RestoreStreams() {
    if (!redirected_) return;
    py::module_ sys = py::module_::import("sys");
    sys.attr("stdout") = saved_stdout;
    sys.attr("stderr") = saved_stderr;
    redirected_ = false;
  }

  py::object globals;
  py::object buffer;
  py::object saved_stdout;
  py::object saved_stderr;

 private:
  bool redirected_ = false;
};

bool Allowed(const std::set<std::string>& allowed, const std::string& module) {
  return allowed.count(module) ||
         allowed.count(module.substr(0, module.find('.')));
}

std::string TypeName(py::handle object) {
  return py::str(object.get_type().attr("__name__")).cast<std::string>();
}

ErrorDetail Describe(py::error_already_set& e) {
  ErrorDetail detail;
  std::string type = py::str(e.type().attr("__name__")).cast<std::string>();
  std::string value = py::str(e.value()).cast<std::string>();
  detail.message = value.empty() ? type : type + ": " + value;
  try {
    py::object trace = e.trace();
    if (!trace) trace = py::none();
    py::list lines = py::module_::import("traceback")
                         .attr("format_exception")(e.type(), e.value(), trace);
    for (py::handle line : lines) detail.trace += line.cast<std::string>();
  } catch (py::error_already_set& format_error) {
    detail.trace = e.what();
  }
  return detail;
}

// Re-acquires the allowed modules and brings their global state back to the
// defaults, so that nothing leaks from a previous execution.
void ResetModules() {
  py::dict modules = py::module_::import("sys").attr("modules");
  if (modules.contains("matplotlib")) {
    py::object matplotlib = modules["matplotlib"];
    matplotlib.attr("rcdefaults")();
    matplotlib.attr("use")("Agg");
  }
  if (modules.contains("matplotlib.pyplot")) {
    modules["matplotlib.pyplot"].attr("close")("all");
  }
  if (modules.contains("random")) {
    modules["random"].attr("seed")();
  }
  if (modules.contains("numpy")) {
    modules["numpy"].attr("seterr")(
        py::arg("divide") = "warn", py::arg("over") = "warn",
        py::arg("under") = "ignore", py::arg("invalid") = "warn");
  }
}

// Imports a module to bind, or returns None if it is not installed.
py::object ImportBinding(const std::string& name) {
  try {
    py::module_ module = py::module_::import(name.c_str());
    if (name == "matplotlib") module.attr("use")("Agg");
    return std::move(module);
  } catch (py::error_already_set& e) {
    if (!e.matches(PyExc_ImportError)) throw;
    return py::none();
  }
}

py::dict BuildGlobals(const std::set<std::string>& allowed,
                      const std::string& artifact_path) {
  py::module_ real_builtins = py::module_::import("builtins");
  py::dict builtins;
  for (const std::string& name : RestrictedExecutor::SafeBuiltins()) {
    if (py::hasattr(real_builtins, name.c_str())) {
      builtins[name.c_str()] = real_builtins.attr(name.c_str());
    }
  }
  builtins["__import__"] = py::cpp_function(
      [allowed](const std::string& name, py::object globals, py::object locals,
                py::object fromlist, int level) {
        if (level != 0) {
          throw py::import_error("relative imports are not allowed");
        }
        if (!Allowed(allowed, name)) {
          throw py::import_error("import of module '" + name +
                                 "' is not allowed");
        }
        return py::module_::import("builtins")
            .attr("__import__")(name, globals, locals, fromlist, level);
      },
      py::arg("name"), py::arg("globals") = py::none(),
      py::arg("locals") = py::none(), py::arg("fromlist") = py::tuple(),
      py::arg("level") = 0);

  py::dict globals;
  globals["__builtins__"] = builtins;
  globals["__name__"] = "__main__";
  globals["output_path"] = artifact_path;
  for (const auto& binding : RestrictedExecutor::Bindings()) {
    if (!Allowed(allowed, binding.second)) continue;
    py::object module = ImportBinding(binding.second);
    if (module.is_none()) {
      KJ_LOG(WARNING, "Module not available, not binding it", binding.second,
             binding.first);
      continue;
    }
    globals[binding.first.c_str()] = module;
  }
  ResetModules();
  return globals;
}

// Converts the "result" binding to a payload. Returns false and sets
// error_msg if it is not a JSON-serializable mapping.
bool ExtractPayload(py::dict globals, ResultPayload* payload,
                    std::string* error_msg) {
  payload->clear();
  if (!globals.contains("result")) return true;
  py::object value = globals["result"];
  if (!py::isinstance<py::dict>(value)) {
    *error_msg = "result must be a dict, got " + TypeName(value);
    return false;
  }
  py::cpp_function fallback([](py::object object) -> py::object {
    if (py::hasattr(object, "tolist")) return object.attr("tolist")();
    return py::str(object);
  });
  std::string json;
  try {
    json = py::module_::import("json")
               .attr("dumps")(value, py::arg("default") = fallback,
                              py::arg("allow_nan") = false)
               .cast<std::string>();
  } catch (py::error_already_set& e) {
    if (e.matches(PyExc_KeyboardInterrupt) || e.matches(PyExc_MemoryError)) {
      throw;
    }
    *error_msg = "result is not JSON serializable: " + Describe(e).message;
    return false;
  }
  return ParsePayload(json, payload, error_msg);
}

// Saves the open pyplot figure to the artifact path, if the code did not
// write the artifact itself.
void SaveFigures(const std::string& artifact_path) {
  if (artifact_path.empty() || util::File::Exists(artifact_path)) return;
  py::dict modules = py::module_::import("sys").attr("modules");
  if (!modules.contains("matplotlib.pyplot")) return;
  py::object plt = modules["matplotlib.pyplot"];
  if (py::len(plt.attr("get_fignums")()) == 0) return;
  plt.attr("savefig")(artifact_path);
}

void Stop(RunState* state) {
  if (!state->running) return;
  state->running = false;
  // Drops an interruption that was requested but not delivered yet.
  PyThreadState_SetAsyncExc(state->thread_id, nullptr);
}

void RunCode(const std::string& source, const std::string& artifact_path,
             py::dict globals, RunState* state) {
  py::module_ builtins = py::module_::import("builtins");
  state->thread_id = PyThread_get_thread_ident();
  state->running = true;
  try {
    py::object code = builtins.attr("compile")(source, kSourceName, "exec");
    builtins.attr("exec")(code, globals);
    std::string contract_error;
    if (ExtractPayload(globals, &state->payload, &contract_error)) {
      SaveFigures(artifact_path);
    } else {
      state->contract_error = contract_error;
    }
  } catch (py::error_already_set& e) {
    Stop(state);
    if (e.matches(PyExc_MemoryError)) {
      state->out_of_memory = true;
    } else if (e.matches(PyExc_KeyboardInterrupt)) {
      state->interrupted = true;
    } else {
      state->runtime_error = Describe(e);
    }
  }
  Stop(state);
}

// Runs the code in this process. Called with the GIL released.
ExecutionResult RunMonitored(const std::set<std::string>& allowed,
                             const std::string& source,
                             const std::string& artifact_path,
                             const ExecutionLimits& limits) {
  PythonState python;
  RunState state;
  {
    py::gil_scoped_acquire acquire;
    python.globals = BuildGlobals(allowed, artifact_path);
    python.RedirectStreams();
  }

  ResourceLimits resource_limits;
  resource_limits.memory_limit_bytes = limits.memory_limit_bytes;
  resource_limits.cpu_time_limit_millis = limits.timeout_millis;
  resource_limits.wall_limit_millis = limits.timeout_millis;

  MonitoredRun run = ResourceMonitor::Run(
      [&](const CancellationToken& token) {
        {
          py::gil_scoped_acquire acquire;
          if (token.IsCancelled()) {
            state.interrupted = true;
          } else {
            RunCode(source, artifact_path,
                    py::reinterpret_borrow<py::dict>(python.globals), &state);
          }
        }
        if (state.out_of_memory) throw std::bad_alloc();
      },
      resource_limits,
      [&state]() {
        py::gil_scoped_acquire acquire;
        if (state.running) {
          PyThreadState_SetAsyncExc(state.thread_id, PyExc_KeyboardInterrupt);
        }
      });

  ExecutionResult result;
  result.usage = run.usage;
  {
    py::gil_scoped_acquire acquire;
    python.RestoreStreams();
    result.output =
        TruncateOutput(python.buffer.attr("getvalue")().cast<std::string>());
  }

  switch (run.breach) {
    case LimitBreach::WALL_CLOCK:
      result.status = ExecutionStatus::TIMEOUT;
      result.exceeded_resource = ResourceKind::WALL_CLOCK;
      result.error = ErrorDetail{"Execution timed out after " +
                                     std::to_string(limits.timeout_millis) +
                                     " ms",
                                 ""};
      return result;
    case LimitBreach::CPU_TIME:
      result.status = ExecutionStatus::RESOURCE_EXCEEDED;
      result.exceeded_resource = ResourceKind::CPU_TIME;
      result.error = ErrorDetail{"CPU time limit exceeded", ""};
      return result;
    case LimitBreach::MEMORY:
      result.status = ExecutionStatus::RESOURCE_EXCEEDED;
      result.exceeded_resource = ResourceKind::MEMORY;
      result.error = ErrorDetail{"MemoryError: memory limit exceeded", ""};
      return result;
    case LimitBreach::NONE:
      break;
  }

  KJ_IF_MAYBE(error, state.runtime_error) {
    result.status = ExecutionStatus::RUNTIME_ERROR;
    result.error = *error;
  } else if (state.interrupted) {
    result.status = ExecutionStatus::RUNTIME_ERROR;
    result.error = ErrorDetail{"KeyboardInterrupt", ""};
  } else {
    KJ_IF_MAYBE(contract_error, state.contract_error) {
      result.status = ExecutionStatus::CONTRACT_VIOLATION;
      result.error = ErrorDetail{*contract_error, ""};
    } else {
      result.status = ExecutionStatus::SUCCESS;
      result.payload = std::move(state.payload);
      if (util::File::Exists(artifact_path)) {
        result.artifact_path = artifact_path;
      }
    }
  }
  return result;
}


// Reads the result the child wrote to fd. Returns false if there is none.
bool ReadResult(int fd, ExecutionResult* result) {
  struct stat st {};
  KJ_SYSCALL(fstat(fd, &st));
  if (st.st_size == 0) return false;
  KJ_SYSCALL(lseek(fd, 0, SEEK_SET));
  capnp::StreamFdMessageReader reader(fd);
  *result = FromCapnp(reader.getRoot<capnproto::ExecutionResult>());
  return true;
}

// Body of the forked child, entered with the GIL held: runs the code and
// writes the result to result_fd.
[[noreturn]] void Child(const std::set<std::string>& allowed,
                        const std::string& source,
                        const std::string& artifact_path,
                        const ExecutionLimits& limits, int result_fd) {
  PyEval_SaveThread();
  int status = 0;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                ExecutionResult result =
                    RunMonitored(allowed, source, artifact_path, limits);
                capnp::MallocMessageBuilder message;
                ToCapnp(result, message.initRoot<capnproto::ExecutionResult>());
                capnp::writeMessageToFd(result_fd, message);
              })) {
    KJ_LOG(ERROR, "Restricted execution failed", *exception);
    status = kChildFault;
  }
  _exit(status);
}

// Waits for the child, killing it once the deadline passes. Returns how it
// ended.
ExecutionInfo WaitChild(pid_t pid,
                        std::chrono::steady_clock::time_point start,
                        const ExecutionLimits& limits) {
  auto deadline = start + std::chrono::milliseconds(limits.timeout_millis +
                                                    kKillGraceMillis);
  ExecutionInfo info;
  int status = 0;
  struct rusage usage {};
  while (true) {
    pid_t ret = wait4(pid, &status, WNOHANG, &usage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) KJ_FAIL_SYSCALL("wait4", errno, pid);
    if (ret == pid) break;
    if (!info.killed && limits.timeout_millis > 0 &&
        std::chrono::steady_clock::now() >= deadline) {
      KJ_LOG(WARNING, "Restricted execution ignored its deadline, killing it",
             pid);
      KJ_SYSCALL(kill(pid, SIGKILL), pid);
      info.killed = true;
    }
    std::this_thread::sleep_for(kWaitInterval);
  }
  info.wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  info.cpu_time_millis =
      usage.ru_utime.tv_sec * 1000LL + usage.ru_utime.tv_usec / 1000;
  info.sys_time_millis =
      usage.ru_stime.tv_sec * 1000LL + usage.ru_stime.tv_usec / 1000;
  info.memory_usage_kb = usage.ru_maxrss;
  if (WIFEXITED(status)) info.status_code = WEXITSTATUS(status);
  if (WIFSIGNALED(status)) info.signal = WTERMSIG(status);
  info.message = DescribeExit(info);
  return info;
}

}  // namespace

RestrictedExecutor::RestrictedExecutor(std::set<std::string> allowed_modules)
    : allowed_modules_(std::move(allowed_modules)) {}

bool RestrictedExecutor::IsAllowed(const std::string& module) const {
  return Allowed(allowed_modules_, module);
}

const std::vector<std::pair<std::string, std::string>>&
RestrictedExecutor::Bindings() {
  static const std::vector<std::pair<std::string, std::string>> bindings = {
      {"matplotlib", "matplotlib"}, {"mpl", "matplotlib"},
      {"plt", "matplotlib.pyplot"}, {"np", "numpy"},
      {"numpy", "numpy"},           {"math", "math"},
      {"cmath", "cmath"},           {"datetime", "datetime"},
      {"time", "time"},             {"calendar", "calendar"},
      {"random", "random"},         {"json", "json"},
      {"re", "re"},                 {"statistics", "statistics"},
      {"fractions", "fractions"},   {"decimal", "decimal"},
      {"collections", "collections"}, {"itertools", "itertools"},
      {"functools", "functools"},   {"copy", "copy"}};
  return bindings;
}

const std::vector<std::string>& RestrictedExecutor::SafeBuiltins() {
  static const std::vector<std::string> builtins = {
      // Values and containers.
      "abs", "all", "any", "ascii", "bin", "bool", "bytes", "chr", "complex",
      "dict", "divmod", "enumerate", "filter", "float", "format", "frozenset",
      "hex", "int", "iter", "len", "list", "map", "max", "min", "next",
      "object", "oct", "ord", "pow", "print", "range", "repr", "reversed",
      "round", "set", "slice", "sorted", "str", "sum", "tuple", "zip",
      "isinstance", "issubclass", "callable", "hash", "NotImplemented",
      "Ellipsis",
      // Class construction.
      "__build_class__", "super", "property", "staticmethod", "classmethod",
      // Exceptions and warnings.
      "Exception", "ArithmeticError", "AssertionError", "AttributeError",
      "FloatingPointError", "IndexError", "KeyError", "LookupError",
      "NameError", "NotImplementedError", "OverflowError", "RecursionError",
      "RuntimeError", "StopIteration", "TypeError", "ValueError",
      "ZeroDivisionError", "Warning", "UserWarning", "DeprecationWarning",
      "RuntimeWarning"};
  return builtins;
}

ExecutionResult RestrictedExecutor::Execute(const std::string& source,
                                            const std::string& artifact_path,
                                            const ExecutionLimits& limits) {
  std::lock_guard<std::mutex> lck(execute_mutex);
  Interpreter::EnsureStarted();
  artifact::Prepare(artifact_path);

  int fd;
  KJ_SYSCALL(fd = memfd_create("codebox-result", MFD_CLOEXEC));
  kj::AutoCloseFd result_fd(fd);
  auto start = std::chrono::steady_clock::now();
  pid_t pid;
  {
    py::gil_scoped_acquire acquire;
    // Loaded once here rather than in every child.
    for (const auto& binding : Bindings()) {
      if (IsAllowed(binding.second)) ImportBinding(binding.second);
    }
    PyOS_BeforeFork();
    pid = fork();
    if (pid == 0) {
      PyOS_AfterFork_Child();
      Child(allowed_modules_, source, artifact_path, limits, result_fd);
    }
    int fork_errno = errno;
    PyOS_AfterFork_Parent();
    if (pid == -1) KJ_FAIL_SYSCALL("fork", fork_errno);
  }

  ExecutionInfo info = WaitChild(pid, start, limits);
  ExecutionResult result;
  if (info.killed) {
    result.status = ExecutionStatus::TIMEOUT;
    result.exceeded_resource = ResourceKind::WALL_CLOCK;
    result.error = ErrorDetail{"Execution timed out after " +
                                   std::to_string(limits.timeout_millis) +
                                   " ms",
                               ""};
  } else if (info.signal == SIGXCPU) {
    result.status = ExecutionStatus::RESOURCE_EXCEEDED;
    result.exceeded_resource = ResourceKind::CPU_TIME;
    result.error = ErrorDetail{"CPU time limit exceeded", ""};
  } else if (info.status_code == kChildFault) {
    KJ_FAIL_REQUIRE("Restricted execution failed", info.message);
  } else if (info.message.empty() && ReadResult(result_fd, &result)) {
    return result;
  } else {
    result.status = ExecutionStatus::RUNTIME_ERROR;
    result.error = ErrorDetail{
        "The execution ended without a result" +
            (info.message.empty() ? "" : ": " + info.message),
        ""};
  }
  result.usage.wall_time_millis = info.wall_time_millis;
  result.usage.cpu_time_millis = info.cpu_time_millis + info.sys_time_millis;
  result.usage.peak_memory_kb = info.memory_usage_kb;
  return result;
}

}  // namespace sandbox
