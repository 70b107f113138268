#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>

#include <kj/io.h>

namespace sandbox {
namespace {

const constexpr auto kPollInterval = std::chrono::milliseconds(10);

// Setup steps of the child, reported with errno when they fail.
enum class Step : int32_t { SETSID, OPEN, CHDIR, REDIRECT, RLIMIT, EXEC };

const char* StepName(Step step) {
  switch (step) {
    case Step::SETSID:
      return "setsid";
    case Step::OPEN:
      return "open";
    case Step::CHDIR:
      return "chdir";
    case Step::REDIRECT:
      return "dup2";
    case Step::RLIMIT:
      return "setrlimit";
    case Step::EXEC:
      return "exec";
  }
  return "setup";
}

struct ChildFailure {
  Step step;
  int error;
};

std::string ErrnoMessage(const char* what, int error) {
  return std::string(what) + ": " + strerror(error);
}

int64_t Millis(const struct timeval& tv) {
  return tv.tv_sec * 1000LL + tv.tv_usec / 1000;
}

[[noreturn]] void Fail(int error_fd, Step step) {
  ChildFailure failure{step, errno};
  (void)!write(error_fd, &failure, sizeof(failure));
  _exit(127);
}

}  // namespace

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  std::vector<char*> argv;
  argv.push_back(const_cast<char*>(options.executable.c_str()));  // NOLINT
  for (const std::string& arg : options.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));  // NOLINT
  }
  argv.push_back(nullptr);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = ErrnoMessage("pipe2", errno);
    return false;
  }
  kj::AutoCloseFd error_reader(fds[0]);
  kj::AutoCloseFd error_writer(fds[1]);

  Clock::time_point start = Clock::now();
  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    return false;
  }
  if (pid == 0) Child(options, argv.data(), fds[1]);

  // The write end stays open only in the child, until exec closes it.
  error_writer = nullptr;
  if (ChildFailed(error_reader, pid, error_msg)) return false;
  return Wait(pid, start, options.wall_limit_millis, info, error_msg);
}

void Unix::Child(const ExecutionOptions& options, char* const* argv,
                 int error_fd) {
  // A new session keeps terminal signals away and lets the parent kill the
  // program together with its descendants.
  if (setsid() == -1) Fail(error_fd, Step::SETSID);

  struct Redirect {
    const char* path;
    int flags;
    int target;
  };
  const Redirect redirects[] = {
      {options.stdin_file.empty() ? "/dev/null" : options.stdin_file.c_str(),
       O_RDONLY, STDIN_FILENO},
      {options.stdout_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
       STDOUT_FILENO},
      {options.stderr_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
       STDERR_FILENO},
  };
  int opened[3] = {-1, -1, -1};
  for (int i = 0; i < 3; i++) {
    if (redirects[i].path[0] == '\0') continue;
    opened[i] = open(redirects[i].path, redirects[i].flags | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (opened[i] == -1) Fail(error_fd, Step::OPEN);
  }

  if (chdir(options.root.c_str()) == -1) Fail(error_fd, Step::CHDIR);

  for (int i = 0; i < 3; i++) {
    if (opened[i] == -1) continue;
    if (dup2(opened[i], redirects[i].target) == -1) {
      Fail(error_fd, Step::REDIRECT);
    }
  }

  // The hard CPU limit is one second past the soft one, so that the program
  // gets SIGXCPU rather than SIGKILL. Limits that are not requested are
  // raised to their hard value: a soft limit lowered elsewhere in this
  // process, such as by a monitored run, must not reach the program.
  struct Limit {
    decltype(RLIMIT_AS) resource;
    rlim_t value;
    rlim_t slack;
  };
  const Limit limits[] = {
      {RLIMIT_AS, 0, 0},
      {RLIMIT_CPU,
       static_cast<rlim_t>((options.cpu_limit_millis + 999) / 1000), 1},
      {RLIMIT_FSIZE, static_cast<rlim_t>(options.max_file_size_kb) * 1024, 0},
      {RLIMIT_NOFILE, static_cast<rlim_t>(options.max_files), 0},
  };
  for (const Limit& limit : limits) {
    struct rlimit rlim {};
    if (limit.value == 0) {
      if (getrlimit(limit.resource, &rlim) == -1) Fail(error_fd, Step::RLIMIT);
      rlim.rlim_cur = rlim.rlim_max;
    } else {
      rlim.rlim_cur = limit.value;
      rlim.rlim_max = limit.value + limit.slack;
    }
    if (setrlimit(limit.resource, &rlim) == -1) Fail(error_fd, Step::RLIMIT);
  }
  struct rlimit no_core {};
  if (setrlimit(RLIMIT_CORE, &no_core) == -1) Fail(error_fd, Step::RLIMIT);

  execv(options.executable.c_str(), argv);
  Fail(error_fd, Step::EXEC);
}

bool Unix::ChildFailed(int error_fd, pid_t pid, std::string* error_msg) {
  ChildFailure failure{};
  ssize_t amount;
  do {
    amount = read(error_fd, &failure, sizeof(failure));
  } while (amount == -1 && errno == EINTR);
  // End of file: exec closed the pipe.
  if (amount == 0) return false;
  if (amount == sizeof(failure)) {
    *error_msg = ErrnoMessage(StepName(failure.step), failure.error);
  } else {
    *error_msg = ErrnoMessage("read", amount == -1 ? errno : EIO);
  }
  while (waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {
  }
  return true;
}

bool Unix::Wait(pid_t pid, Clock::time_point start, int64_t wall_limit_millis,
                ExecutionInfo* info, std::string* error_msg) {
  Clock::time_point deadline =
      start + std::chrono::milliseconds(wall_limit_millis);
  int status = 0;
  struct rusage usage {};
  bool timed_out = false;
  while (true) {
    pid_t ret = wait4(pid, &status, WNOHANG, &usage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = ErrnoMessage("wait4", errno);
      return false;
    }
    if (ret == pid) break;
    if (wall_limit_millis > 0 && Clock::now() >= deadline) {
      timed_out = true;
      if (kill(-pid, SIGKILL) == -1 && kill(pid, SIGKILL) == -1) {
        *error_msg = ErrnoMessage("kill", errno);
        return false;
      }
      while ((ret = wait4(pid, &status, 0, &usage)) == -1 && errno == EINTR) {
      }
      if (ret != pid) {
        *error_msg = ErrnoMessage("wait4", errno);
        return false;
      }
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  info->wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                            start)
          .count();
  info->cpu_time_millis = Millis(usage.ru_utime);
  info->sys_time_millis = Millis(usage.ru_stime);
  info->memory_usage_kb = usage.ru_maxrss;
  info->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  info->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  info->killed = timed_out || info->signal == SIGXCPU;
  info->message = DescribeExit(*info);
  return true;
}

}  // namespace sandbox
