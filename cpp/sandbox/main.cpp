#include "sandbox/main.hpp"

#include <iostream>

#include <kj/debug.h>
#include "sandbox/config.hpp"
#include "sandbox/result_codec.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace sandbox {

bool Main::SetSource(kj::StringPtr path) {
  source_path_ = path.cStr();
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  if (!util::File::Exists(source_path_)) {
    return kj::str("Source file not found: ", source_path_);
  }

  CodeSubmission submission;
  submission.source = util::File::ReadAll(source_path_);
  submission.artifact_path = artifact_path_;
  if (!ParseMode(Flags::mode, &submission.mode)) {
    return kj::str("Invalid mode: ", Flags::mode);
  }
  if (!ParseSeconds(Flags::timeout_seconds, &submission.timeout_seconds)) {
    return kj::str("Invalid timeout: ", Flags::timeout_seconds);
  }
  submission.memory_limit_bytes = Flags::memory_limit_mb * kMiB;

  ExecutionResult result;
  std::string stats;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                SandboxManager manager(SandboxConfig::FromFlags());
                result = manager.ExecuteSubmission(submission);
                if (print_stats_) stats = ToJson(manager.Stats());
              })) {
    KJ_LOG(ERROR, "Unable to set up the sandbox", *exception);
    return kj::str("Invalid configuration: ", exception->getDescription());
  }

  std::cout << ToJson(result) << std::endl;
  if (print_stats_) std::cerr << stats << std::endl;
  if (result.status != ExecutionStatus::SUCCESS) {
    context.exitError(StatusMessage(result));
  }
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Codebox Runner (" + util::version + ")",
                         "Validates and executes a generated Python program, "
                         "printing the result as JSON")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'o', "artifact"}, util::setString(artifact_path_),
                        "<PATH>", "Where the produced artifact is stored")
      .addOptionWithArg({'m', "mode"}, util::setString(Flags::mode),
                        "<MODE>", "Execution mode: restricted or isolated")
      .addOptionWithArg({'t', "timeout"},
                        util::setString(Flags::timeout_seconds), "<SECONDS>",
                        "Wall-clock limit of the execution")
      .addOptionWithArg({'M', "memory"}, util::setInt(Flags::memory_limit_mb),
                        "<MB>", "Memory limit of the execution, in megabytes")
      .addOptionWithArg({"max-timeout"},
                        util::setString(Flags::max_timeout_seconds),
                        "<SECONDS>", "Largest accepted wall-clock limit")
      .addOptionWithArg({"max-memory"},
                        util::setInt(Flags::max_memory_limit_mb), "<MB>",
                        "Largest accepted memory limit, in megabytes")
      .addOptionWithArg({'p', "policy"}, util::setString(Flags::policy_file),
                        "<FILE>", "JSON file with the validation policy")
      .addOption({"no-restricted"}, util::setBool(Flags::disable_restricted),
                 "Disable the in-process backend")
      .addOption({"no-isolated"}, util::setBool(Flags::disable_isolated),
                 "Disable the container backend")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where the sandboxes should be created")
      .addOption({'k', "keep-sandboxes"}, util::setBool(Flags::keep_sandboxes),
                 "Keep the sandboxes after the execution")
      .addOptionWithArg({"docker"}, util::setString(Flags::docker), "<PATH>",
                        "Container command line client")
      .addOptionWithArg({"image"}, util::setString(Flags::container_image),
                        "<IMAGE>", "Container image to run the code in")
      .addOptionWithArg({"container-python"},
                        util::setString(Flags::container_python), "<PATH>",
                        "Python interpreter inside the image")
      .addOptionWithArg({"container-cpus"},
                        util::setString(Flags::container_cpus), "<CPUS>",
                        "CPU quota of a container")
      .addOptionWithArg({"container-memory"},
                        util::setInt(Flags::container_memory_mb), "<MB>",
                        "Memory cap of a container, in megabytes")
      .addOptionWithArg({"container-pids"},
                        util::setInt(Flags::container_pids), "<N>",
                        "Maximum number of processes in a container")
      .addOptionWithArg({"container-user"},
                        util::setString(Flags::container_user), "<UID:GID>",
                        "Unprivileged user running the code")
      .addOptionWithArg({'j', "max-concurrency"},
                        util::setInt(Flags::max_concurrency), "<N>",
                        "Maximum number of concurrent containers")
      .addOptionWithArg({"startup-grace"},
                        util::setInt(Flags::startup_grace_ms), "<MS>",
                        "Extra wall time granted for container startup")
      .addOption({'s', "stats"}, util::setBool(print_stats_),
                 "Print the execution counters to stderr")
      .expectArg("<SOURCE>", KJ_BIND_METHOD(*this, SetSource))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace sandbox
