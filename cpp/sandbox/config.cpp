#include "sandbox/config.hpp"

#include <cmath>
#include <cstdlib>

#include <kj/debug.h>

#include "util/flags.hpp"

namespace sandbox {

bool ParseSeconds(const std::string& text, double* seconds) {
  if (text.empty()) return false;
  char* end = nullptr;
  double value = strtod(text.c_str(), &end);
  if (end == nullptr || *end != '\0') return false;
  if (!std::isfinite(value) || value <= 0) return false;
  *seconds = value;
  return true;
}

SandboxConfig SandboxConfig::FromFlags() {
  SandboxConfig config;
  KJ_REQUIRE(ParseSeconds(Flags::timeout_seconds,
                          &config.default_timeout_seconds),
             "Invalid timeout", Flags::timeout_seconds);
  KJ_REQUIRE(
      ParseSeconds(Flags::max_timeout_seconds, &config.max_timeout_seconds),
      "Invalid maximum timeout", Flags::max_timeout_seconds);
  KJ_REQUIRE(Flags::memory_limit_mb > 0, "Invalid memory limit",
             Flags::memory_limit_mb);
  KJ_REQUIRE(Flags::max_memory_limit_mb > 0, "Invalid maximum memory limit",
             Flags::max_memory_limit_mb);
  config.default_memory_limit_bytes = Flags::memory_limit_mb * kMiB;
  config.max_memory_limit_bytes = Flags::max_memory_limit_mb * kMiB;
  if (config.default_timeout_seconds > config.max_timeout_seconds) {
    config.default_timeout_seconds = config.max_timeout_seconds;
  }
  if (config.default_memory_limit_bytes > config.max_memory_limit_bytes) {
    config.default_memory_limit_bytes = config.max_memory_limit_bytes;
  }

  config.restricted_enabled = !Flags::disable_restricted;
  config.isolated_enabled = !Flags::disable_isolated;
  KJ_REQUIRE(config.restricted_enabled || config.isolated_enabled,
             "Both execution backends are disabled");

  if (!Flags::policy_file.empty()) {
    config.policy = validator::ValidationPolicy::FromFile(Flags::policy_file);
    KJ_LOG(INFO, "Loaded validation policy", Flags::policy_file);
  }

  KJ_REQUIRE(Flags::container_memory_mb > 0, "Invalid container memory cap",
             Flags::container_memory_mb);
  KJ_REQUIRE(Flags::max_concurrency > 0, "Invalid container concurrency",
             Flags::max_concurrency);
  KJ_REQUIRE(Flags::startup_grace_ms >= 0, "Invalid startup grace",
             Flags::startup_grace_ms);
  config.container.docker = Flags::docker;
  config.container.image = Flags::container_image;
  config.container.python = Flags::container_python;
  config.container.cpus = Flags::container_cpus;
  config.container.memory_cap_bytes = Flags::container_memory_mb * kMiB;
  config.container.pids_limit = Flags::container_pids;
  config.container.user = Flags::container_user;
  config.container.temp_directory = Flags::temp_directory;
  config.container.keep_sandboxes = Flags::keep_sandboxes;
  config.container.max_concurrency = Flags::max_concurrency;
  config.container.startup_grace_millis = Flags::startup_grace_ms;
  return config;
}

}  // namespace sandbox
