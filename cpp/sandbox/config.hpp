#ifndef SANDBOX_CONFIG_HPP
#define SANDBOX_CONFIG_HPP

#include <cstdint>
#include <string>

#include "sandbox/container_executor.hpp"
#include "validator/policy.hpp"

namespace sandbox {

static const constexpr int64_t kMiB = 1024 * 1024;

// Settings of a SandboxManager.
struct SandboxConfig {
  // Used for submissions without a valid limit.
  double default_timeout_seconds = 30;
  int64_t default_memory_limit_bytes = 512 * kMiB;
  // Larger limits are clamped to these values.
  double max_timeout_seconds = 300;
  int64_t max_memory_limit_bytes = 4096 * kMiB;

  bool restricted_enabled = true;
  bool isolated_enabled = true;

  validator::ValidationPolicy policy = validator::ValidationPolicy::Default();
  ContainerOptions container;

  // Builds the configuration from the command line flags. Throws
  // kj::Exception on invalid values.
  static SandboxConfig FromFlags();
};

// Parses a positive, finite number of seconds. Returns false otherwise.
bool ParseSeconds(const std::string& text, double* seconds);

}  // namespace sandbox

#endif
