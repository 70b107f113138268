#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static std::string temp_directory;
  static bool keep_sandboxes;
  static std::string policy_file;

  // Submission defaults
  static std::string mode;
  static std::string timeout_seconds;
  static int32_t memory_limit_mb;
  static std::string max_timeout_seconds;
  static int32_t max_memory_limit_mb;

  // Restricted-backend flags
  static bool disable_restricted;

  // Isolated-backend flags
  static bool disable_isolated;
  static std::string docker;
  static std::string container_image;
  static std::string container_python;
  static std::string container_cpus;
  static int32_t container_memory_mb;
  static int32_t container_pids;
  static std::string container_user;
  static int32_t max_concurrency;
  static int32_t startup_grace_ms;
};

#endif
