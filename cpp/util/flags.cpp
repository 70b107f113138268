#include "util/flags.hpp"

std::string Flags::log_file;
std::string Flags::temp_directory = "/tmp/codebox";
bool Flags::keep_sandboxes = false;
std::string Flags::policy_file;

std::string Flags::mode = "restricted";
std::string Flags::timeout_seconds = "30";
int32_t Flags::memory_limit_mb = 512;
std::string Flags::max_timeout_seconds = "300";
int32_t Flags::max_memory_limit_mb = 4096;

bool Flags::disable_restricted = false;

bool Flags::disable_isolated = false;
std::string Flags::docker = "docker";
std::string Flags::container_image = "python:3.11-slim";
std::string Flags::container_python = "python3";
std::string Flags::container_cpus = "0.5";
int32_t Flags::container_memory_mb = 256;
int32_t Flags::container_pids = 64;
std::string Flags::container_user = "65534:65534";
int32_t Flags::max_concurrency = 4;
int32_t Flags::startup_grace_ms = 3000;
