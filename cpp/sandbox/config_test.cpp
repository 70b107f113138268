#include "sandbox/config.hpp"

#include <kj/exception.h>

#include "gtest/gtest.h"
#include "util/flags.hpp"

namespace {

using sandbox::kMiB;
using sandbox::ParseSeconds;
using sandbox::SandboxConfig;

// NOLINTNEXTLINE
TEST(Config, ParseSeconds) {
  double seconds = 0;
  EXPECT_TRUE(ParseSeconds("2.5", &seconds));
  EXPECT_DOUBLE_EQ(seconds, 2.5);
  EXPECT_TRUE(ParseSeconds("30", &seconds));
  EXPECT_DOUBLE_EQ(seconds, 30);
  EXPECT_FALSE(ParseSeconds("", &seconds));
  EXPECT_FALSE(ParseSeconds("0", &seconds));
  EXPECT_FALSE(ParseSeconds("-1", &seconds));
  EXPECT_FALSE(ParseSeconds("nan", &seconds));
  EXPECT_FALSE(ParseSeconds("inf", &seconds));
  EXPECT_FALSE(ParseSeconds("10s", &seconds));
  EXPECT_DOUBLE_EQ(seconds, 30);
}

class ConfigFlagsTest : public ::testing::Test {
 protected:
  void SetUp() override { saved_ = Saved(); }
  void TearDown() override {
    Flags::timeout_seconds = saved_.timeout;
    Flags::max_timeout_seconds = saved_.max_timeout;
    Flags::memory_limit_mb = saved_.memory;
    Flags::max_memory_limit_mb = saved_.max_memory;
    Flags::disable_restricted = saved_.no_restricted;
    Flags::disable_isolated = saved_.no_isolated;
    Flags::max_concurrency = saved_.concurrency;
  }

 private:
  struct State {
    std::string timeout;
    std::string max_timeout;
    int32_t memory;
    int32_t max_memory;
    bool no_restricted;
    bool no_isolated;
    int32_t concurrency;
  };
  static State Saved() {
    return {Flags::timeout_seconds,    Flags::max_timeout_seconds,
            Flags::memory_limit_mb,    Flags::max_memory_limit_mb,
            Flags::disable_restricted, Flags::disable_isolated,
            Flags::max_concurrency};
  }
  State saved_;
};

// NOLINTNEXTLINE
TEST_F(ConfigFlagsTest, Defaults) {
  SandboxConfig config = SandboxConfig::FromFlags();
  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 30);
  EXPECT_DOUBLE_EQ(config.max_timeout_seconds, 300);
  EXPECT_EQ(config.default_memory_limit_bytes, 512 * kMiB);
  EXPECT_EQ(config.max_memory_limit_bytes, 4096 * kMiB);
  EXPECT_TRUE(config.restricted_enabled);
  EXPECT_TRUE(config.isolated_enabled);
  EXPECT_EQ(config.container.memory_cap_bytes, 256 * kMiB);
  EXPECT_EQ(config.container.max_concurrency, 4);
  EXPECT_TRUE(config.policy.allowed_modules.count("math"));
}

// NOLINTNEXTLINE
TEST_F(ConfigFlagsTest, DefaultsAreClamped) {
  Flags::timeout_seconds = "600";
  Flags::memory_limit_mb = 8192;
  SandboxConfig config = SandboxConfig::FromFlags();
  EXPECT_DOUBLE_EQ(config.default_timeout_seconds, 300);
  EXPECT_EQ(config.default_memory_limit_bytes, 4096 * kMiB);
}

// NOLINTNEXTLINE
TEST_F(ConfigFlagsTest, InvalidValues) {
  Flags::timeout_seconds = "soon";
  EXPECT_THROW(SandboxConfig::FromFlags(), kj::Exception);  // NOLINT
  Flags::timeout_seconds = "30";
  Flags::memory_limit_mb = 0;
  EXPECT_THROW(SandboxConfig::FromFlags(), kj::Exception);  // NOLINT
  Flags::memory_limit_mb = 512;
  Flags::max_concurrency = 0;
  EXPECT_THROW(SandboxConfig::FromFlags(), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(ConfigFlagsTest, AtLeastOneBackend) {
  Flags::disable_isolated = true;
  EXPECT_FALSE(SandboxConfig::FromFlags().isolated_enabled);
  Flags::disable_restricted = true;
  EXPECT_THROW(SandboxConfig::FromFlags(), kj::Exception);  // NOLINT
}

}  // namespace
