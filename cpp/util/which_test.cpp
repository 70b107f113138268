#include "util/which.hpp"
#include <cstdlib>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

#include <kj/exception.h>

namespace {

const std::string test_tmpdir = "/tmp/codebox_testdir";

std::string MakeProgram(const util::TempDir& dir, const std::string& name,
                        mode_t mode = 0755) {
  std::string path = util::File::JoinPath(dir.Path(), name);
  util::File::WriteAll(path, "#!/bin/sh\n");
  util::File::SetMode(path, mode);
  return path;
}

// Restores PATH when a test is over.
class WhichTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = std::getenv("PATH");
    had_path_ = path != nullptr;
    if (had_path_) saved_path_ = path;
  }
  void TearDown() override {
    if (had_path_) {
      setenv("PATH", saved_path_.c_str(), 1);
    } else {
      unsetenv("PATH");
    }
  }

  bool had_path_ = false;
  std::string saved_path_;
};

// NOLINTNEXTLINE
TEST_F(WhichTest, SearchesPathInOrder) {
  util::TempDir first(test_tmpdir + "/which");
  util::TempDir second(test_tmpdir + "/which");
  std::string docker = MakeProgram(first, "docker");
  MakeProgram(second, "docker");
  std::string podman = MakeProgram(second, "podman");
  std::string path = first.Path() + "::" + second.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("docker", false), docker);
  EXPECT_EQ(util::which("podman", false), podman);
  EXPECT_EQ(util::which("nerdctl", false), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, SkipsFilesThatAreNotExecutable) {
  util::TempDir first(test_tmpdir + "/which");
  util::TempDir second(test_tmpdir + "/which");
  MakeProgram(first, "runtime", 0644);
  std::string runtime = MakeProgram(second, "runtime");
  std::string path = first.Path() + ":" + second.Path();
  setenv("PATH", path.c_str(), 1);
  EXPECT_EQ(util::which("runtime", false), runtime);
}

// NOLINTNEXTLINE
TEST_F(WhichTest, PathWithSlash) {
  util::TempDir dir(test_tmpdir + "/which");
  std::string docker = MakeProgram(dir, "docker");
  std::string data = MakeProgram(dir, "data", 0644);
  EXPECT_EQ(util::which(docker), docker);
  EXPECT_EQ(util::which(data), "");
  EXPECT_EQ(util::which(dir.Path() + "/podman"), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, UnsetPath) {
  unsetenv("PATH");
  EXPECT_THROW(util::which("never_resolved_cmd"), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(WhichTest, Cache) {
  util::TempDir first(test_tmpdir + "/which");
  util::TempDir second(test_tmpdir + "/which");
  std::string cached = MakeProgram(first, "cached");
  std::string fresh = MakeProgram(second, "cached");
  setenv("PATH", first.Path().c_str(), 1);
  EXPECT_EQ(util::which("cached"), cached);

  setenv("PATH", second.Path().c_str(), 1);
  EXPECT_EQ(util::which("cached"), cached);
  EXPECT_EQ(util::which("cached", false), fresh);
}

// NOLINTNEXTLINE
TEST_F(WhichTest, StaleCacheEntryIsDropped) {
  {
    util::TempDir dir(test_tmpdir + "/which");
    std::string stale = MakeProgram(dir, "stale");
    setenv("PATH", dir.Path().c_str(), 1);
    EXPECT_EQ(util::which("stale"), stale);
  }
  EXPECT_EQ(util::which("stale"), "");
}

}  // namespace
