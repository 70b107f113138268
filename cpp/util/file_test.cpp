#include "util/file.hpp"
#include <dirent.h>
#include <ftw.h>
#include <sys/stat.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

const std::string test_tmpdir = "/tmp/codebox_testdir";

int rmrf(const char* path) {
  return nftw(path,
              [](const char* fpath, const struct stat* /*unused*/,
                 int /*unused*/,
                 struct FTW* /*unused*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS);
}

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  return std::string((std::istreambuf_iterator<char>(t)),
                     std::istreambuf_iterator<char>());
}

bool dirExists(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

std::string makeTestDir(const std::string& name) {
  mkdir(test_tmpdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::string testdir = test_tmpdir + "/" + name;
  rmrf(testdir.c_str());
  mkdir(testdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  return testdir;
}

// NOLINTNEXTLINE
TEST(File, ReadAll) {
  std::string testdir = makeTestDir("read");
  std::string big(3 * 64 * 1024 + 17, 'x');
  writeFile(testdir + "/big", big);
  EXPECT_EQ(util::File::ReadAll(testdir + "/big"), big);
  writeFile(testdir + "/digits", "0123456789");
  EXPECT_EQ(util::File::ReadAll(testdir + "/digits", 4), "0123");
  EXPECT_EQ(util::File::ReadAll(testdir + "/digits", 0), "");
}

// NOLINTNEXTLINE
TEST(File, ReadNoSuchFile) {
  std::string testdir = makeTestDir("read");
  EXPECT_THROW(util::File::ReadAll(testdir + "/missing"),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST(File, WriteAllReplacesAndCreatesDirs) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/artifacts/chart/out.json";
  util::File::WriteAll(filepath, "{\"a\": 1}");
  util::File::WriteAll(filepath, "{}");
  EXPECT_EQ(readFile(filepath), "{}");
  EXPECT_EQ(util::File::Size(filepath), 2);
}

// NOLINTNEXTLINE
TEST(File, MakeDirs) {
  std::string testdir = makeTestDir("make_dirs");
  util::File::MakeDirs(testdir + "/code/nested");
  util::File::MakeDirs(testdir + "/code/nested");
  EXPECT_TRUE(dirExists(testdir + "/code/nested"));
  writeFile(testdir + "/file", "");
  EXPECT_THROW(util::File::MakeDirs(testdir + "/file/sub"),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST(File, Copy) {
  std::string testdir = makeTestDir("copy");
  writeFile(testdir + "/produced.png", "png");
  writeFile(testdir + "/existing.png", "old");

  util::File::Copy(testdir + "/produced.png", testdir + "/new/chart.png");
  EXPECT_EQ(readFile(testdir + "/new/chart.png"), "png");

  util::File::Copy(testdir + "/produced.png", testdir + "/existing.png");
  EXPECT_EQ(readFile(testdir + "/existing.png"), "old");

  util::File::Copy(testdir + "/produced.png", testdir + "/existing.png",
                   /*overwrite=*/true);
  EXPECT_EQ(readFile(testdir + "/existing.png"), "png");

  EXPECT_THROW(util::File::Copy(testdir + "/missing",  // NOLINT
                                testdir + "/other"),
               std::system_error);
  EXPECT_FALSE(util::File::Exists(testdir + "/other"));
}

// NOLINTNEXTLINE
TEST(File, RemoveIfExists) {
  std::string testdir = makeTestDir("remove");
  writeFile(testdir + "/stale.png", "png");
  EXPECT_TRUE(util::File::RemoveIfExists(testdir + "/stale.png"));
  EXPECT_FALSE(util::File::Exists(testdir + "/stale.png"));
  EXPECT_FALSE(util::File::RemoveIfExists(testdir + "/stale.png"));
}

// NOLINTNEXTLINE
TEST(File, SetMode) {
  std::string testdir = makeTestDir("mode");
  util::File::SetMode(testdir, 0711);
  struct stat st {};
  ASSERT_EQ(stat(testdir.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0711u);
}

// NOLINTNEXTLINE
TEST(File, Paths) {
  EXPECT_EQ(util::File::JoinPath("/sandbox", "code"), "/sandbox/code");
  EXPECT_EQ(util::File::JoinPath("/sandbox", "/abs"), "/abs");
  EXPECT_EQ(util::File::BaseDir("/tmp/out/chart.png"), "/tmp/out");
  EXPECT_EQ(util::File::BaseDir("chart.png"), "");
  EXPECT_EQ(util::File::BaseName("/tmp/out/chart.png"), "chart.png");
  EXPECT_EQ(util::File::BaseName("chart.png"), "chart.png");
  EXPECT_EQ(util::File::Size("/nonexistent/file"), -1);
}

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir + "/tempdir");
    path = tmp.Path();
    EXPECT_TRUE(dirExists(path));
    writeFile(path + "/file", "content");
    util::File::MakeDirs(path + "/nested/dir");
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir + "/tempdir");
    path = tmp.Path();
    tmp.Keep();
  }
  EXPECT_TRUE(dirExists(path));
  rmrf(path.c_str());
}

// NOLINTNEXTLINE
TEST(TempDir, EmptyBaseUsesTmpdir) {
  std::string base = makeTestDir("tmpdir_env");
  const char* previous = getenv("TMPDIR");
  std::string saved = previous != nullptr ? previous : "";
  setenv("TMPDIR", base.c_str(), 1);
  {
    util::TempDir tmp("");
    EXPECT_EQ(util::File::BaseDir(tmp.Path()), base);
    EXPECT_TRUE(dirExists(tmp.Path()));
  }
  unsetenv("TMPDIR");
  {
    util::TempDir tmp("");
    EXPECT_EQ(util::File::BaseDir(tmp.Path()), "/tmp");
  }
  if (previous != nullptr) setenv("TMPDIR", saved.c_str(), 1);
}

}  // namespace
