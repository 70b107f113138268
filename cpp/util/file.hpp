#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <sys/types.h>
#include <cstdint>

#include <kj/common.h>
#include <string>
#include <vector>

namespace util {

// File system helpers. Failures are reported as std::system_error.
class File {
 public:
  // Reads at most limit bytes of a file into a string.
  static std::string ReadAll(const std::string& path,
                             uint64_t limit = UINT64_MAX);

  // Atomically replaces the content of a file, creating its directory.
  static void WriteAll(const std::string& path, const std::string& content);

  // Creates path and all its missing parents.
  static void MakeDirs(const std::string& path);

  // Copies from into to. An existing destination is only replaced if
  // overwrite is set; otherwise the copy is silently skipped.
  static void Copy(const std::string& from, const std::string& to,
                   bool overwrite = false);

  // Removes a file, if present. Returns true if something was removed.
  static bool RemoveIfExists(const std::string& path);

  // Changes the permission bits of a file or directory.
  static void SetMode(const std::string& path, mode_t mode);

  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // "a/b/c" -> "a/b"
  static std::string BaseDir(const std::string& path);

  // "a/b/c" -> "c"
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// A fresh directory inside base, recursively removed on destruction unless
// Keep() was called. An empty base means $TMPDIR, or /tmp.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  ~TempDir();

  const std::string& Path() const { return path_; }
  void Keep() { keep_ = true; }

  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
