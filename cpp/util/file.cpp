#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char kSeparator = '/';
const constexpr size_t kBufferSize = 64 * 1024;

[[noreturn]] void Fail(const std::string& what, const std::string& path) {
  throw std::system_error(errno, std::system_category(), what + " " + path);
}

kj::AutoCloseFd OpenForReading(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_RDONLY | O_CLOEXEC)};  // NOLINT
  if (fd.get() == -1) Fail("open", path);
  return fd;
}

// Reads up to size bytes, retrying on EINTR. Returns 0 at end of file.
size_t ReadSome(int fd, char* buf, size_t size, const std::string& path) {
  while (true) {
    ssize_t amount = read(fd, buf, size);
    if (amount >= 0) return amount;
    if (errno != EINTR) Fail("read", path);
  }
}

void WriteFully(int fd, const char* data, size_t size,
                const std::string& path) {
  size_t written = 0;
  while (written < size) {
    ssize_t amount = write(fd, data + written, size - written);  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) Fail("write", path);
    written += amount;
  }
}

// Content is written to a temporary sibling of the destination, which is
// renamed over it once complete. An unfinished file is removed.
class AtomicWriter {
 public:
  explicit AtomicWriter(const std::string& path) : path_(path) {
    util::File::MakeDirs(util::File::BaseDir(path));
    std::string tmp = path + ".XXXXXX";
    std::vector<char> name(tmp.begin(), tmp.end());
    name.push_back('\0');
    fd_ = kj::AutoCloseFd(mkostemp(name.data(), O_CLOEXEC));
    if (fd_.get() == -1) Fail("mkostemp", path);
    temp_ = name.data();
  }

  void Append(const char* data, size_t size) {
    WriteFully(fd_, data, size, temp_);
  }

  void Commit() {
    if (fsync(fd_) == -1) Fail("fsync", temp_);
    fd_ = kj::AutoCloseFd();
    if (rename(temp_.c_str(), path_.c_str()) == -1) Fail("rename", path_);
    committed_ = true;
  }

  ~AtomicWriter() {
    if (!committed_) unlink(temp_.c_str());
  }

  KJ_DISALLOW_COPY(AtomicWriter);

 private:
  std::string path_;
  std::string temp_;
  kj::AutoCloseFd fd_;
  bool committed_ = false;
};

bool RemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

}  // namespace

namespace util {

std::string File::ReadAll(const std::string& path, uint64_t limit) {
  kj::AutoCloseFd fd = OpenForReading(path);
  std::string content;
  std::array<char, kBufferSize> buf;
  while (content.size() < limit) {
    size_t wanted = std::min<uint64_t>(buf.size(), limit - content.size());
    size_t amount = ReadSome(fd, buf.data(), wanted, path);
    if (amount == 0) break;
    content.append(buf.data(), amount);
  }
  return content;
}

void File::WriteAll(const std::string& path, const std::string& content) {
  AtomicWriter writer(path);
  writer.Append(content.data(), content.size());
  writer.Commit();
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find(kSeparator, pos + 1);
    std::string dir = path.substr(0, pos);
    if (mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) == -1 &&
        errno != EEXIST) {
      Fail("mkdir", dir);
    }
  }
}

void File::Copy(const std::string& from, const std::string& to,
                bool overwrite) {
  if (!overwrite && Exists(to)) return;
  kj::AutoCloseFd fd = OpenForReading(from);
  AtomicWriter writer(to);
  std::array<char, kBufferSize> buf;
  size_t amount;
  while ((amount = ReadSome(fd, buf.data(), buf.size(), from)) != 0) {
    writer.Append(buf.data(), amount);
  }
  writer.Commit();
}

bool File::RemoveIfExists(const std::string& path) {
  if (remove(path.c_str()) != -1) return true;
  if (errno == ENOENT) return false;
  Fail("remove", path);
}

void File::SetMode(const std::string& path, mode_t mode) {
  if (chmod(path.c_str(), mode) == -1) Fail("chmod", path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && second[0] == kSeparator) return second;
  return first + kSeparator + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.rfind(kSeparator);
  if (pos == std::string::npos) return "";
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.rfind(kSeparator) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return -1;
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  std::string dir = base;
  if (dir.empty()) {
    const char* env = getenv("TMPDIR");
    dir = env != nullptr && *env != '\0' ? env : "/tmp";
  }
  File::MakeDirs(dir);
  std::string tmp = File::JoinPath(dir, "XXXXXX");
  std::vector<char> name(tmp.begin(), tmp.end());
  name.push_back('\0');
  if (mkdtemp(name.data()) == nullptr) Fail("mkdtemp", tmp);
  path_ = name.data();
}

TempDir::~TempDir() {
  if (keep_) return;
  if (!RemoveTree(path_)) {
    KJ_LOG(WARNING, "Unable to remove temporary directory", path_,
           strerror(errno));
  }
}

}  // namespace util
