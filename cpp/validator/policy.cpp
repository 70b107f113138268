#include "validator/policy.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <sstream>

#include "util/file.hpp"

namespace validator {
namespace {

template <typename Set>
std::string Join(const Set& items) {
  std::ostringstream out;
  bool first = true;
  for (const auto& item : items) {
    if (!first) out << ", ";
    out << item;
    first = false;
  }
  return out.str();
}

void ReadSet(capnp::List<capnp::Text>::Reader list, std::set<std::string>* s) {
  s->clear();
  for (auto item : list) s->insert(item.cStr());
}

void WriteSet(const std::set<std::string>& s,
              capnp::List<capnp::Text>::Builder list) {
  size_t i = 0;
  for (const std::string& item : s) list.set(i++, item.c_str());
}

}  // namespace

ValidationPolicy ValidationPolicy::Default() {
  ValidationPolicy policy;
  policy.allowed_modules = {
      "matplotlib", "matplotlib.pyplot", "matplotlib.patches",
      "matplotlib.animation", "matplotlib.figure", "matplotlib.axes",
      "mpl_toolkits", "numpy", "math", "cmath", "datetime", "time",
      "calendar", "re", "random", "statistics", "fractions", "decimal",
      "collections", "itertools", "functools", "copy", "json", "warnings",
      "string", "operator", "typing", "numbers", "bisect", "heapq"};

  policy.denied_modules = {
      "os", "sys", "subprocess", "socket", "urllib", "urllib2", "urllib3",
      "requests", "http", "httplib", "ftplib", "smtplib", "email", "imaplib",
      "poplib", "pickle", "marshal", "shelve", "dbm", "gdbm", "sqlite3",
      "mysql", "psycopg2", "pymongo", "ctypes", "cffi", "gc", "threading",
      "thread", "multiprocessing", "asyncio", "concurrent", "importlib", "imp",
      "pkgutil", "modulefinder", "code", "codeop", "ast", "compiler",
      "py_compile", "compileall", "dis", "pickletools", "tempfile", "shutil",
      "glob", "fnmatch", "linecache", "fileinput", "filecmp", "tarfile",
      "zipfile", "gzip", "bz2", "lzma", "pty", "tty", "grp", "pwd", "spwd",
      "platform", "getpass", "resource", "rlcompleter", "builtins", "io",
      "inspect", "signal", "runpy"};

  policy.denied_calls = {
      "__import__", "__builtins__", "breakpoint", "compile", "delattr", "dir",
      "eval", "exec", "exit", "file", "getattr", "globals", "hasattr", "help",
      "id", "input", "locals", "memoryview", "open", "quit", "raw_input",
      "reload", "setattr", "type", "vars"};

  policy.denied_attributes = {
      // Handles to modules that allowed modules import themselves, as in
      // matplotlib.os or mpl.subprocess.
      "os", "sys", "subprocess", "shutil", "builtins", "importlib", "ctypes",
      "pathlib", "io", "socket", "signal", "threading", "multiprocessing",
      "tempfile", "glob", "pickle", "marshal", "inspect", "platform",
      "posix", "modules",
      // Process and file system access.
      "system", "popen", "spawn", "spawnl", "spawnle", "spawnlp", "spawnlpe",
      "spawnv", "spawnve", "spawnvp", "spawnvpe", "posix_spawn",
      "posix_spawnp", "execl", "execle", "execlp", "execlpe", "execv",
      "execve", "execvp", "execvpe", "_exit", "abort", "fork", "forkpty",
      "kill", "killpg", "remove", "unlink", "rmdir", "rmtree", "mkdir",
      "makedirs", "chmod", "chown", "chdir", "chroot", "rename",
      "symlink", "link", "truncate", "listdir", "scandir", "walk", "fwalk",
      "copyfile", "copyfileobj", "copy2", "copytree", "copymode", "copystat",
      "move", "environ", "getenv", "putenv", "unsetenv", "check_output",
      "check_call", "Popen",
      // File I/O through otherwise allowed libraries.
      "load", "loadtxt", "genfromtxt", "fromfile", "tofile", "save", "savez",
      "savez_compressed", "savetxt", "memmap", "imread", "rc_file",
      // Network.
      "connect", "send", "sendall", "sendto", "recv", "recvfrom", "listen",
      "bind", "accept", "urlopen", "urlretrieve",
      // Frame and code introspection.
      "f_globals", "f_locals", "f_back", "f_builtins", "gi_frame", "gi_code",
      "cr_frame", "tb_frame", "tb_next", "co_code", "func_globals",
      "func_code",
      // Blocks the worker without consuming CPU.
      "sleep"};

  policy.denied_patterns = {
      {"dunder name", R"(__(?!(?:name|main|init)__)\w+__)"},
      {"system call", R"(\.system\s*\()"},
      {"popen call", R"(\.popen\s*\()"},
      {"spawn call", R"(\.spawn\w*\s*\()"},
      {"eval call", R"(\beval\s*\()"},
      {"exec call", R"(\bexec\s*\()"},
      {"os import", R"(\bimport\s+os\b)"},
      {"os from-import", R"(\bfrom\s+os\s+import\b)"},
      {"subprocess use", R"(\bsubprocess\.)"},
      {"file read", R"(\.read\s*\()"},
      {"file write", R"(\.write\s*\()"},
      {"delete call", R"(\.delete\s*\()"},
      {"remove call", R"(\.remove\s*\()"},
      {"rmdir call", R"(\.rmdir\s*\()"},
      {"mkdir call", R"(\.mkdir\s*\()"},
      {"chmod call", R"(\.chmod\s*\()"},
      {"chown call", R"(\.chown\s*\()"},
      {"open call", R"(\bopen\s*\()"},
      {"file call", R"(\bfile\s*\()"},
      {"http url", R"(https?://)"},
      {"ftp url", R"(ftp://)"},
      {"file url", R"(file://)"},
      {"connect call", R"(\.connect\s*\()"},
      {"send call", R"(\.send\s*\()"},
      {"recv call", R"(\.recv\s*\()"},
      {"listen call", R"(\.listen\s*\()"},
      {"bind call", R"(\.bind\s*\()"},
      {"request call", R"(\.request\s*\()"},
      {"socket use", R"(\bsocket\.)"},
      {"urllib use", R"(\burllib\d?\.)"},
      {"requests use", R"(\brequests\.)"}};
  return policy;
}

ValidationPolicy ValidationPolicy::FromCapnp(
    capnproto::ValidationPolicy::Reader reader) {
  ValidationPolicy policy = Default();
  if (reader.hasAllowedModules()) {
    ReadSet(reader.getAllowedModules(), &policy.allowed_modules);
  }
  if (reader.hasDeniedModules()) {
    ReadSet(reader.getDeniedModules(), &policy.denied_modules);
  }
  if (reader.hasDeniedCalls()) {
    ReadSet(reader.getDeniedCalls(), &policy.denied_calls);
  }
  if (reader.hasDeniedAttributes()) {
    ReadSet(reader.getDeniedAttributes(), &policy.denied_attributes);
  }
  if (reader.hasDeniedPatterns()) {
    policy.denied_patterns.clear();
    for (auto pattern : reader.getDeniedPatterns()) {
      KJ_REQUIRE(pattern.getRegex().size() > 0, "Empty denied pattern",
                 pattern.getName());
      policy.denied_patterns.push_back(
          {pattern.getName().cStr(), pattern.getRegex().cStr()});
    }
  }
  return policy;
}

void ValidationPolicy::ToCapnp(
    capnproto::ValidationPolicy::Builder builder) const {
  WriteSet(allowed_modules, builder.initAllowedModules(allowed_modules.size()));
  WriteSet(denied_modules, builder.initDeniedModules(denied_modules.size()));
  WriteSet(denied_calls, builder.initDeniedCalls(denied_calls.size()));
  WriteSet(denied_attributes,
           builder.initDeniedAttributes(denied_attributes.size()));
  auto patterns = builder.initDeniedPatterns(denied_patterns.size());
  for (size_t i = 0; i < denied_patterns.size(); i++) {
    patterns[i].setName(denied_patterns[i].name.c_str());
    patterns[i].setRegex(denied_patterns[i].regex.c_str());
  }
}

ValidationPolicy ValidationPolicy::FromJson(const std::string& json) {
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnproto::ValidationPolicy>();
  codec.decode(kj::ArrayPtr<const char>(json.data(), json.size()), root);
  return FromCapnp(root.asReader());
}

ValidationPolicy ValidationPolicy::FromFile(const std::string& path) {
  KJ_REQUIRE(util::File::Exists(path), "Policy file not found", path);
  return FromJson(util::File::ReadAll(path));
}

std::string ValidationPolicy::ToJson() const {
  capnp::JsonCodec codec;
  codec.setPrettyPrint(true);
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnproto::ValidationPolicy>();
  ToCapnp(root);
  return codec.encode(root.asReader()).cStr();
}

std::string ValidationPolicy::Summary() const {
  std::ostringstream out;
  out << "allowed modules (" << allowed_modules.size()
      << "): " << Join(allowed_modules) << "\n";
  out << "denied modules (" << denied_modules.size()
      << "): " << Join(denied_modules) << "\n";
  out << "denied calls (" << denied_calls.size()
      << "): " << Join(denied_calls) << "\n";
  out << "denied attributes (" << denied_attributes.size()
      << "): " << Join(denied_attributes) << "\n";
  out << "denied patterns (" << denied_patterns.size() << "):\n";
  for (const DeniedPattern& pattern : denied_patterns) {
    out << "  " << pattern.name << ": " << pattern.regex << "\n";
  }
  return out.str();
}

}  // namespace validator
