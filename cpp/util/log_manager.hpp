#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include "backward.hpp"

namespace util {

// Installs itself as the kj exception callback for its lifetime. Log lines
// and exceptions go to Flags::log_file when it is set, otherwise to stderr,
// which gets colors if it is a terminal.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext& context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void Write(kj::LogSeverity severity, const char* file, int line,
             const std::string& text);
  void PrintStackTrace();

  std::ofstream log_file_;
  std::ostream* out_;
  bool colors_;
  std::mutex mutex_;
  // Prints a stack trace on crashes instead of kj's handler.
  backward::SignalHandling signals_;
};

}  // namespace util

#endif
