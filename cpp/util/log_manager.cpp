#include "util/log_manager.hpp"
#include <unistd.h>
#include <ctime>
#include <iomanip>
#include <iostream>
#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {
namespace {

const constexpr char* kReset = "\e[m";
const constexpr char* kDim = "\e[0;36m";

struct Level {
  kj::LogSeverity severity;
  char tag;
  const char* color;
};

const constexpr Level kLevels[] = {
    {kj::LogSeverity::INFO, 'I', "\e[0;32m"},
    {kj::LogSeverity::WARNING, 'W', "\e[0;33m"},
    {kj::LogSeverity::ERROR, 'E', "\e[0;31m"},
    {kj::LogSeverity::FATAL, 'F', "\e[7;31m"},
    {kj::LogSeverity::DBG, 'D', "\e[0;35m"},
};

const Level& LevelOf(kj::LogSeverity severity) {
  for (const Level& level : kLevels) {
    if (level.severity == severity) return level;
  }
  return kLevels[0];
}

std::string Timestamp() {
  std::time_t now = std::time(nullptr);
  struct tm tm {};
  localtime_r(&now, &tm);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);  // NOLINT
  return buf;
}

}  // namespace

LogManager::LogManager(kj::ProcessContext& context)
    : out_(&std::cerr),
      colors_(Flags::log_file.empty() && isatty(STDERR_FILENO)) {
  if (!Flags::log_file.empty()) {
    log_file_.open(Flags::log_file, std::ios::app);
    if (!log_file_) {
      kj::String error =
          kj::str("Cannot open log file ", Flags::log_file.c_str());
      context.exitError(error);
    }
    out_ = &log_file_;
  }
}

void LogManager::Write(kj::LogSeverity severity, const char* file, int line,
                       const std::string& text) {
  const Level& level = LevelOf(severity);
  std::string where = File::BaseName(file) + ":" + std::to_string(line);
  std::lock_guard<std::mutex> lck(mutex_);
  std::ostream& out = *out_;
  if (colors_) {
    out << kDim << Timestamp() << kReset << " " << level.color << level.tag
        << kReset << " ";
  } else {
    out << Timestamp() << " " << level.tag << " ";
  }
  out << std::left << std::setw(24) << where << " " << text << std::endl;
}

void LogManager::PrintStackTrace() {
  if (!::kj::_::Debug::shouldLog(kj::LogSeverity::INFO)) return;
  backward::StackTrace trace;
  trace.load_here();
  backward::Printer printer;
  printer.color_mode =
      colors_ ? backward::ColorMode::always : backward::ColorMode::never;
  std::lock_guard<std::mutex> lck(mutex_);
  printer.print(trace, *out_);
}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int contextDepth, kj::String&& text) {
  Write(severity, file, line, text.cStr());
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  Write(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
        exception.getDescription().cStr());
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  Write(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
        exception.getDescription().cStr());
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

}  // namespace util
