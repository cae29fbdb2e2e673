#include "util/log_manager.hpp"

#include <unistd.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>

#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {
namespace {

std::ostream& ChooseOut() {
  if (!Flags::log_file.empty()) {
    static std::ofstream of(Flags::log_file, std::ios::app);
    return of;
  }
  return std::cerr;
}

// Indexed by kj::LogSeverity.
const constexpr char* kSeverityNames[] = {"I", "W", "E", "F", "D"};
const constexpr char* kSeverityColors[] = {"\e[0;32m", "\e[0;33m", "\e[0;31m",
                                           "\e[7;31m", "\e[0;35m"};
const constexpr char* kResetColor = "\e[m";
const constexpr char* kFileColor = "\e[0;34m";
const constexpr char* kDateColor = "\e[0;36m";

static_assert(static_cast<int>(kj::LogSeverity::INFO) == 0 &&
                  static_cast<int>(kj::LogSeverity::DBG) == 4,
              "Unexpected kj::LogSeverity values");

}  // namespace

LogManager::LogManager(kj::ProcessContext& context)
    : out(ChooseOut()),
      colored_(Flags::log_file.empty() && isatty(STDERR_FILENO)) {
  if (!out) {
    context.exitError("Invalid log file provided!");
  }
  kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
}

const char* LogManager::Color(const char* color) const {
  return colored_ ? color : "";
}

void LogManager::PrintStackTrace() {
  if (!Flags::verbose) return;
  backward::StackTrace s;
  s.load_here();
  backward::Printer p;
  p.color_mode =
      colored_ ? backward::ColorMode::always : backward::ColorMode::never;
  p.print(s, out);
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int contextDepth, kj::String&& text) {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  int level = static_cast<int>(severity);
  std::string location =
      util::File::BaseName(file) + ":" + std::to_string(line);
  out << Color(kDateColor) << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << millis << std::setfill(' ')
      << Color(kResetColor) << ' ' << Color(kSeverityColors[level])
      << kSeverityNames[level] << Color(kResetColor) << ' '
      << Color(kFileColor) << std::left << std::setw(28) << location
      << Color(kResetColor) << ' ' << text.cStr() << std::endl;
}

}  // namespace util
