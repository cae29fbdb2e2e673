#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>
#include "backward.hpp"

namespace util {

// Formats kj log lines as "date severity file:line message", in colors on a
// terminal. Exceptions that reach the callback are logged too, with a stack
// trace in verbose mode.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext& context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();
  const char* Color(const char* color) const;

  std::ostream& out;
  // ANSI colors, only when logging to a terminal.
  bool colored_;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
