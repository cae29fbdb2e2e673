#ifndef SESSION_LAUNCHER_HPP
#define SESSION_LAUNCHER_HPP

#include <cstdint>
#include <string>

#include <kj/async.h>
#include <kj/timer.h>

#include "capnp/codebox.capnp.h"
#include "runtime/runtime.hpp"
#include "session/request.hpp"
#include "session/settings.hpp"
#include "session/workspace.hpp"

namespace session {

struct RunReport {
  capnproto::ErrorKind kind = capnproto::ErrorKind::NONE;
  runtime::StageOutcome outcome;
  // Sizes of the stream files when the instance was killed for exceeding the
  // timeout, or -1 if the program ended by itself.
  int64_t stdout_bound = -1;
  int64_t stderr_bound = -1;
};

// Runs the code of the request in the instance and classifies the outcome.
// The runtime enforces the timeout; if it does not report back within the
// grace period, the host kills the instance itself. The instance is also
// terminated whenever the timeout is exceeded, so that nothing written after
// that moment is captured.
kj::Promise<RunReport> Launch(kj::Timer& timer, runtime::Instance& instance,
                              const Request& request,
                              const Workspace& workspace,
                              const Settings& settings);

// Maps how the program ended to the kind reported to the caller.
// stderr_tail is the end of its standard error.
capnproto::ErrorKind Classify(const runtime::StageOutcome& outcome,
                              const runtime::Language& language,
                              const std::string& stderr_tail);

// Whether a line of text starts or ends with the out of memory report of
// the interpreter.
bool ReportsOutOfMemory(const std::string& text, const std::string& marker);

}  // namespace session

#endif
