#ifndef SESSION_INSTALLER_HPP
#define SESSION_INSTALLER_HPP

#include <cstdint>
#include <string>

#include <kj/async.h>

#include "runtime/runtime.hpp"
#include "session/request.hpp"
#include "session/workspace.hpp"

namespace session {

struct InstallReport {
  bool failed = false;
  // Added to the standard error of the result when the install failed.
  std::string notice;
};

// Installs the requirements of a request into the workspace, using the
// package manager of its language. A failed install does not stop the
// session: the promise resolves with the failure, and only rejects when the
// instance itself breaks.
kj::Promise<InstallReport> Install(runtime::Instance& instance,
                                   const Request& request,
                                   const Workspace& workspace,
                                   int64_t timeout_millis);

// Describes a failed install, followed by the end of its output.
std::string InstallNotice(const std::string& package_manager,
                          const runtime::StageOutcome& outcome,
                          int64_t timeout_millis, const std::string& output);

}  // namespace session

#endif
