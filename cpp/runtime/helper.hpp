#ifndef RUNTIME_HELPER_HPP
#define RUNTIME_HELPER_HPP

#include <string>

#include <kj/async-io.h>
#include <kj/refcount.h>

#include "sandbox/sandbox.hpp"

namespace runtime {

// A process started through the sandbox helper sub-command of this
// executable. The server never forks: the helper does, and reports back the
// outcome.
class HelperProcess : public kj::Refcounted {
 public:
  // Spawns the helper and sends it the options.
  static kj::Own<HelperProcess> Start(const sandbox::ExecutionOptions& options,
                                      kj::LowLevelAsyncIoProvider& io);

  // Resolves with the outcome once the sandboxed process has ended. Rejects
  // with the error of the sandbox if the process could not be started, or
  // if the helper was killed. Can be called only once.
  kj::Promise<sandbox::ExecutionInfo> Wait();

  // Kills the helper; the sandboxed process dies with it. Has no effect
  // after the helper has been reaped.
  void Kill();

  // Process id of the helper.
  int Pid() const { return pid_; }

  ~HelperProcess();
  KJ_DISALLOW_COPY(HelperProcess);

  // Runs the options to completion, blocking the calling thread. Used when
  // no event loop is available.
  static sandbox::ExecutionInfo RunBlocking(
      const sandbox::ExecutionOptions& options);

  // Checks, in a helper, whether the isolation namespaces can be created.
  // Resolves to an empty string on success, to the reason otherwise.
  static kj::Promise<std::string> ProbeIsolation(
      kj::LowLevelAsyncIoProvider& io);

  HelperProcess(int pid, kj::Own<kj::AsyncOutputStream> options_stream,
                kj::Own<kj::AsyncInputStream> outcome_stream)
      : pid_(pid),
        options_stream_(kj::mv(options_stream)),
        outcome_stream_(kj::mv(outcome_stream)) {}

 private:
  // Collects the exit status of the helper, once.
  int Reap();

  int pid_;
  bool reaped_ = false;
  int status_ = 0;
  kj::Own<kj::AsyncOutputStream> options_stream_;
  kj::Own<kj::AsyncInputStream> outcome_stream_;
  kj::Own<sandbox::ExecutionOptions> options_;
};

// Decodes the reply of the helper: the size of an error message, followed by
// either the message or the binary outcome.
sandbox::ExecutionInfo ParseHelperReply(kj::ArrayPtr<const kj::byte> data);

}  // namespace runtime

#endif
