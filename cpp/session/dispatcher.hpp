#ifndef SESSION_DISPATCHER_HPP
#define SESSION_DISPATCHER_HPP

#include <cstddef>
#include <string>

#include <kj/async.h>
#include <kj/timer.h>

#include "capnp/codebox.capnp.h"
#include "runtime/instance_pool.hpp"
#include "runtime/runtime.hpp"
#include "session/fetcher.hpp"
#include "session/settings.hpp"
#include "session/wire.hpp"

namespace session {

// Entry point of the boundary operations. Admits requests, runs each one in
// its own session, and always answers with a result.
class Dispatcher {
 public:
  Dispatcher(runtime::Runtime& runtime, runtime::InstancePool& pool,
             kj::Timer& timer, Fetcher& fetcher, Settings settings);
  KJ_DISALLOW_COPY(Dispatcher);

  // Runs a request and fills result, which must stay valid until the promise
  // resolves. Never rejects: every failure is reported in result.
  kj::Promise<void> Execute(capnproto::ExecutionRequest::Reader request,
                            capnproto::ExecutionResult::Builder result)
      KJ_WARN_UNUSED_RESULT;

  // Same as Execute, for a JSON request; resolves to the JSON result.
  kj::Promise<kj::String> ExecuteJson(kj::ArrayPtr<const char> json)
      KJ_WARN_UNUSED_RESULT;

  // Fills status with the readiness of the runtime. Never rejects.
  kj::Promise<void> Health(capnproto::HealthStatus::Builder status)
      KJ_WARN_UNUSED_RESULT;

  const WireCodec& Codec() const { return codec_; }
  const Settings& GetSettings() const { return settings_; }

  // Number of sessions admitted and not finished yet.
  size_t Active() const { return active_; }

  // A fresh random session id.
  static std::string NewSessionId();

 private:
  runtime::Runtime& runtime_;
  runtime::InstancePool& pool_;
  kj::Timer& timer_;
  Fetcher& fetcher_;
  Settings settings_;
  WireCodec codec_;
  size_t active_ = 0;
};

}  // namespace session

#endif
