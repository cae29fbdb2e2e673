#include "session/dispatcher.hpp"

#include <sys/stat.h>

#include <cstring>
#include <random>
#include <system_error>

#include <capnp/message.h>
#include <kj/debug.h>

#include "session/lifecycle_guard.hpp"
#include "session/request.hpp"
#include "session/session.hpp"
#include "util/file.hpp"

namespace session {

Dispatcher::Dispatcher(runtime::Runtime& runtime, runtime::InstancePool& pool,
                       kj::Timer& timer, Fetcher& fetcher, Settings settings)
    : runtime_(runtime),
      pool_(pool),
      timer_(timer),
      fetcher_(fetcher),
      settings_(std::move(settings)) {
  util::File::MakeDirs(settings_.workspace_root);
  // Sessions must not be able to list each other.
  if (chmod(settings_.workspace_root.c_str(), 0711) == -1) {
    KJ_LOG(WARNING, "Cannot restrict the workspace root",
           settings_.workspace_root.c_str(), strerror(errno));
  }
}

std::string Dispatcher::NewSessionId() {
  static const char kHex[] = "0123456789abcdef";
  std::random_device device;
  std::string id;
  for (int i = 0; i < 4; i++) {
    uint32_t word = device();
    for (int j = 0; j < 4; j++) {
      id += kHex[(word >> (8 * j + 4)) & 0xF];
      id += kHex[(word >> (8 * j)) & 0xF];
    }
  }
  return id;
}

kj::Promise<void> Dispatcher::Execute(
    capnproto::ExecutionRequest::Reader request,
    capnproto::ExecutionResult::Builder result) {
  std::string id = NewSessionId();
  Request validated;
  std::string error_msg;
  if (!Validate(request, &validated, &error_msg)) {
    KJ_LOG(INFO, "Request rejected", id.c_str(), error_msg.c_str());
    result.setSessionId(id.c_str());
    result.setStderr((error_msg + "\n").c_str());
    result.setErrorKind(capnproto::ErrorKind::VALIDATION_ERROR);
    return kj::READY_NOW;
  }
  Services services{runtime_, pool_, timer_, fetcher_, codec_, settings_};
  auto session = kj::heap<Session>(id, std::move(validated), services);
  active_++;
  auto done = kj::evalNow([&]() { return session->Run(result); });
  return done
      .then([]() {},
            [result, id](kj::Exception&& exc) mutable {
              KJ_LOG(ERROR, "Session escaped its guard", id.c_str(), exc);
              std::string notice;
              result.setSessionId(id.c_str());
              result.setErrorKind(LifecycleGuard::Translate(exc, &notice));
              result.setStderr(notice.c_str());
            })
      .attach(kj::mv(session), kj::defer([this]() { active_--; }));
}

kj::Promise<kj::String> Dispatcher::ExecuteJson(kj::ArrayPtr<const char> json) {
  auto request = kj::heap<capnp::MallocMessageBuilder>();
  auto result = kj::heap<capnp::MallocMessageBuilder>();
  auto request_root = request->initRoot<capnproto::ExecutionRequest>();
  auto result_root = result->initRoot<capnproto::ExecutionResult>();
  std::string error_msg;
  if (!codec_.DecodeRequest(json, request_root, &error_msg)) {
    KJ_LOG(INFO, "Request rejected", error_msg.c_str());
    result_root.setStderr((error_msg + "\n").c_str());
    result_root.setErrorKind(capnproto::ErrorKind::VALIDATION_ERROR);
    return codec_.Encode(result_root.asReader());
  }
  auto done = Execute(request_root.asReader(), result_root);
  return done
      .then([this, result_root]() mutable {
        return codec_.Encode(result_root.asReader());
      })
      .attach(kj::mv(request), kj::mv(result));
}

kj::Promise<void> Dispatcher::Health(capnproto::HealthStatus::Builder status) {
  status.setRuntime(runtime_.Name().c_str());
  return kj::evalNow([this]() { return runtime_.Health(); })
      .then(
          [status](runtime::HealthReport report) mutable {
            status.setReachable(report.reachable);
            status.setMessage(report.message.c_str());
          },
          [status](kj::Exception&& exc) mutable {
            KJ_LOG(WARNING, "Health check failed", exc);
            status.setReachable(false);
            status.setMessage(exc.getDescription());
          });
}

}  // namespace session
