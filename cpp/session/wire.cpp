#include "session/wire.hpp"

#include <kj/exception.h>

namespace session {

WireCodec::WireCodec() {
  codec_.handleByAnnotation<capnproto::ExecutionRequest>();
  codec_.handleByAnnotation<capnproto::ExecutionResult>();
  codec_.handleByAnnotation<capnproto::HealthStatus>();
  codec_.setHasMode(capnp::HasMode::NON_DEFAULT);
}

bool WireCodec::DecodeRequest(kj::ArrayPtr<const char> json,
                              capnproto::ExecutionRequest::Builder request,
                              std::string* error_msg) const {
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                       [&]() { codec_.decode(json, request); })) {
    *error_msg = "Malformed request: ";
    *error_msg += exc->getDescription().cStr();
    return false;
  }
  return true;
}

kj::String WireCodec::Encode(
    capnproto::ExecutionRequest::Reader request) const {
  return codec_.encode(request);
}

kj::String WireCodec::Encode(capnproto::ExecutionResult::Reader result) const {
  return codec_.encode(result);
}

kj::String WireCodec::Encode(capnproto::HealthStatus::Reader status) const {
  return codec_.encode(status);
}

}  // namespace session
