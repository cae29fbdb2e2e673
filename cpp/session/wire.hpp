#ifndef SESSION_WIRE_HPP
#define SESSION_WIRE_HPP

#include <string>

#include <capnp/compat/json.h>
#include <kj/string.h>

#include "capnp/codebox.capnp.h"

namespace session {

// JSON encoding of the boundary types. Field names follow the $Json.name
// annotations of the schema; fields equal to their default are omitted.
class WireCodec {
 public:
  WireCodec();
  KJ_DISALLOW_COPY(WireCodec);

  // Decodes a JSON request. Returns false and sets error_msg if the text
  // does not have the shape of a request.
  bool DecodeRequest(kj::ArrayPtr<const char> json,
                     capnproto::ExecutionRequest::Builder request,
                     std::string* error_msg) const;

  kj::String Encode(capnproto::ExecutionRequest::Reader request) const;
  kj::String Encode(capnproto::ExecutionResult::Reader result) const;
  kj::String Encode(capnproto::HealthStatus::Reader status) const;

 private:
  capnp::JsonCodec codec_;
};

}  // namespace session

#endif
