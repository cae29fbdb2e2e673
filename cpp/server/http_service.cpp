#include "server/http_service.hpp"

#include <stdexcept>
#include <string>

#include <capnp/message.h>
#include <kj/debug.h>

namespace server {

constexpr uint64_t HttpService::kMaxBodyBytes;

kj::Promise<void> HttpService::request(kj::HttpMethod method,
                                       kj::StringPtr url,
                                       const kj::HttpHeaders& headers,
                                       kj::AsyncInputStream& body,
                                       Response& response) {
  std::string path(url.cStr());
  path = path.substr(0, path.find_first_of("?#"));
  if (path == "/run") {
    if (method != kj::HttpMethod::POST) {
      return response.sendError(405, "Method Not Allowed", table_);
    }
    return Run(headers, body, response);
  }
  if (path == "/health") {
    if (method != kj::HttpMethod::GET) {
      return response.sendError(405, "Method Not Allowed", table_);
    }
    return Health(response);
  }
  return response.sendError(404, "Not Found", table_);
}

kj::Promise<void> HttpService::Run(const kj::HttpHeaders& headers,
                                   kj::AsyncInputStream& body,
                                   Response& response) {
  KJ_IF_MAYBE(length, headers.get(kj::HttpHeaderId::CONTENT_LENGTH)) {
    uint64_t size = 0;
    try {
      size = std::stoull(std::string(length->cStr()));
    } catch (const std::exception&) {
      return response.sendError(400, "Bad Request", table_);
    }
    if (size > kMaxBodyBytes) {
      return response.sendError(413, "Payload Too Large", table_);
    }
  }
  return body.readAllText(kMaxBodyBytes)
      .then(
          [this, &response](kj::String text) {
            return dispatcher_.ExecuteJson(text.asArray())
                .attach(kj::mv(text))
                .then([this, &response](kj::String json) {
                  return SendJson(response, 200, "OK", kj::mv(json));
                });
          },
          [this, &response](kj::Exception&& exc) {
            KJ_LOG(WARNING, "Cannot read the request body", exc);
            return response.sendError(413, "Payload Too Large", table_);
          });
}

kj::Promise<void> HttpService::Health(Response& response) {
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  auto status = message->initRoot<capnproto::HealthStatus>();
  auto checked = dispatcher_.Health(status);
  return checked
      .then([this, &response, status]() {
        bool reachable = status.asReader().getReachable();
        return SendJson(response, reachable ? 200 : 503,
                        reachable ? "OK" : "Service Unavailable",
                        dispatcher_.Codec().Encode(status.asReader()));
      })
      .attach(kj::mv(message));
}

kj::Promise<void> HttpService::SendJson(Response& response, unsigned status,
                                        kj::StringPtr status_text,
                                        kj::String json) {
  kj::HttpHeaders headers(table_);
  headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
  auto stream = response.send(status, status_text, headers, json.size());
  auto written = stream->write(json.begin(), json.size());
  return written.attach(kj::mv(stream), kj::mv(json));
}

}  // namespace server
