#ifndef SERVER_HTTP_SERVICE_HPP
#define SERVER_HTTP_SERVICE_HPP

#include <cstdint>

#include <kj/compat/http.h>

#include "session/dispatcher.hpp"

namespace server {

// HTTP/JSON surface of the boundary operations:
//   POST /run     request JSON -> 200 and result JSON
//   GET  /health  200 if the runtime is reachable, 503 otherwise
class HttpService : public kj::HttpService {
 public:
  static constexpr uint64_t kMaxBodyBytes = 4 * 1024 * 1024;

  HttpService(session::Dispatcher& dispatcher, kj::HttpHeaderTable& table)
      : dispatcher_(dispatcher), table_(table) {}
  KJ_DISALLOW_COPY(HttpService);

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers,
                            kj::AsyncInputStream& body,
                            Response& response) override;

 private:
  kj::Promise<void> Run(const kj::HttpHeaders& headers,
                        kj::AsyncInputStream& body, Response& response);
  kj::Promise<void> Health(Response& response);
  kj::Promise<void> SendJson(Response& response, unsigned status,
                             kj::StringPtr status_text, kj::String json);

  session::Dispatcher& dispatcher_;
  kj::HttpHeaderTable& table_;
};

}  // namespace server
#endif
