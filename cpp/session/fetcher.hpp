#ifndef SESSION_FETCHER_HPP
#define SESSION_FETCHER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/compat/tls.h>
#include <kj/timer.h>

#include "session/request.hpp"

namespace session {

// Downloads the remote files of a request on the host, before the instance
// runs anything.
class Fetcher {
 public:
  struct Limits {
    int64_t timeout_millis = 30 * 1000;
    uint64_t max_bytes = 64 * 1024 * 1024;
    // Whether loopback and private addresses may be contacted.
    bool allow_private = false;
  };

  Fetcher(kj::Timer& timer, kj::Network& network, Limits limits);
  KJ_DISALLOW_COPY(Fetcher);

  // Downloads every file into dir, concurrently. Resolves with one notice for
  // each file that could not be downloaded; never rejects.
  kj::Promise<std::vector<std::string>> FetchAll(
      const std::vector<RemoteFile>& files, const std::string& dir);

  static Limits LimitsFromFlags();

 private:
  kj::Promise<void> Fetch(std::string url, std::string path, int redirects);

  kj::Timer& timer_;
  Limits limits_;
  kj::Own<kj::Network> network_;
  kj::TlsContext tls_;
  kj::Own<kj::Network> tls_network_;
  kj::HttpHeaderTable header_table_;
  kj::Own<kj::HttpClient> client_;
};

}  // namespace session

#endif
