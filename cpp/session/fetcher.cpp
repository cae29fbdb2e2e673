#include "session/fetcher.hpp"

#include <kj/compat/url.h>
#include <kj/debug.h>

#include "util/file.hpp"
#include "util/flags.hpp"

namespace session {
namespace {

static const constexpr int kMaxRedirects = 5;
static const constexpr size_t kBufferSize = 64 * 1024;

[[noreturn]] void Fail(const std::string& reason) {
  kj::throwFatalException(kj::Exception(kj::Exception::Type::FAILED, __FILE__,
                                        __LINE__,
                                        kj::heapString(reason.c_str())));
}

bool IsRedirect(unsigned status) {
  return status == 301 || status == 302 || status == 303 || status == 307 ||
         status == 308;
}

// State of a body being copied into a file.
struct Download {
  kj::Own<kj::AsyncInputStream> body;
  util::File::ChunkReceiver receiver;
  kj::Array<kj::byte> buffer = kj::heapArray<kj::byte>(kBufferSize);
  uint64_t received = 0;
  uint64_t limit = 0;
};

kj::Promise<void> Pump(Download& download) {
  return download.body
      ->tryRead(download.buffer.begin(), 1, download.buffer.size())
      .then([&download](size_t amount) -> kj::Promise<void> {
        if (amount == 0) {
          download.receiver(util::File::Chunk());
          return kj::READY_NOW;
        }
        download.received += amount;
        if (download.received > download.limit) {
          Fail("larger than " + std::to_string(download.limit) + " bytes");
        }
        download.receiver(util::File::Chunk(download.buffer.begin(), amount));
        return Pump(download);
      });
}

}  // namespace

Fetcher::Fetcher(kj::Timer& timer, kj::Network& network, Limits limits)
    : timer_(timer),
      limits_(limits),
      network_(limits.allow_private
                   ? network.restrictPeers({"local", "network"})
                   : network.restrictPeers({"public"})),
      tls_network_(tls_.wrapNetwork(*network_)),
      client_(kj::newHttpClient(timer, header_table_, *network_,
                                *tls_network_)) {}

Fetcher::Limits Fetcher::LimitsFromFlags() {
  Limits limits;
  limits.timeout_millis = Flags::fetch_timeout_millis;
  limits.max_bytes = Flags::max_fetch_bytes;
  limits.allow_private = Flags::fetch_private;
  return limits;
}

kj::Promise<void> Fetcher::Fetch(std::string url, std::string path,
                                 int redirects) {
  kj::HttpHeaders headers(header_table_);
  auto request = client_->request(kj::HttpMethod::GET, url.c_str(), headers);
  request.body = nullptr;
  return request.response.then([this, url, path, redirects](
                                   kj::HttpClient::Response&& response)
                                   -> kj::Promise<void> {
    if (IsRedirect(response.statusCode)) {
      KJ_IF_MAYBE(location,
                  response.headers->get(kj::HttpHeaderId::LOCATION)) {
        if (redirects >= kMaxRedirects) Fail("too many redirects");
        kj::Url base = kj::Url::parse(url.c_str());
        std::string next = base.parseRelative(*location).toString().cStr();
        if (next.compare(0, 7, "http://") != 0 &&
            next.compare(0, 8, "https://") != 0) {
          Fail("redirected to an unsupported url");
        }
        return Fetch(std::move(next), path, redirects + 1);
      }
    }
    if (response.statusCode < 200 || response.statusCode >= 300) {
      Fail("HTTP " + std::to_string(response.statusCode) + " " +
           response.statusText.cStr());
    }
    KJ_IF_MAYBE(length, response.body->tryGetLength()) {
      if (*length > limits_.max_bytes) {
        Fail("larger than " + std::to_string(limits_.max_bytes) + " bytes");
      }
    }
    auto download = kj::heap<Download>();
    download->body = kj::mv(response.body);
    download->receiver = util::File::Write(path, /*overwrite=*/true);
    download->limit = limits_.max_bytes;
    auto done = Pump(*download);
    return done.attach(kj::mv(download));
  });
}

kj::Promise<std::vector<std::string>> Fetcher::FetchAll(
    const std::vector<RemoteFile>& files, const std::string& dir) {
  auto downloads = kj::heapArrayBuilder<kj::Promise<kj::Maybe<std::string>>>(
      files.size());
  for (const RemoteFile& file : files) {
    std::string url = file.url;
    downloads.add(
        timer_
            .timeoutAfter(limits_.timeout_millis * kj::MILLISECONDS,
                          kj::evalNow([&]() {
                            return Fetch(
                                url, util::File::JoinPath(dir, file.name), 0);
                          }))
            .then([]() -> kj::Maybe<std::string> { return nullptr; },
                  [url](kj::Exception&& exc) -> kj::Maybe<std::string> {
                    KJ_LOG(WARNING, "Fetch failed", url.c_str(),
                           exc.getDescription());
                    return "[fetch] " + url + ": " +
                           exc.getDescription().cStr();
                  }));
  }
  return kj::joinPromises(downloads.finish())
      .then([](kj::Array<kj::Maybe<std::string>> results) {
        std::vector<std::string> notices;
        for (auto& result : results) {
          KJ_IF_MAYBE(notice, result) { notices.push_back(kj::mv(*notice)); }
        }
        return notices;
      });
}

}  // namespace session
