#ifndef SESSION_REQUEST_HPP
#define SESSION_REQUEST_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "capnp/codebox.capnp.h"
#include "runtime/language.hpp"

namespace session {

static const constexpr size_t kMaxCodeBytes = 1024 * 1024;
static const constexpr size_t kMaxRequirements = 64;
static const constexpr size_t kMaxRequirementBytes = 256;
static const constexpr size_t kMaxFileUrls = 16;
static const constexpr size_t kMaxFileNameBytes = 255;

// A file downloaded into the workspace before the code runs.
struct RemoteFile {
  std::string url;
  // Name of the file in the workspace.
  std::string name;
};

// A request that passed validation, with its language resolved.
struct Request {
  std::string code;
  std::vector<std::string> requirements;
  runtime::Language language;
  std::vector<RemoteFile> files;
};

// Checks a decoded request and fills out. Returns false, with a message
// suitable for the caller in error_msg, if the request is not acceptable.
bool Validate(capnproto::ExecutionRequest::Reader request, Request* out,
              std::string* error_msg);

// Returns the workspace file name for a remote file, or an empty string if
// the URL is not an http(s) URL ending with a usable file name.
std::string RemoteFileName(const std::string& url);

}  // namespace session

#endif
