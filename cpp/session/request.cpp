#include "session/request.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace session {
namespace {

bool HasPrefixIgnoreCase(const std::string& s, const std::string& prefix) {
  if (s.size() < prefix.size()) return false;
  return std::equal(prefix.begin(), prefix.end(), s.begin(),
                    [](char a, char b) {
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

bool IsBlankOrControl(char c) {
  auto u = static_cast<unsigned char>(c);
  return u <= ' ' || u == 0x7f;
}

// Quotes a user-provided value for an error message.
std::string Quote(kj::StringPtr value) {
  std::string quoted;
  for (char c : value) {
    if (quoted.size() >= 64) {
      quoted += "...";
      break;
    }
    quoted += IsBlankOrControl(c) && c != ' ' ? '?' : c;
  }
  return "'" + quoted + "'";
}

bool ValidRequirement(kj::StringPtr requirement, std::string* error_msg) {
  if (requirement.size() == 0) {
    *error_msg = "Empty requirement";
    return false;
  }
  if (requirement.size() > kMaxRequirementBytes) {
    *error_msg = "Requirement " + Quote(requirement) + " is longer than " +
                 std::to_string(kMaxRequirementBytes) + " bytes";
    return false;
  }
  if (requirement[0] == '-') {
    *error_msg = "Requirement " + Quote(requirement) + " starts with '-'";
    return false;
  }
  if (std::any_of(requirement.begin(), requirement.end(), IsBlankOrControl)) {
    *error_msg = "Requirement " + Quote(requirement) +
                 " contains whitespace or control characters";
    return false;
  }
  return true;
}

}  // namespace

std::string RemoteFileName(const std::string& url) {
  std::string rest;
  for (const char* scheme : {"http://", "https://"}) {
    if (HasPrefixIgnoreCase(url, scheme)) {
      rest = url.substr(strlen(scheme));
      break;
    }
  }
  if (rest.empty()) return "";
  if (std::any_of(url.begin(), url.end(), IsBlankOrControl)) return "";
  if (url.find('\\') != std::string::npos) return "";
  std::string path = rest.substr(0, rest.find_first_of("?#"));
  size_t host_end = path.find('/');
  if (host_end == 0 || host_end == std::string::npos) return "";
  std::string name = path.substr(path.find_last_of('/') + 1);
  // Names starting with a dot could replace the private files of the
  // workspace.
  if (name.empty() || name[0] == '.' || name.size() > kMaxFileNameBytes) {
    return "";
  }
  return name;
}

bool Validate(capnproto::ExecutionRequest::Reader request, Request* out,
              std::string* error_msg) {
  if (!request.hasCode()) {
    *error_msg = "Missing code";
    return false;
  }
  if (request.getCode().size() > kMaxCodeBytes) {
    *error_msg = "Code is larger than " + std::to_string(kMaxCodeBytes) +
                 " bytes";
    return false;
  }
  KJ_IF_MAYBE(language, runtime::Language::FromName(request.getLanguage())) {
    out->language = *language;
  } else {
    *error_msg = "Unsupported language " + Quote(request.getLanguage()) +
                 ", expected 'python' or 'node'";
    return false;
  }
  auto code = request.getCode();
  out->code.assign(code.begin(), code.size());

  auto requirements = request.getRequirements();
  if (requirements.size() > kMaxRequirements) {
    *error_msg = "More than " + std::to_string(kMaxRequirements) +
                 " requirements";
    return false;
  }
  out->requirements.clear();
  for (auto requirement : requirements) {
    if (!ValidRequirement(requirement, error_msg)) return false;
    out->requirements.emplace_back(requirement.cStr());
  }

  auto urls = request.getFileUrls();
  if (urls.size() > kMaxFileUrls) {
    *error_msg = "More than " + std::to_string(kMaxFileUrls) + " file urls";
    return false;
  }
  out->files.clear();
  for (auto url : urls) {
    RemoteFile file;
    file.url = url.cStr();
    file.name = RemoteFileName(file.url);
    if (file.name.empty()) {
      *error_msg = "Unusable file url " + Quote(url) +
                   ", expected http(s) with a file name";
      return false;
    }
    if (file.name == out->language.entry_file) {
      *error_msg = "File url " + Quote(url) + " would replace the code";
      return false;
    }
    for (const RemoteFile& other : out->files) {
      if (other.name == file.name) {
        *error_msg = "File urls " + Quote(other.url.c_str()) + " and " +
                     Quote(url) + " share the name " + file.name;
        return false;
      }
    }
    out->files.push_back(std::move(file));
  }
  return true;
}

}  // namespace session
