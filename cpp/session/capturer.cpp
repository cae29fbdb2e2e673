#include "session/capturer.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <system_error>
#include <tuple>

#include <kj/debug.h>
#include <kj/encoding.h>

#include "session/workspace.hpp"
#include "util/file.hpp"

namespace session {
namespace {

struct ImageFile {
  int64_t sec;
  int64_t nsec;
  std::string name;
  std::string path;
  int64_t size;
};

bool operator<(const ImageFile& a, const ImageFile& b) {
  return std::tie(a.sec, a.nsec, a.name) < std::tie(b.sec, b.nsec, b.name);
}

bool Stat(const std::string& path, const std::string& name,
          std::vector<ImageFile>* files) {
  struct stat st {};
  if (lstat(path.c_str(), &st) == -1 || !S_ISREG(st.st_mode)) return false;
  files->push_back(ImageFile{st.st_mtim.tv_sec, st.st_mtim.tv_nsec, name,
                             path, st.st_size});
  return true;
}

}  // namespace

bool IsImage(const std::string& path) {
  std::string name = util::File::BaseName(path);
  size_t dot = name.find_last_of('.');
  if (dot == std::string::npos || dot == 0) return false;
  std::string extension = name.substr(dot + 1);
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return extension == "png" || extension == "jpg" || extension == "jpeg" ||
         extension == "gif" || extension == "svg";
}

std::string SanitizeUtf8(const std::string& text) {
  static const char kReplacement[] = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    auto c = static_cast<unsigned char>(text[i]);
    size_t length = 0;
    uint32_t min = 0;
    if (c == 0) {
      length = 0;
    } else if (c < 0x80) {
      length = 1;
    } else if ((c & 0xE0) == 0xC0) {
      length = 2;
      min = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      length = 3;
      min = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      length = 4;
      min = 0x10000;
    }
    bool valid = length > 0 && i + length <= text.size();
    uint32_t code_point = length == 1 ? c : c & (0x7F >> length);
    for (size_t k = 1; valid && k < length; k++) {
      auto next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      code_point = (code_point << 6) | (next & 0x3F);
    }
    if (valid && length > 1 &&
        (code_point < min || code_point > 0x10FFFF ||
         (code_point >= 0xD800 && code_point <= 0xDFFF))) {
      valid = false;
    }
    if (!valid) {
      out += kReplacement;
      i++;
      continue;
    }
    out.append(text, i, length);
    i += length;
  }
  return out;
}

CapturedStream CaptureStream(const std::string& path, uint64_t limit,
                             int64_t bound) {
  CapturedStream stream;
  int64_t size = util::File::Size(path);
  if (size < 0) return stream;
  if (bound >= 0 && bound < size) size = bound;
  uint64_t to_read = std::min<uint64_t>(size, limit);
  stream.text = util::File::ReadString(path, to_read);
  stream.truncated = static_cast<uint64_t>(size) > limit;
  return stream;
}

std::set<std::string> TopLevelImages(const std::string& box) {
  std::set<std::string> images;
  for (const std::string& path :
       util::File::ListFiles(box, /*recursive=*/false)) {
    if (IsImage(path)) images.insert(util::File::BaseName(path));
  }
  return images;
}

CapturedImages CaptureImages(const std::string& box,
                             const std::set<std::string>& before,
                             size_t max_images, uint64_t max_bytes) {
  std::vector<ImageFile> files;
  std::string plots = util::File::JoinPath(box, kPlotsDir);
  for (const std::string& path : util::File::ListFiles(plots)) {
    if (!IsImage(path)) continue;
    Stat(path, path.substr(box.size() + 1), &files);
  }
  for (const std::string& path :
       util::File::ListFiles(box, /*recursive=*/false)) {
    std::string name = util::File::BaseName(path);
    if (!IsImage(path) || before.count(name)) continue;
    Stat(path, name, &files);
  }
  std::sort(files.begin(), files.end());

  CapturedImages images;
  std::string too_large =
      " skipped: larger than " + std::to_string(max_bytes) + " bytes";
  for (const ImageFile& file : files) {
    if (file.size < 0 || static_cast<uint64_t>(file.size) > max_bytes) {
      images.notices.push_back("[images] " + file.name + too_large);
      continue;
    }
    if (images.payloads.size() >= max_images) {
      images.notices.push_back("[images] " + file.name +
                               " skipped: more than " +
                               std::to_string(max_images) + " images");
      continue;
    }
    std::string content;
    try {
      content = util::File::ReadString(file.path, max_bytes + 1);
    } catch (const std::system_error& exc) {
      images.notices.push_back("[images] " + file.name +
                               " skipped: " + exc.what());
      continue;
    }
    if (content.size() > max_bytes) {
      images.notices.push_back("[images] " + file.name + too_large);
      continue;
    }
    images.payloads.emplace_back(
        kj::encodeBase64(kj::arrayPtr(
                             reinterpret_cast<const kj::byte*>(content.data()),
                             content.size()))
            .cStr());
  }
  return images;
}

}  // namespace session
