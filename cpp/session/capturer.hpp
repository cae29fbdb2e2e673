#ifndef SESSION_CAPTURER_HPP
#define SESSION_CAPTURER_HPP

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace session {

struct CapturedStream {
  std::string text;
  bool truncated = false;
};

// Reads the first limit bytes of a stream file. If bound is not negative,
// bytes past it are ignored as if never written. A missing file is an empty
// stream.
CapturedStream CaptureStream(const std::string& path, uint64_t limit,
                             int64_t bound = -1);

struct CapturedImages {
  // Base64 payloads, oldest file first.
  std::vector<std::string> payloads;
  // One line for each image that was left out.
  std::vector<std::string> notices;
};

// Image files directly inside box, to tell apart the ones the run creates.
std::set<std::string> TopLevelImages(const std::string& box);

// Collects the images under plots/ and the top-level images not in before,
// ordered by modification time, then name.
CapturedImages CaptureImages(const std::string& box,
                             const std::set<std::string>& before,
                             size_t max_images, uint64_t max_bytes);

// Replaces invalid UTF-8 sequences, and NUL bytes, with U+FFFD.
std::string SanitizeUtf8(const std::string& text);

// Whether the file name has one of the captured image extensions.
bool IsImage(const std::string& path);

}  // namespace session

#endif
