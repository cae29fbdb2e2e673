#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Returns the last max_bytes bytes of s, cut at a line boundary when one is
// available.
std::string tail(const std::string& s, size_t max_bytes);

// Option setters for kj::MainBuilder.
std::function<bool()> setBool(bool& var);
std::function<bool()> clearBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<bool(kj::StringPtr)> setInt(int& var);
std::function<bool(kj::StringPtr)> setUint(uint32_t& var);
std::function<bool(kj::StringPtr)> setDouble(double& var);
// The argument is expressed in a coarser unit, var stores it multiplied by
// scale (e.g. seconds -> milliseconds, MiB -> KiB).
std::function<bool(kj::StringPtr)> setScaled(int32_t& var, int32_t scale);
std::function<bool(kj::StringPtr)> setScaled(int64_t& var, int64_t scale);

}  // namespace util
#endif
