#include "util/misc.hpp"

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string tail(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  size_t start = s.size() - max_bytes;
  size_t newline = s.find('\n', start);
  if (newline != std::string::npos && newline + 1 < s.size()) {
    start = newline + 1;
  }
  return s.substr(start);
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool()> clearBool(bool& var) {
  return [&var]() {
    var = false;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    var = std::stoi(std::string(p.cStr()));
    return true;
  };
};

std::function<bool(kj::StringPtr)> setUint(uint32_t& var) {
  return [&var](kj::StringPtr p) {
    var = std::stoul(std::string(p.cStr()));
    return true;
  };
};

std::function<bool(kj::StringPtr)> setDouble(double& var) {
  return [&var](kj::StringPtr p) {
    var = std::stod(std::string(p.cStr()));
    return var > 0;
  };
};

std::function<bool(kj::StringPtr)> setScaled(int32_t& var, int32_t scale) {
  return [&var, scale](kj::StringPtr p) {
    var = std::stoi(std::string(p.cStr())) * scale;
    return var >= 0;
  };
};

std::function<bool(kj::StringPtr)> setScaled(int64_t& var, int64_t scale) {
  return [&var, scale](kj::StringPtr p) {
    var = std::stoll(std::string(p.cStr())) * scale;
    return var >= 0;
  };
};

}  // namespace util
