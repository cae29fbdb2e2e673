#include "util/which.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
std::mutex cmd_cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache;
}  // namespace

namespace util {

std::string which_in(const std::string& cmd, const std::string& search_path,
                     bool use_cache) {
  std::string key = search_path + '\0' + cmd;
  std::lock_guard<std::mutex> lck(cmd_cache_mutex);
  if (use_cache && cmd_cache.count(key) > 0) return cmd_cache[key];

  for (const std::string& dir : split(search_path, ':')) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (File::Exists(fullpath)) return cmd_cache[key] = fullpath;
  }

  return "";
}

}  // namespace util
