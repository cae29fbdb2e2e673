#ifndef SESSION_SETTINGS_HPP
#define SESSION_SETTINGS_HPP

#include <cstdint>
#include <string>

namespace session {

// Per-session bounds and behaviour, fixed when the dispatcher is created.
struct Settings {
  std::string workspace_root;
  bool keep_workspaces = false;
  int64_t timeout_millis = 30 * 1000;
  int64_t install_timeout_millis = 120 * 1000;
  // Extra time the host waits for the runtime to enforce timeout_millis
  // before killing the instance itself.
  int64_t grace_millis = 2000;
  int64_t memory_limit_kb = 256 * 1024;
  double cpu_share = 0.5;
  bool install_network = true;
  int64_t output_limit_bytes = 1024 * 1024;
  size_t max_images = 16;
  int64_t image_limit_bytes = 8 * 1024 * 1024;

  // Settings taken from the command line flags.
  static Settings FromFlags();
};

}  // namespace session

#endif
