#include "session/settings.hpp"

#include "util/flags.hpp"

namespace session {

Settings Settings::FromFlags() {
  Settings settings;
  settings.workspace_root = Flags::workspace_root;
  settings.keep_workspaces = Flags::keep_workspaces;
  settings.timeout_millis = Flags::timeout_millis;
  settings.install_timeout_millis = Flags::install_timeout_millis;
  settings.memory_limit_kb = Flags::memory_limit_kb;
  settings.cpu_share = Flags::cpu_share;
  settings.install_network = Flags::install_network;
  settings.output_limit_bytes = Flags::output_limit_bytes;
  settings.max_images = Flags::max_images;
  settings.image_limit_bytes = Flags::image_limit_bytes;
  return settings;
}

}  // namespace session
