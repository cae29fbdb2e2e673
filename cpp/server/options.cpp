#include "server/options.hpp"

#include <thread>

#include "util/flags.hpp"
#include "util/misc.hpp"

namespace server {

kj::MainBuilder& AddSessionOptions(kj::MainBuilder& builder) {
  return builder
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Verbose logging, with stack traces")
      .addOptionWithArg({'W', "workspace-root"},
                        util::setString(Flags::workspace_root), "<DIR>",
                        "Directory where the session workspaces are created")
      .addOption({'k', "keep-workspaces"},
                 util::setBool(Flags::keep_workspaces),
                 "Do not remove the workspaces, for debugging")
      .addOptionWithArg({'R', "runtime"}, util::setString(Flags::runtime),
                        "<NAME>", "Runtime to use: docker, process or auto")
      .addOptionWithArg({'t', "timeout"},
                        util::setScaled(Flags::timeout_millis, 1000), "<SECS>",
                        "Wall clock limit of the user code")
      .addOptionWithArg({"install-timeout"},
                        util::setScaled(Flags::install_timeout_millis, 1000),
                        "<SECS>", "Wall clock limit of the dependency install")
      .addOptionWithArg({'m', "memory"},
                        util::setScaled(Flags::memory_limit_kb, 1024), "<MiB>",
                        "Memory ceiling of each instance")
      .addOptionWithArg({"cpus"}, util::setDouble(Flags::cpu_share), "<SHARE>",
                        "CPU share of each instance")
      .addOptionWithArg({'j', "max-sessions"},
                        util::setInt(Flags::max_concurrency), "<N>",
                        "Maximum number of live instances, 0 for one per "
                        "hardware thread")
      .addOptionWithArg({"max-queued"}, util::setInt(Flags::max_queued), "<N>",
                        "Maximum number of sessions waiting for an instance")
      .addOptionWithArg({"output-limit"},
                        util::setScaled(Flags::output_limit_bytes, 1024),
                        "<KiB>", "Cap of each captured stream")
      .addOptionWithArg({"max-images"}, util::setInt(Flags::max_images), "<N>",
                        "Maximum number of captured images")
      .addOptionWithArg({"uid"}, util::setInt(Flags::sandbox_uid), "<UID>",
                        "User the process runtime runs the code as, when "
                        "started as root")
      .addOptionWithArg({"gid"}, util::setInt(Flags::sandbox_gid), "<GID>",
                        "Group the process runtime runs the code as, when "
                        "started as root")
      .addOption({"no-install-network"},
                 util::clearBool(Flags::install_network),
                 "Never give network access, not even to the installer")
      .addOption({"allow-unisolated"}, util::setBool(Flags::allow_unisolated),
                 "Let the process runtime run without namespaces")
      .addOptionWithArg({"python-image"}, util::setString(Flags::python_image),
                        "<IMAGE>", "Docker image of Python sessions")
      .addOptionWithArg({"node-image"}, util::setString(Flags::node_image),
                        "<IMAGE>", "Docker image of Node sessions")
      .addOptionWithArg({"fetch-timeout"},
                        util::setScaled(Flags::fetch_timeout_millis, 1000),
                        "<SECS>", "Time limit of each remote file download")
      .addOptionWithArg({"max-fetch"},
                        util::setScaled(Flags::max_fetch_bytes, 1024 * 1024),
                        "<MiB>", "Size limit of each remote file")
      .addOption({"fetch-private"}, util::setBool(Flags::fetch_private),
                 "Let remote files come from loopback and private addresses");
}

size_t MaxConcurrency() {
  if (Flags::max_concurrency > 0) return Flags::max_concurrency;
  size_t threads = std::thread::hardware_concurrency();
  return threads == 0 ? 1 : threads;
}

}  // namespace server
