#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;
  static std::string workspace_root;
  static bool keep_workspaces;

  // Runtime selection and per-instance ceilings
  static std::string runtime;
  static int32_t timeout_millis;
  static int32_t install_timeout_millis;
  static int64_t memory_limit_kb;
  static double cpu_share;
  static int32_t sandbox_uid;
  static int32_t sandbox_gid;
  static bool install_network;
  static bool allow_unisolated;
  static std::string python_image;
  static std::string node_image;

  // Admission
  static int32_t max_concurrency;
  static int32_t max_queued;

  // Capture
  static int64_t output_limit_bytes;
  static int32_t max_images;
  static int64_t image_limit_bytes;
  static int32_t fetch_timeout_millis;
  static int64_t max_fetch_bytes;
  static bool fetch_private;

  // Server-only flags
  static std::string listen_address;
  static int32_t port;
  static int32_t http_port;
};

#endif
