#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;
std::string Flags::workspace_root = "/tmp/codebox";
bool Flags::keep_workspaces = false;

std::string Flags::runtime = "auto";
int32_t Flags::timeout_millis = 30 * 1000;
int32_t Flags::install_timeout_millis = 120 * 1000;
int64_t Flags::memory_limit_kb = 256 * 1024;
double Flags::cpu_share = 0.5;
int32_t Flags::sandbox_uid = 65534;
int32_t Flags::sandbox_gid = 65534;
bool Flags::install_network = true;
bool Flags::allow_unisolated = false;
std::string Flags::python_image = "codebox-python";
std::string Flags::node_image = "codebox-node";

int32_t Flags::max_concurrency = 0;
int32_t Flags::max_queued = 64;

int64_t Flags::output_limit_bytes = 1024 * 1024;
int32_t Flags::max_images = 16;
int64_t Flags::image_limit_bytes = 8 * 1024 * 1024;
int32_t Flags::fetch_timeout_millis = 30 * 1000;
int64_t Flags::max_fetch_bytes = 64 * 1024 * 1024;
bool Flags::fetch_private = false;

std::string Flags::listen_address = "0.0.0.0";
int32_t Flags::port = 7070;
int32_t Flags::http_port = 8000;
