#include "session/workspace.hpp"

#include <sys/stat.h>

#include <system_error>

namespace session {

const char* const kDescriptorFile = ".codebox/meta.json";
const char* const kPlotsDir = "plots";

namespace {
void ChangeMode(const std::string& path, mode_t mode) {
  if (chmod(path.c_str(), mode) == -1) {
    throw std::system_error(errno, std::system_category(), "chmod " + path);
  }
}
}  // namespace

Workspace::Workspace(const std::string& root, const std::string& id,
                     bool keep)
    : dir_(root, id), box_(util::File::JoinPath(dir_.Path(), "box")) {
  if (keep) dir_.Keep();
  // Other users may only traverse the session directory, to reach the box.
  ChangeMode(dir_.Path(), 0711);
  util::File::MakeDirs(box_);
  ChangeMode(box_, 0755);
}

std::string Workspace::StdoutFile() const {
  return util::File::JoinPath(dir_.Path(), "stdout");
}

std::string Workspace::StderrFile() const {
  return util::File::JoinPath(dir_.Path(), "stderr");
}

std::string Workspace::InstallStdoutFile() const {
  return util::File::JoinPath(dir_.Path(), "install.stdout");
}

std::string Workspace::InstallStderrFile() const {
  return util::File::JoinPath(dir_.Path(), "install.stderr");
}

void Workspace::Populate(const Request& request,
                         const std::string& descriptor) {
  util::File::WriteString(
      util::File::JoinPath(box_, request.language.entry_file), request.code);
  std::string descriptor_path = util::File::JoinPath(box_, kDescriptorFile);
  util::File::MakeDirs(util::File::BaseDir(descriptor_path));
  util::File::WriteString(descriptor_path, descriptor);
  for (const auto& file : request.language.BootstrapFiles()) {
    std::string path = util::File::JoinPath(box_, file.first);
    util::File::MakeDirs(util::File::BaseDir(path));
    util::File::WriteString(path, file.second);
  }
  util::File::MakeDirs(util::File::JoinPath(box_, kPlotsDir));
}

void Workspace::Remove() { dir_.Remove(); }

}  // namespace session
