#ifndef SESSION_WORKSPACE_HPP
#define SESSION_WORKSPACE_HPP

#include <string>

#include "session/request.hpp"
#include "util/file.hpp"

namespace session {

// Host directories of one session:
//   <root>/<id>/        private to the service (stream captures, logs)
//   <root>/<id>/box/    the workspace, the only directory the instance sees
class Workspace {
 public:
  // Creates the directories. Throws std::system_error on failure, including
  // when a directory for id already exists.
  Workspace(const std::string& root, const std::string& id, bool keep);
  KJ_DISALLOW_COPY(Workspace);

  const std::string& SessionDir() const { return dir_.Path(); }
  const std::string& Box() const { return box_; }

  std::string StdoutFile() const;
  std::string StderrFile() const;
  std::string InstallStdoutFile() const;
  std::string InstallStderrFile() const;

  // Writes the code, the descriptor of the request and the files the
  // language needs before anything runs.
  void Populate(const Request& request, const std::string& descriptor);

  // Deletes everything, unless the workspace is kept. Calls after the first
  // one have no effect.
  void Remove();

 private:
  util::TempDir dir_;
  std::string box_;
};

// Name of the request descriptor, relative to the box.
extern const char* const kDescriptorFile;
// Directory, relative to the box, whose images are always captured.
extern const char* const kPlotsDir;

}  // namespace session

#endif
