#ifndef RUNTIME_LANGUAGE_HPP
#define RUNTIME_LANGUAGE_HPP

#include <string>
#include <utility>
#include <vector>

#include <kj/common.h>
#include <kj/string.h>

namespace runtime {

// Everything that depends on the language of a request. A value is resolved
// once when the session is admitted and never looked up again.
struct Language {
  enum class Kind { PYTHON, NODE };

  Kind kind;
  std::string name;
  // Image used by the docker runtime.
  std::string image;
  // Program name; the process runtime resolves it on the system path.
  std::string interpreter;
  // Name of the file, in the workspace, holding the user code.
  std::string entry_file;
  std::string package_manager;
  // Last line of standard error printed when the interpreter runs out of
  // memory.
  std::string out_of_memory_marker;
  // The interpreter copes with an address space limit (V8 does not).
  bool address_space_limit;

  // Command line installing the packages into the workspace. The first
  // element is the program name.
  std::vector<std::string> InstallCommand(
      const std::vector<std::string>& packages) const;

  // Command line running the entry file.
  std::vector<std::string> RunCommand(int64_t memory_limit_kb) const;

  // Environment of both phases, for a workspace seen at workspace_path.
  std::vector<std::pair<std::string, std::string>> Environment(
      const std::string& workspace_path) const;

  // Files written into the workspace before anything runs, as
  // (relative path, content) pairs.
  std::vector<std::pair<std::string, std::string>> BootstrapFiles() const;

  // Resolves a wire language name.
  static kj::Maybe<Language> FromName(kj::StringPtr name);
};

// Search path of interpreters and tools; the caller's PATH is never used.
extern const char* const kSystemPath;

// Workspace-relative directory for the files of the sandbox itself.
extern const char* const kPrivateDir;

}  // namespace runtime

#endif
