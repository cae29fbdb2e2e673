#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <climits>
#include <memory>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for Linux systems: resource limits, a resident memory watcher over
// the whole process tree and, when requested, a private network namespace and
// a private root filesystem in new mount and pid namespaces.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

  // Whether the current process is able to isolate a child. Forks a
  // short-lived child that builds a private root around a temporary
  // directory to find out.
  static bool CanIsolate(std::string* error_msg);

 protected:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing its process group if it
  // exceeds the wall time or if its processes together exceed the memory
  // limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  int parent_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  // Copy of the options without isolation, when it is optional and not
  // available.
  std::unique_ptr<ExecutionOptions> relaxed_;
  char root_path_[PATH_MAX] = {};
};

}  // namespace sandbox
#endif
