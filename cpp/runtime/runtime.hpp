#ifndef RUNTIME_RUNTIME_HPP
#define RUNTIME_RUNTIME_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <kj/async-io.h>
#include <kj/function.h>
#include <kj/memory.h>

#include "runtime/language.hpp"

namespace runtime {

// What a runtime needs to know to create the instance of a session.
struct InstanceSpec {
  std::string id;
  Language language;
  // Private host directory of the session, outside the workspace.
  std::string session_dir;
  // Host path of the workspace.
  std::string workspace;
  // Whether the instance starts with network access, for the install phase.
  bool network = false;
  int64_t memory_limit_kb = 0;
  double cpu_share = 0;
};

// One phase (install or run) executed inside an instance.
struct Stage {
  std::vector<std::string> command;
  std::string stdout_file;
  std::string stderr_file;
  int64_t timeout_millis = 0;
};

// How a phase ended.
struct StageOutcome {
  int32_t exit_code = 0;
  int32_t signal = 0;
  bool timed_out = false;
  bool memory_exceeded = false;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
};

// The isolated environment of one session.
class Instance {
 public:
  virtual ~Instance() = default;

  // Runs the package manager. The instance has network access if it was
  // created with it and RevokeNetwork was not called yet.
  virtual kj::Promise<StageOutcome> Install(const Stage& stage) = 0;

  // Removes network access, for good.
  virtual kj::Promise<void> RevokeNetwork() = 0;

  // Runs the user code, without network access.
  virtual kj::Promise<StageOutcome> Run(const Stage& stage) = 0;

  // Kills everything running in the instance and releases it. Calls after
  // the first one resolve immediately.
  virtual kj::Promise<void> Terminate() = 0;

  // Same as Terminate, blocking the calling thread; for paths where the
  // event loop is gone.
  virtual void TerminateNow() = 0;
};

struct HealthReport {
  bool reachable = false;
  std::string message;
};

// A family of isolated environments. Implementations register themselves
// with a global Runtime::Register<T> object, and define:
//   static Runtime* Create(kj::LowLevelAsyncIoProvider&);
//   static int Score();  // negative if unusable, bigger is better.
class Runtime {
 public:
  using create_t = std::function<Runtime*(kj::LowLevelAsyncIoProvider&)>;
  using score_t = std::function<int()>;

  virtual ~Runtime() = default;

  // Name used on the command line.
  virtual std::string Name() const = 0;

  // Creates the instance of a session. Rejects when the host cannot provide
  // one.
  virtual kj::Promise<kj::Own<Instance>> Allocate(const InstanceSpec& spec) = 0;

  // Reports whether instances can currently be created.
  virtual kj::Promise<HealthReport> Health() = 0;

  // Creates the runtime with the given name, or the best available one if
  // name is "auto". Throws if there is none.
  static std::unique_ptr<Runtime> Create(const std::string& name,
                                 kj::LowLevelAsyncIoProvider& io);

  template <typename T>
  class Register {
   public:
    explicit Register(const char* name) {
      Runtime::Register_(name, &T::Create, &T::Score);
    }
  };

 private:
  struct Entry {
    std::string name;
    create_t create;
    score_t score;
  };
  static std::vector<Entry>* Runtimes_();
  static void Register_(const char* name, create_t, score_t);
};

}  // namespace runtime

#endif
