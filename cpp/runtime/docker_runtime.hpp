#ifndef RUNTIME_DOCKER_RUNTIME_HPP
#define RUNTIME_DOCKER_RUNTIME_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "runtime/runtime.hpp"
#include "sandbox/sandbox.hpp"

namespace runtime {

// One container per session, driven through the docker command line. The
// container sleeps; every phase is a docker exec into it.
class DockerRuntime : public Runtime {
 public:
  // Where the workspace is mounted inside the container.
  static const constexpr char* kContainerWorkspace = "/home/sandbox/script";
  // Exit status of a process killed by SIGKILL, as reported by docker.
  static const constexpr int kKilledStatus = 137;

  explicit DockerRuntime(kj::LowLevelAsyncIoProvider& io) : io_(io) {}
  static Runtime* Create(kj::LowLevelAsyncIoProvider& io) {
    return new DockerRuntime(io);
  }
  static int Score();

  std::string Name() const override { return "docker"; }
  kj::Promise<kj::Own<Instance>> Allocate(const InstanceSpec& spec) override;
  kj::Promise<HealthReport> Health() override;

  static std::string ContainerName(const std::string& id) {
    return "codebox-" + id;
  }

  // Arguments of "docker run" creating the container of a session.
  static std::vector<std::string> RunArgs(const InstanceSpec& spec);

  // Arguments of "docker exec" running a stage in the container.
  static std::vector<std::string> ExecArgs(const InstanceSpec& spec,
                                           const Stage& stage);

  // Arguments of "docker exec" killing every process a stage left behind in
  // the container. The container's own sleep is spared, as its init.
  static std::vector<std::string> KillStageArgs(const InstanceSpec& spec);

  // Arguments of "docker exec" printing the memory events of the container
  // cgroup (cgroup v2, with a fallback to v1).
  static std::vector<std::string> OomEventsArgs(const InstanceSpec& spec);

  // The oom_kill counter in a memory events dump, -1 if absent.
  static int64_t ParseOomKills(const std::string& events);

  // Whether a stage was killed by the OOM killer, given the oom_kill counter
  // before and after it. Unknown counters (-1) fall back to the exit status.
  static bool IsOomKill(bool timed_out, int exit_code, int64_t before,
                        int64_t after);

  // Sandbox settings running the docker client with the given arguments.
  // The client runs in dir, unconfined: the container is the isolation.
  static sandbox::ExecutionOptions ClientOptions(
      const std::string& dir, const std::vector<std::string>& args,
      const std::string& stdout_file, const std::string& stderr_file,
      int64_t timeout_millis);

 private:
  kj::LowLevelAsyncIoProvider& io_;
};

}  // namespace runtime

#endif
