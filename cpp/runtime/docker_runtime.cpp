#include "runtime/docker_runtime.hpp"

#include <unistd.h>
#include <cstdio>
#include <cstdlib>

#include <kj/debug.h>

#include "runtime/helper.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace runtime {

namespace {

const constexpr int64_t kClientTimeoutMillis = 60 * 1000;
const constexpr int32_t kPidsLimit = 256;
const constexpr size_t kErrorTail = 2048;

// Environment variables of the server passed on to the docker client.
const char* const kClientEnvironment[] = {
    "HOME", "DOCKER_HOST", "DOCKER_CONFIG", "DOCKER_CERT_PATH",
    "DOCKER_TLS_VERIFY", "DOCKER_CONTEXT"};

std::string DockerBinary() {
  std::string docker = util::which_in("docker", kSystemPath);
  KJ_REQUIRE(!docker.empty(), "docker not found on the system path");
  return docker;
}

[[noreturn]] void FailWithOutput(const char* what, const std::string& path,
                                 int32_t status) {
  std::string output = util::tail(util::File::ReadString(path, 1 << 20),
                                  kErrorTail);
  while (!output.empty() && output.back() == '\n') output.pop_back();
  kj::throwFatalException(kj::Exception(
      kj::Exception::Type::FAILED, __FILE__, __LINE__,
      kj::str(what, " exited with status ", status,
              output.empty() ? "" : ": ", output.c_str())));
}

// Runs a docker client command in dir and resolves with its exit status.
kj::Promise<int32_t> RunClient(kj::LowLevelAsyncIoProvider& io,
                               const std::string& dir,
                               const std::vector<std::string>& args,
                               const std::string& stdout_file,
                               const std::string& stderr_file) {
  auto helper = HelperProcess::Start(
      DockerRuntime::ClientOptions(dir, args, stdout_file, stderr_file,
                                   kClientTimeoutMillis),
      io);
  return helper->Wait().then([](sandbox::ExecutionInfo info) -> int32_t {
    if (info.wall_limit_exceeded) return -1;
    return info.signal != 0 ? 128 + info.signal : info.status_code;
  });
}

class DockerInstance : public Instance {
 public:
  DockerInstance(InstanceSpec spec, kj::LowLevelAsyncIoProvider& io)
      : spec_(std::move(spec)),
        io_(io),
        name_(DockerRuntime::ContainerName(spec_.id)),
        out_(util::File::JoinPath(spec_.session_dir, "docker.out")),
        err_(util::File::JoinPath(spec_.session_dir, "docker.err")),
        events_(util::File::JoinPath(spec_.session_dir, "memory.events")),
        network_(spec_.network) {}

  ~DockerInstance() {
    if (removed_) return;
    KJ_LOG(WARNING, "Container dropped without termination", name_.c_str());
    KJ_IF_MAYBE(exc, kj::runCatchingExceptions([this]() { TerminateNow(); })) {
      KJ_LOG(ERROR, *exc);
    }
  }

  kj::Promise<StageOutcome> Install(const Stage& stage) override {
    return Exec(stage);
  }

  kj::Promise<void> RevokeNetwork() override {
    if (!network_) return kj::READY_NOW;
    network_ = false;
    return RunClient(io_, spec_.session_dir,
                     {"network", "disconnect", "--force", "bridge", name_},
                     out_, err_)
        .then([this](int32_t status) {
          if (status != 0) {
            FailWithOutput("docker network disconnect", err_, status);
          }
        });
  }

  kj::Promise<StageOutcome> Run(const Stage& stage) override {
    return Exec(stage);
  }

  kj::Promise<void> Terminate() override {
    if (terminated_) return kj::READY_NOW;
    terminated_ = true;
    KJ_IF_MAYBE(helper, current_) { (*helper)->Kill(); }
    current_ = nullptr;
    return RunClient(io_, spec_.session_dir, {"rm", "--force", name_}, out_,
                     err_)
        .then([this](int32_t status) {
          removed_ = true;
          if (status != 0) {
            KJ_LOG(ERROR, "Cannot remove container", name_.c_str(), status);
          }
        });
  }

  void TerminateNow() override {
    if (removed_) return;
    terminated_ = true;
    removed_ = true;
    KJ_IF_MAYBE(helper, current_) { (*helper)->Kill(); }
    current_ = nullptr;
    sandbox::ExecutionInfo info = HelperProcess::RunBlocking(
        DockerRuntime::ClientOptions(spec_.session_dir, {"rm", "--force", name_},
                                     out_, err_, kClientTimeoutMillis));
    if (info.status_code != 0 || info.signal != 0) {
      KJ_LOG(ERROR, "Cannot remove container", name_.c_str(),
             info.status_code);
    }
  }

 private:
  kj::Promise<StageOutcome> Exec(const Stage& stage) {
    KJ_REQUIRE(!terminated_, "Instance already terminated", name_.c_str());
    return OomKills().then([this, stage](int64_t before) {
      auto helper = HelperProcess::Start(
          DockerRuntime::ClientOptions(
              spec_.session_dir, DockerRuntime::ExecArgs(spec_, stage),
              stage.stdout_file, stage.stderr_file, stage.timeout_millis),
          io_);
      current_ = kj::addRef(*helper);
      return helper->Wait().then([this, before](sandbox::ExecutionInfo info) {
        // Killing the client leaves the stage running in the container.
        kj::Promise<void> cleanup = kj::READY_NOW;
        if (info.wall_limit_exceeded) cleanup = KillStage();
        return cleanup.then([this]() { return OomKills(); })
            .then([info, before](int64_t after) {
              StageOutcome outcome;
              outcome.exit_code = info.status_code;
              outcome.signal = info.signal;
              outcome.timed_out = info.wall_limit_exceeded;
              outcome.memory_exceeded = DockerRuntime::IsOomKill(
                  info.wall_limit_exceeded, info.status_code, before, after);
              outcome.wall_time_millis = info.wall_time_millis;
              return outcome;
            });
      });
    });
  }

  kj::Promise<void> KillStage() {
    if (terminated_) return kj::READY_NOW;
    return RunClient(io_, spec_.session_dir,
                     DockerRuntime::KillStageArgs(spec_), out_, err_)
        .then([this](int32_t status) {
          if (status != 0) {
            KJ_LOG(ERROR, "Cannot kill the stage processes", name_.c_str(),
                   status);
          }
        });
  }

  // Current oom_kill counter of the container, -1 if unknown.
  kj::Promise<int64_t> OomKills() {
    if (terminated_) return int64_t(-1);
    return RunClient(io_, spec_.session_dir,
                     DockerRuntime::OomEventsArgs(spec_), events_, err_)
        .then([this](int32_t status) -> int64_t {
          if (status != 0) return -1;
          return DockerRuntime::ParseOomKills(
              util::File::ReadString(events_, 4096));
        });
  }

  InstanceSpec spec_;
  kj::LowLevelAsyncIoProvider& io_;
  std::string name_;
  std::string out_;
  std::string err_;
  std::string events_;
  bool network_;
  // No more phases may start.
  bool terminated_ = false;
  // The container is gone, or its removal was attempted.
  bool removed_ = false;
  kj::Maybe<kj::Own<HelperProcess>> current_;
};

}  // namespace

constexpr const char* DockerRuntime::kContainerWorkspace;
constexpr int DockerRuntime::kKilledStatus;

int DockerRuntime::Score() {
  return util::which_in("docker", kSystemPath).empty() ? -1 : 3;
}

std::vector<std::string> DockerRuntime::RunArgs(const InstanceSpec& spec) {
  char cpus[32] = {};
  snprintf(cpus, sizeof(cpus), "%.2f", spec.cpu_share);  // NOLINT
  std::string memory = std::to_string(spec.memory_limit_kb) + "k";
  std::string user = std::to_string(Flags::sandbox_uid) + ":" +
                     std::to_string(Flags::sandbox_gid);
  return {"run",
          "--detach",
          "--name",
          ContainerName(spec.id),
          "--memory",
          memory,
          "--memory-swap",
          memory,
          "--cpus",
          cpus,
          "--pids-limit",
          std::to_string(kPidsLimit),
          "--user",
          user,
          "--cap-drop",
          "ALL",
          "--security-opt",
          "no-new-privileges",
          "--read-only",
          "--tmpfs",
          "/tmp",
          "--volume",
          spec.workspace + ":" + kContainerWorkspace,
          "--workdir",
          kContainerWorkspace,
          "--network",
          spec.network ? "bridge" : "none",
          spec.language.image,
          "sleep",
          "infinity"};
}

std::vector<std::string> DockerRuntime::ExecArgs(const InstanceSpec& spec,
                                                 const Stage& stage) {
  std::vector<std::string> args = {"exec", "--workdir", kContainerWorkspace};
  for (const auto& var : spec.language.Environment(kContainerWorkspace)) {
    args.push_back("--env");
    args.push_back(var.first + "=" + var.second);
  }
  args.push_back(ContainerName(spec.id));
  args.insert(args.end(), stage.command.begin(), stage.command.end());
  return args;
}

std::vector<std::string> DockerRuntime::KillStageArgs(
    const InstanceSpec& spec) {
  // kill -1 signals everything but the shell itself and the container init.
  return {"exec", ContainerName(spec.id), "sh", "-c", "kill -KILL -1 || true"};
}

std::vector<std::string> DockerRuntime::OomEventsArgs(
    const InstanceSpec& spec) {
  return {"exec", ContainerName(spec.id), "sh", "-c",
          "cat /sys/fs/cgroup/memory.events 2>/dev/null || "
          "cat /sys/fs/cgroup/memory/memory.oom_control"};
}

int64_t DockerRuntime::ParseOomKills(const std::string& events) {
  static const char kKey[] = "oom_kill ";
  size_t pos = 0;
  while (pos < events.size()) {
    size_t end = events.find('\n', pos);
    if (end == std::string::npos) end = events.size();
    if (events.compare(pos, sizeof(kKey) - 1, kKey) == 0) {
      std::string value =
          events.substr(pos + sizeof(kKey) - 1, end - pos - sizeof(kKey) + 1);
      char* parsed_end = nullptr;
      int64_t count = strtoll(value.c_str(), &parsed_end, 10);
      if (parsed_end == value.c_str() || count < 0) return -1;
      return count;
    }
    pos = end + 1;
  }
  return -1;
}

bool DockerRuntime::IsOomKill(bool timed_out, int exit_code, int64_t before,
                              int64_t after) {
  if (timed_out) return false;
  if (before >= 0 && after >= 0) return after > before;
  return exit_code == kKilledStatus;
}

sandbox::ExecutionOptions DockerRuntime::ClientOptions(
    const std::string& dir, const std::vector<std::string>& args,
    const std::string& stdout_file, const std::string& stderr_file,
    int64_t timeout_millis) {
  sandbox::ExecutionOptions options(dir, DockerBinary());
  options.SetArgs(args);
  options.AddEnv("PATH", kSystemPath);
  for (const char* var : kClientEnvironment) {
    const char* value = getenv(var);
    if (value != nullptr) options.AddEnv(var, value);
  }
  sandbox::ExecutionOptions::stringcpy(options.stdout_file, stdout_file);
  sandbox::ExecutionOptions::stringcpy(options.stderr_file, stderr_file);
  options.wall_limit_millis = timeout_millis;
  options.require_isolation = false;
  return options;
}

kj::Promise<kj::Own<Instance>> DockerRuntime::Allocate(
    const InstanceSpec& spec) {
  // The container user must be able to write the workspace.
  if (geteuid() == 0) {
    util::File::ChangeOwner(spec.workspace, Flags::sandbox_uid,
                            Flags::sandbox_gid);
  } else {
    util::File::ShareTree(spec.workspace);
  }
  std::string out = util::File::JoinPath(spec.session_dir, "docker.out");
  std::string err = util::File::JoinPath(spec.session_dir, "docker.err");
  return RunClient(io_, spec.session_dir, RunArgs(spec), out, err)
      .then([this, spec, err](int32_t status) -> kj::Own<Instance> {
        if (status != 0) {
          // A container may exist even if the client failed.
          kj::Own<Instance> partial = kj::heap<DockerInstance>(spec, io_);
          partial->TerminateNow();
          FailWithOutput("docker run", err, status);
        }
        return kj::heap<DockerInstance>(spec, io_);
      });
}

kj::Promise<HealthReport> DockerRuntime::Health() {
  if (util::which_in("docker", kSystemPath).empty()) {
    HealthReport report;
    report.message = "docker not found on the system path";
    return report;
  }
  util::File::MakeDirs(Flags::workspace_root);
  auto dir = kj::heap<util::TempDir>(Flags::workspace_root);
  std::string out = util::File::JoinPath(dir->Path(), "version.out");
  std::string err = util::File::JoinPath(dir->Path(), "version.err");
  return RunClient(io_, dir->Path(),
                   {"version", "--format", "{{.Server.Version}}"}, out, err)
      .then([out, err](int32_t status) {
        HealthReport report;
        report.reachable = status == 0;
        std::string text = util::File::ReadString(status == 0 ? out : err, 4096);
        while (!text.empty() && text.back() == '\n') text.pop_back();
        report.message = status == 0 ? "docker server " + text : text;
        if (report.message.empty()) report.message = "docker version failed";
        return report;
      })
      .attach(kj::mv(dir));
}

namespace {
Runtime::Register<DockerRuntime> r("docker");  // NOLINT
}  // namespace

}  // namespace runtime
