#include "runtime/process_runtime.hpp"

#include <unistd.h>
#include <algorithm>
#include <cmath>

#include <kj/debug.h>

#include "runtime/helper.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace runtime {

namespace {

const constexpr int32_t kMaxFiles = 256;
const constexpr int32_t kMaxProcs = 256;
const constexpr int64_t kMaxFileSizeKb = 512 * 1024;

StageOutcome ToOutcome(const sandbox::ExecutionInfo& info) {
  StageOutcome outcome;
  outcome.exit_code = info.status_code;
  outcome.signal = info.signal;
  outcome.timed_out = info.wall_limit_exceeded;
  outcome.memory_exceeded = info.memory_limit_exceeded;
  outcome.wall_time_millis = info.wall_time_millis;
  outcome.memory_usage_kb = info.memory_usage_kb;
  return outcome;
}

class ProcessInstance : public Instance {
 public:
  ProcessInstance(InstanceSpec spec, kj::LowLevelAsyncIoProvider& io)
      : spec_(std::move(spec)), io_(io), network_(spec_.network) {}

  kj::Promise<StageOutcome> Install(const Stage& stage) override {
    return Execute(ProcessRuntime::Phase::INSTALL, stage);
  }

  // Every phase is a new process: the next one is simply started in a new
  // network namespace.
  kj::Promise<void> RevokeNetwork() override {
    network_ = false;
    return kj::READY_NOW;
  }

  kj::Promise<StageOutcome> Run(const Stage& stage) override {
    return Execute(ProcessRuntime::Phase::RUN, stage);
  }

  kj::Promise<void> Terminate() override {
    TerminateNow();
    return kj::READY_NOW;
  }

  void TerminateNow() override {
    terminated_ = true;
    KJ_IF_MAYBE(helper, current_) { (*helper)->Kill(); }
    current_ = nullptr;
  }

 private:
  kj::Promise<StageOutcome> Execute(ProcessRuntime::Phase phase,
                                    const Stage& stage) {
    KJ_REQUIRE(!terminated_, "Instance already terminated", spec_.id.c_str());
    sandbox::ExecutionOptions options =
        ProcessRuntime::MakeOptions(spec_, phase, network_, stage);
    kj::Own<HelperProcess> helper = HelperProcess::Start(options, io_);
    current_ = kj::addRef(*helper);
    return helper->Wait().then(
        [](sandbox::ExecutionInfo info) { return ToOutcome(info); });
  }

  InstanceSpec spec_;
  kj::LowLevelAsyncIoProvider& io_;
  bool network_;
  bool terminated_ = false;
  kj::Maybe<kj::Own<HelperProcess>> current_;
};

}  // namespace

int ProcessRuntime::Score() {
  if (util::which_in("python3", kSystemPath).empty() &&
      util::which_in("node", kSystemPath).empty()) {
    return -1;
  }
  return 2;
}

int ProcessRuntime::NiceForShare(double cpu_share) {
  double share = std::max(0.05, std::min(1.0, cpu_share));
  return static_cast<int>(std::lround((1.0 - share) / 0.95 * 19));
}

sandbox::ExecutionOptions ProcessRuntime::MakeOptions(const InstanceSpec& spec,
                                                      Phase phase,
                                                      bool network,
                                                      const Stage& stage) {
  KJ_REQUIRE(!stage.command.empty(), "Empty command");
  std::string program = util::which_in(stage.command[0], kSystemPath);
  KJ_REQUIRE(!program.empty(), "Program not found on the system path",
             stage.command[0].c_str());
  sandbox::ExecutionOptions options(spec.workspace, program);
  options.SetArgs(
      std::vector<std::string>(stage.command.begin() + 1, stage.command.end()));
  for (const auto& var : spec.language.Environment(spec.workspace)) {
    options.AddEnv(var.first, var.second);
  }
  sandbox::ExecutionOptions::stringcpy(options.stdout_file, stage.stdout_file);
  sandbox::ExecutionOptions::stringcpy(options.stderr_file, stage.stderr_file);

  // The wall clock limit must be the one that triggers.
  options.wall_limit_millis = stage.timeout_millis;
  options.cpu_limit_millis = stage.timeout_millis + 1000;
  options.memory_limit_kb = spec.memory_limit_kb;
  if (spec.language.address_space_limit) {
    options.address_space_kb = 4 * spec.memory_limit_kb;
  }
  options.max_files = kMaxFiles;
  options.max_file_size_kb = kMaxFileSizeKb;
  options.nice = NiceForShare(spec.cpu_share);
  if (geteuid() == 0) {
    options.uid = Flags::sandbox_uid;
    options.gid = Flags::sandbox_gid;
    // Process counts are per user, only meaningful for the dedicated one.
    options.max_procs = kMaxProcs;
  }

  options.isolate_filesystem = true;
  options.isolate_network = phase == Phase::RUN || !network;
  options.require_isolation = !Flags::allow_unisolated;
  return options;
}

kj::Promise<kj::Own<Instance>> ProcessRuntime::Allocate(
    const InstanceSpec& spec) {
  if (geteuid() == 0) {
    util::File::ChangeOwner(spec.workspace, Flags::sandbox_uid,
                            Flags::sandbox_gid);
  }
  kj::Own<Instance> instance = kj::heap<ProcessInstance>(spec, io_);
  return kj::mv(instance);
}

kj::Promise<HealthReport> ProcessRuntime::Health() {
  std::string missing;
  for (const char* interpreter : {"python3", "node"}) {
    if (util::which_in(interpreter, kSystemPath).empty()) {
      if (!missing.empty()) missing += ", ";
      missing += interpreter;
    }
  }
  if (missing == "python3, node") {
    HealthReport report;
    report.message = "No interpreter found in " + std::string(kSystemPath);
    return report;
  }
  return HelperProcess::ProbeIsolation(io_).then(
      [missing](std::string reason) {
        HealthReport report;
        report.reachable = reason.empty() || Flags::allow_unisolated;
        if (!reason.empty()) report.message = "isolation: " + reason;
        if (!missing.empty()) {
          if (!report.message.empty()) report.message += "; ";
          report.message += "missing: " + missing;
        }
        if (report.message.empty()) report.message = "ok";
        return report;
      });
}

namespace {
Runtime::Register<ProcessRuntime> r("process");  // NOLINT
}  // namespace

}  // namespace runtime
