#ifndef SESSION_FAKE_RUNTIME_HPP
#define SESSION_FAKE_RUNTIME_HPP

#include <sys/time.h>

#include <string>
#include <utility>
#include <vector>

#include <kj/async.h>
#include <kj/debug.h>

#include "runtime/runtime.hpp"
#include "util/file.hpp"

namespace session {

// What the instances of a FakeRuntime do.
struct FakeScript {
  bool fail_allocate = false;
  bool fail_revoke = false;

  runtime::StageOutcome install_outcome;
  std::string install_stderr;
  // (workspace path, content) pairs written by the install phase.
  std::vector<std::pair<std::string, std::string>> install_files;

  runtime::StageOutcome run_outcome;
  std::string run_stdout;
  std::string run_stderr;
  // Written by the run phase; the n-th file is given a modification time n
  // seconds after the first.
  std::vector<std::pair<std::string, std::string>> run_files;
  // The run phase never ends by itself.
  bool run_hangs = false;
  // Appended to the standard output when the instance is terminated.
  std::string late_stdout;
};

// Runtime whose instances follow a script instead of running anything, and
// record what the session asked of them.
class FakeRuntime : public runtime::Runtime {
 public:
  FakeScript script;

  std::vector<std::string> phases;
  bool network_during_install = false;
  bool network_during_run = false;
  int allocated = 0;
  int terminated = 0;
  int terminate_calls = 0;
  runtime::InstanceSpec last_spec;

  std::string Name() const override { return "fake"; }

  kj::Promise<kj::Own<runtime::Instance>> Allocate(
      const runtime::InstanceSpec& spec) override {
    last_spec = spec;
    if (script.fail_allocate) {
      return KJ_EXCEPTION(FAILED, "No instance available");
    }
    allocated++;
    return kj::Own<runtime::Instance>(kj::heap<FakeInstance>(*this, spec));
  }

  kj::Promise<runtime::HealthReport> Health() override {
    runtime::HealthReport report;
    report.reachable = !script.fail_allocate;
    report.message = report.reachable ? "ok" : "down";
    return report;
  }

 private:
  class FakeInstance : public runtime::Instance {
   public:
    FakeInstance(FakeRuntime& runtime, runtime::InstanceSpec spec)
        : runtime_(runtime), spec_(std::move(spec)), network_(spec_.network) {}

    kj::Promise<runtime::StageOutcome> Install(
        const runtime::Stage& stage) override {
      KJ_REQUIRE(!terminated_);
      runtime_.phases.push_back("install");
      runtime_.network_during_install = network_;
      util::File::WriteString(stage.stderr_file, runtime_.script.install_stderr);
      WriteFiles(runtime_.script.install_files);
      return runtime_.script.install_outcome;
    }

    kj::Promise<void> RevokeNetwork() override {
      if (runtime_.script.fail_revoke) {
        return KJ_EXCEPTION(FAILED, "Network revocation failed");
      }
      network_ = false;
      return kj::READY_NOW;
    }

    kj::Promise<runtime::StageOutcome> Run(const runtime::Stage& stage) override {
      KJ_REQUIRE(!terminated_);
      runtime_.phases.push_back("run");
      runtime_.network_during_run = network_;
      stdout_file_ = stage.stdout_file;
      util::File::WriteString(stage.stdout_file, runtime_.script.run_stdout);
      util::File::WriteString(stage.stderr_file, runtime_.script.run_stderr);
      WriteFiles(runtime_.script.run_files);
      if (runtime_.script.run_hangs) return kj::NEVER_DONE;
      return runtime_.script.run_outcome;
    }

    kj::Promise<void> Terminate() override {
      TerminateNow();
      return kj::READY_NOW;
    }

    void TerminateNow() override {
      runtime_.terminate_calls++;
      if (terminated_) return;
      terminated_ = true;
      runtime_.terminated++;
      if (!stdout_file_.empty() && !runtime_.script.late_stdout.empty()) {
        util::File::WriteString(
            stdout_file_, runtime_.script.run_stdout + runtime_.script.late_stdout);
      }
    }

   private:
    void WriteFiles(
        const std::vector<std::pair<std::string, std::string>>& files) {
      time_t base = time(nullptr) - 1000;
      for (size_t i = 0; i < files.size(); i++) {
        std::string path = util::File::JoinPath(spec_.workspace, files[i].first);
        util::File::WriteString(path, files[i].second);
        struct timeval times[2] = {{base + static_cast<time_t>(i), 0},
                                   {base + static_cast<time_t>(i), 0}};
        KJ_SYSCALL(utimes(path.c_str(), times), path.c_str());
      }
    }

    FakeRuntime& runtime_;
    runtime::InstanceSpec spec_;
    bool network_;
    bool terminated_ = false;
    std::string stdout_file_;
  };
};

}  // namespace session

#endif
