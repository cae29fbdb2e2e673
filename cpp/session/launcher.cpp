#include "session/launcher.hpp"

#include <csignal>
#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/misc.hpp"

namespace session {
namespace {
static const constexpr uint64_t kStderrTail = 4096;

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace

bool ReportsOutOfMemory(const std::string& text, const std::string& marker) {
  if (marker.empty()) return false;
  for (std::string line : util::split(text, '\n')) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
      line.pop_back();
    }
    if (line.compare(0, marker.size(), marker) == 0) return true;
    if (EndsWith(line, marker)) return true;
  }
  return false;
}

capnproto::ErrorKind Classify(const runtime::StageOutcome& outcome,
                              const runtime::Language& language,
                              const std::string& stderr_tail) {
  if (outcome.timed_out) return capnproto::ErrorKind::TIMED_OUT;
  if (outcome.memory_exceeded || outcome.signal == SIGXCPU) {
    return capnproto::ErrorKind::RESOURCE_EXCEEDED;
  }
  if (outcome.exit_code == 0 && outcome.signal == 0) {
    return capnproto::ErrorKind::NONE;
  }
  if (ReportsOutOfMemory(stderr_tail, language.out_of_memory_marker)) {
    return capnproto::ErrorKind::RESOURCE_EXCEEDED;
  }
  return capnproto::ErrorKind::RUNTIME_FAILURE;
}

kj::Promise<RunReport> Launch(kj::Timer& timer, runtime::Instance& instance,
                              const Request& request,
                              const Workspace& workspace,
                              const Settings& settings) {
  runtime::Stage stage;
  stage.command = request.language.RunCommand(settings.memory_limit_kb);
  stage.stdout_file = workspace.StdoutFile();
  stage.stderr_file = workspace.StderrFile();
  stage.timeout_millis = settings.timeout_millis;

  auto backstop =
      timer
          .afterDelay((settings.timeout_millis + settings.grace_millis) *
                      kj::MILLISECONDS)
          .then([]() {
            KJ_LOG(WARNING, "Runtime missed the deadline, killing instance");
            runtime::StageOutcome outcome;
            outcome.timed_out = true;
            return outcome;
          });

  const runtime::Language& language = request.language;
  return instance.Run(stage)
      .exclusiveJoin(kj::mv(backstop))
      .then([&instance, &workspace,
             &language](runtime::StageOutcome outcome) -> kj::Promise<RunReport> {
        RunReport report;
        report.outcome = outcome;
        if (outcome.timed_out) {
          report.kind = capnproto::ErrorKind::TIMED_OUT;
          report.stdout_bound = util::File::Size(workspace.StdoutFile());
          report.stderr_bound = util::File::Size(workspace.StderrFile());
          if (report.stdout_bound < 0) report.stdout_bound = 0;
          if (report.stderr_bound < 0) report.stderr_bound = 0;
          return instance.Terminate().then([report]() { return report; });
        }
        std::string stderr_tail;
        if (util::File::Size(workspace.StderrFile()) > 0) {
          try {
            stderr_tail =
                util::File::ReadTail(workspace.StderrFile(), kStderrTail);
          } catch (const std::system_error& exc) {
            KJ_LOG(WARNING, "Standard error unreadable", exc.what());
          }
        }
        report.kind = Classify(outcome, language, stderr_tail);
        return report;
      });
}

}  // namespace session
