#include "session/installer.hpp"

#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/misc.hpp"

namespace session {
namespace {
static const constexpr size_t kOutputTail = 2048;

std::string OutputTail(const Workspace& workspace) {
  for (const std::string& path :
       {workspace.InstallStderrFile(), workspace.InstallStdoutFile()}) {
    if (util::File::Size(path) <= 0) continue;
    return util::tail(util::File::ReadTail(path, kOutputTail), kOutputTail);
  }
  return "";
}
}  // namespace

std::string InstallNotice(const std::string& package_manager,
                          const runtime::StageOutcome& outcome,
                          int64_t timeout_millis, const std::string& output) {
  std::string notice = "[install] " + package_manager;
  if (outcome.timed_out) {
    notice += " failed: timed out after " +
              std::to_string(timeout_millis / 1000) + " s";
  } else if (outcome.memory_exceeded) {
    notice += " failed: memory limit exceeded";
  } else if (outcome.signal != 0) {
    notice += " failed: killed by signal " + std::to_string(outcome.signal);
  } else {
    notice += " failed with exit code " + std::to_string(outcome.exit_code);
  }
  notice += "\n";
  if (!output.empty()) {
    notice += output;
    if (output.back() != '\n') notice += "\n";
  }
  return notice;
}

kj::Promise<InstallReport> Install(runtime::Instance& instance,
                                   const Request& request,
                                   const Workspace& workspace,
                                   int64_t timeout_millis) {
  runtime::Stage stage;
  stage.command = request.language.InstallCommand(request.requirements);
  stage.stdout_file = workspace.InstallStdoutFile();
  stage.stderr_file = workspace.InstallStderrFile();
  stage.timeout_millis = timeout_millis;
  std::string package_manager = request.language.package_manager;
  return instance.Install(stage).then(
      [&workspace, package_manager,
       timeout_millis](runtime::StageOutcome outcome) {
        InstallReport report;
        if (!outcome.timed_out && !outcome.memory_exceeded &&
            outcome.signal == 0 && outcome.exit_code == 0) {
          KJ_LOG(INFO, "Install succeeded", outcome.wall_time_millis);
          return report;
        }
        std::string output;
        try {
          output = OutputTail(workspace);
        } catch (const std::system_error& exc) {
          KJ_LOG(WARNING, "Install output unreadable", exc.what());
        }
        report.failed = true;
        report.notice =
            InstallNotice(package_manager, outcome, timeout_millis, output);
        KJ_LOG(WARNING, "Install failed", outcome.exit_code, outcome.signal,
               outcome.timed_out);
        return report;
      });
}

}  // namespace session
