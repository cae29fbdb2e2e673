#include "runtime/helper.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cctype>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <vector>

#include <kj/debug.h>
#include <kj/io.h>
#include <kj/vector.h>

#include "whereami++.h"

extern char** environ;

namespace runtime {

namespace {

// Spawns "<self> sandbox <flag>" with the given descriptors as standard
// input, output and error. Returns the pid.
int SpawnHelper(const char* flag, int stdin_fd, int stdout_fd, int stderr_fd) {
  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  KJ_DEFER(posix_spawn_file_actions_destroy(&actions));
  posix_spawn_file_actions_adddup2(&actions, stdin_fd, STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, stdout_fd, STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, stderr_fd, STDERR_FILENO);

  std::string self = whereami::getExecutablePath();
#define VPARAM(s) s, s + strlen(s) + 1
  std::vector<char> self_mut(VPARAM(self.c_str()));
  std::vector<char> sandbox_mut(VPARAM("sandbox"));
  std::vector<char> flag_mut(VPARAM(flag));
#undef VPARAM
  char* args[] = {self_mut.data(), sandbox_mut.data(), flag_mut.data(),
                  nullptr};
  int pid = -1;
  int ret = posix_spawn(&pid, args[0], &actions, nullptr, args, environ);
  KJ_REQUIRE(ret == 0, "Cannot start the sandbox helper", strerror(ret));
  return pid;
}

struct Pipe {
  kj::AutoCloseFd read_end;
  kj::AutoCloseFd write_end;
};

Pipe MakePipe() {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));
  return Pipe{kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1])};
}

kj::AutoCloseFd OpenDevNull(int flags) {
  int fd;
  KJ_SYSCALL(fd = open("/dev/null", flags | O_CLOEXEC));
  return kj::AutoCloseFd(fd);
}

int WaitForPid(int pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      KJ_LOG(ERROR, "waitpid", pid, strerror(errno));
      return -1;
    }
  }
  return status;
}

const constexpr uint32_t kAsyncFlags =
    kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
    kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC;

}  // namespace

sandbox::ExecutionInfo ParseHelperReply(kj::ArrayPtr<const kj::byte> data) {
  KJ_REQUIRE(data.size() >= sizeof(size_t),
             "Sandbox helper terminated without a reply", data.size());
  size_t error_sz = 0;
  memcpy(&error_sz, data.begin(), sizeof(error_sz));
  auto rest = data.slice(sizeof(size_t), data.size());
  if (error_sz != 0) {
    KJ_REQUIRE(rest.size() >= error_sz, "Truncated reply from the helper");
    kj::throwFatalException(kj::Exception(
        kj::Exception::Type::FAILED, __FILE__, __LINE__,
        kj::heapString(reinterpret_cast<const char*>(rest.begin()),  // NOLINT
                       error_sz)));
  }
  KJ_REQUIRE(rest.size() >= sizeof(sandbox::ExecutionInfo),
             "Truncated reply from the helper", rest.size());
  sandbox::ExecutionInfo outcome;
  memcpy(&outcome, rest.begin(), sizeof(outcome));
  return outcome;
}

kj::Own<HelperProcess> HelperProcess::Start(
    const sandbox::ExecutionOptions& options, kj::LowLevelAsyncIoProvider& io) {
  Pipe options_pipe = MakePipe();
  Pipe outcome_pipe = MakePipe();
  kj::AutoCloseFd null_fd = OpenDevNull(O_WRONLY);
  int pid = SpawnHelper("--bin", options_pipe.read_end, outcome_pipe.write_end,
                        null_fd);
  auto helper = kj::refcounted<HelperProcess>(
      pid, io.wrapOutputFd(options_pipe.write_end.release(), kAsyncFlags),
      io.wrapInputFd(outcome_pipe.read_end.release(), kAsyncFlags));
  helper->options_ = kj::heap<sandbox::ExecutionOptions>(options);
  return helper;
}

kj::Promise<sandbox::ExecutionInfo> HelperProcess::Wait() {
  KJ_REQUIRE(options_.get() != nullptr, "Wait() called twice");
  auto written = options_stream_->write(options_.get(), sizeof(*options_));
  return written
      .then([this]() {
        options_stream_ = nullptr;
        return outcome_stream_->readAllBytes();
      })
      .then([this](kj::Array<kj::byte> data) {
        outcome_stream_ = nullptr;
        options_ = nullptr;
        int status = Reap();
        if (data.size() < sizeof(size_t)) {
          if (WIFSIGNALED(status)) {
            KJ_FAIL_REQUIRE("Sandbox helper killed", WTERMSIG(status));
          }
          KJ_FAIL_REQUIRE("Sandbox helper failed", status);
        }
        return ParseHelperReply(data);
      })
      .attach(kj::addRef(*this));
}

void HelperProcess::Kill() {
  if (reaped_) return;
  if (kill(pid_, SIGKILL) == -1 && errno != ESRCH) {
    KJ_LOG(ERROR, "kill", pid_, strerror(errno));
  }
}

int HelperProcess::Reap() {
  if (!reaped_) {
    status_ = WaitForPid(pid_);
    reaped_ = true;
  }
  return status_;
}

HelperProcess::~HelperProcess() {
  if (!reaped_) {
    Kill();
    Reap();
  }
}

sandbox::ExecutionInfo HelperProcess::RunBlocking(
    const sandbox::ExecutionOptions& options) {
  Pipe options_pipe = MakePipe();
  Pipe outcome_pipe = MakePipe();
  kj::AutoCloseFd null_fd = OpenDevNull(O_WRONLY);
  int pid = SpawnHelper("--bin", options_pipe.read_end, outcome_pipe.write_end,
                        null_fd);
  options_pipe.read_end = nullptr;
  outcome_pipe.write_end = nullptr;
  kj::Vector<kj::byte> data;
  {
    KJ_DEFER(WaitForPid(pid));
    {
      kj::FdOutputStream out(kj::mv(options_pipe.write_end));
      out.write(&options, sizeof(options));
    }
    kj::FdInputStream in(kj::mv(outcome_pipe.read_end));
    kj::byte buf[4096];
    size_t n;
    while ((n = in.tryRead(buf, 1, sizeof(buf))) > 0) {
      data.addAll(buf, buf + n);
    }
  }
  return ParseHelperReply(data.asPtr());
}

kj::Promise<std::string> HelperProcess::ProbeIsolation(
    kj::LowLevelAsyncIoProvider& io) {
  Pipe error_pipe = MakePipe();
  kj::AutoCloseFd null_in = OpenDevNull(O_RDONLY);
  kj::AutoCloseFd null_out = OpenDevNull(O_WRONLY);
  int pid = SpawnHelper("--probe", null_in, null_out, error_pipe.write_end);
  error_pipe.write_end = nullptr;
  auto in = io.wrapInputFd(error_pipe.read_end.release(), kAsyncFlags);
  auto read = in->readAllText();
  return read.attach(kj::mv(in)).then([pid](kj::String text) -> std::string {
    int status = WaitForPid(pid);
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) return "";
    std::string reason(text.cStr());
    while (!reason.empty() && isspace(reason.back())) reason.pop_back();
    if (reason.empty()) reason = "namespaces are unavailable";
    return reason;
  });
}

}  // namespace runtime
