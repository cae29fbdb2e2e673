#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "sandbox/unix.hpp"

namespace {

const char* test_tmpdir = "/tmp/codebox_testdir";

using ::testing::AnyOf;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

using namespace sandbox;  // NOLINT

std::string ReadAll(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Copies a test program into dir, keeping it executable.
void CopyProgram(const std::string& name, const std::string& dir) {
  std::string target = dir + "/" + name;
  {
    std::ifstream in("sandbox/test/" + name, std::ios::binary);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out << in.rdbuf();
  }
  chmod(target.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

std::string AbsoluteTestDir() {
  char cwd[4096] = {};
  EXPECT_NE(getcwd(cwd, sizeof(cwd)), nullptr);
  return std::string(cwd) + "/sandbox/test";
}

class IsolationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::string error;
    if (!Unix::CanIsolate(&error)) {
      GTEST_SKIP() << "namespaces are not available: " << error;
    }
    mkdir(test_tmpdir, S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
    secret_ = std::string(test_tmpdir) + "/secret";
    std::ofstream(secret_) << "secret";
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_NE(listen_fd_, -1);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr),  // NOLINT
                   sizeof(addr)),
              0);
    ASSERT_EQ(listen(listen_fd_, 4), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr),  // NOLINT
                          &len),
              0);
    port_ = std::to_string(ntohs(addr.sin_port));
  }
  void TearDown() override {
    if (listen_fd_ != -1) close(listen_fd_);
  }

  std::string Inspect(bool isolate) {
    return Inspect(isolate, AbsoluteTestDir());
  }

  std::string Inspect(bool isolate, const std::string& root) {
    std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
    EXPECT_TRUE(sandbox);
    ExecutionOptions options(root, "./isolation_probe");
    options.SetArgs({secret_.c_str(), port_.c_str()});
    options.isolate_network = isolate;
    options.isolate_filesystem = isolate;
    std::string out = std::string(test_tmpdir) + "/inspect_out";
    ExecutionOptions::stringcpy(options.stdout_file, out);
    ExecutionInfo info;
    std::string error_msg;
    EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
    EXPECT_EQ(error_msg, "");
    EXPECT_EQ(info.status_code, 0);
    return ReadAll(out);
  }

  // Runs a shell command isolated in a fresh directory below test_tmpdir,
  // next to the secret, and returns its standard output.
  std::string Shell(const std::string& command) {
    std::string box = std::string(test_tmpdir) + "/box";
    mkdir(box.c_str(), S_IRWXU);
    chmod(box.c_str(), S_IRWXU | S_IRWXG | S_IRWXO);
    std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
    EXPECT_TRUE(sandbox);
    ExecutionOptions options(box, "/bin/sh");
    options.SetArgs({"-c", command.c_str()});
    options.AddEnv("PATH", "/usr/local/bin:/usr/bin:/bin");
    options.isolate_network = true;
    options.isolate_filesystem = true;
    std::string out = std::string(test_tmpdir) + "/shell_out";
    ExecutionOptions::stringcpy(options.stdout_file, out);
    ExecutionInfo info;
    std::string error_msg;
    EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
    EXPECT_EQ(error_msg, "");
    EXPECT_EQ(info.status_code, 0);
    return ReadAll(out);
  }

  std::string secret_;
  std::string port_;
  int listen_fd_ = -1;
};

// NOLINTNEXTLINE
TEST(UnixTest, TestNoDir) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("foo", "bar");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoFile) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "foo");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestReturnArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "return_arg1");
  options.SetArgs({"15"});
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_STREQ(info.message, "Non-zero return code");
}

// NOLINTNEXTLINE
TEST(UnixTest, TestSignalArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "signal_arg1");
  options.SetArgs({"6"});
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.wall_limit_exceeded);
  EXPECT_FALSE(info.memory_limit_exceeded);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWaitArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "wait_arg1");
  options.SetArgs({"1"});
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.wall_time_millis, 900);
  EXPECT_LE(info.wall_time_millis, 2000);
  EXPECT_LE(info.cpu_time_millis, 300);
  EXPECT_LE(info.sys_time_millis, 300);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestBusyWaitArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "busywait_arg1");
  options.SetArgs({"1"});
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 900);
  EXPECT_GE(info.wall_time_millis, 900);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMallocArg1) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "malloc_arg1");
  options.SetArgs({"40"});
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.memory_usage_kb, 40 * 1024);
  EXPECT_LE(info.memory_usage_kb, 60 * 1024);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMemoryLimitOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "malloc_arg1");
  options.SetArgs({"40"});
  options.memory_limit_kb = 100 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.memory_limit_exceeded);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMemoryLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "malloc_arg1");
  options.SetArgs({"200"});
  options.memory_limit_kb = 50 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_TRUE(info.killed);
  EXPECT_TRUE(info.memory_limit_exceeded);
  EXPECT_FALSE(info.wall_limit_exceeded);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestAddressSpaceLimit) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "malloc_arg1");
  options.SetArgs({"200"});
  options.address_space_kb = 100 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 1);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "wait_arg1");
  options.SetArgs({"1"});
  options.wall_limit_millis = 2000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.wall_time_millis, 900);
  EXPECT_LE(info.wall_time_millis, 1900);
  EXPECT_FALSE(info.wall_limit_exceeded);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "wait_arg1");
  options.SetArgs({"1"});
  options.wall_limit_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_TRUE(info.wall_limit_exceeded);
  EXPECT_GE(info.wall_time_millis, 100);
  EXPECT_LE(info.wall_time_millis, 800);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMemoryLimitOfDescendants) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(AbsoluteTestDir(), "/bin/sh");
  options.SetArgs({"-c", "/bin/sh -c './malloc_arg1 200'; echo survived"});
  options.memory_limit_kb = 50 * 1024;
  mkdir(test_tmpdir, S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  ExecutionOptions::stringcpy(options.stdout_file,
                              std::string(test_tmpdir) + "/descendants");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.memory_limit_exceeded);
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_GT(info.memory_usage_kb, 50 * 1024);
  EXPECT_THAT(ReadAll(options.stdout_file), Not(HasSubstr("survived")));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestCpuLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "busywait_arg1");
  options.SetArgs({"10"});
  options.cpu_limit_millis = 1000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_THAT(info.signal, AnyOf(Eq(SIGKILL), Eq(SIGXCPU)));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.wall_limit_exceeded);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 900);
  EXPECT_LE(info.cpu_time_millis + info.sys_time_millis, 2500);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestIORedirect) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "copy_int");
  mkdir(test_tmpdir, S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::string dir = test_tmpdir;
  ExecutionOptions::stringcpy(options.stdin_file, dir + "/in");
  ExecutionOptions::stringcpy(options.stdout_file, dir + "/out");
  ExecutionOptions::stringcpy(options.stderr_file, dir + "/err");
  std::ofstream(options.stdin_file) << "10";

  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(ReadAll(options.stdout_file), "10\n");
  EXPECT_EQ(ReadAll(options.stderr_file), "20\n");
}

// NOLINTNEXTLINE
TEST(UnixTest, TestEnvironmentIsNotInherited) {
  setenv("CODEBOX_TEST_SECRET", "hunter2", 1);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("sandbox/test", "print_env");
  options.AddEnv("HOME", "/nowhere");
  options.AddEnv("LANG", "C.UTF-8");
  mkdir(test_tmpdir, S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  ExecutionOptions::stringcpy(options.stdout_file,
                              std::string(test_tmpdir) + "/env");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 0);
  std::string out = ReadAll(options.stdout_file);
  EXPECT_THAT(out, HasSubstr("/sandbox/test\n"));
  EXPECT_THAT(out, HasSubstr("HOME=/nowhere\nLANG=C.UTF-8\n"));
  EXPECT_THAT(out, Not(HasSubstr("CODEBOX_TEST_SECRET")));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestTooManyEnvironmentVariables) {
  ExecutionOptions options("sandbox/test", "print_env");
  for (size_t i = 0; i < ExecutionOptions::nenv; i++) {
    options.AddEnv("VAR" + std::to_string(i), "x");
  }
  EXPECT_THROW(options.AddEnv("ONE_MORE", "x"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, TestWithoutIsolation) {
  std::string out = Inspect(false);
  EXPECT_THAT(out, HasSubstr("path visible\n"));
  EXPECT_THAT(out, HasSubstr("network up\n"));
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, TestIsolated) {
  std::string out = Inspect(true);
  EXPECT_THAT(out, HasSubstr("path hidden\n"));
  EXPECT_THAT(out, HasSubstr("network down\n"));
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, TestWorkspaceBelowHiddenDirectory) {
  std::string box = std::string(test_tmpdir) + "/box";
  mkdir(box.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
  CopyProgram("isolation_probe", box);
  std::string out = Inspect(true, box);
  EXPECT_THAT(out, HasSubstr("path hidden\n"));
  EXPECT_THAT(out, HasSubstr("network down\n"));
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, TestWorkspaceIsWritable) {
  std::string out = Shell("echo hi > note; cat note");
  EXPECT_EQ(out, "hi\n");
  EXPECT_EQ(ReadAll(std::string(test_tmpdir) + "/box/note"), "hi\n");
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, TestHostFilesHidden) {
  std::string out = Shell(
      "cat /etc/passwd; "
      "for p in /etc/shadow /home /root /var /srv /opt; do "
      "  [ -e $p ] && echo visible $p; "
      "done; "
      "touch /usr/x 2>/dev/null && echo usr writable; "
      "touch /newfile 2>/dev/null && echo root writable; "
      "echo end");
  EXPECT_THAT(out, Not(HasSubstr("root:x:0:0")));
  EXPECT_THAT(out, StartsWith("sandbox:x:"));
  EXPECT_THAT(out, Not(HasSubstr("visible")));
  EXPECT_THAT(out, Not(HasSubstr("writable")));
  EXPECT_THAT(out, HasSubstr("end\n"));
}

// NOLINTNEXTLINE
TEST_F(IsolationTest, TestOwnProcessNamespace) {
  std::string out = Shell(
      "echo $$; "
      "[ -e /proc/" + std::to_string(getpid()) + " ] && echo parent visible; "
      "echo end");
  EXPECT_EQ(out, "2\nend\n");
}

}  // namespace
