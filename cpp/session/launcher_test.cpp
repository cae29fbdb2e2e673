#include "session/launcher.hpp"

#include <csignal>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "session/installer.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;
using capnproto::ErrorKind;
using runtime::Language;
using runtime::StageOutcome;
using session::Classify;

Language Python() {
  KJ_IF_MAYBE(language, Language::FromName("python")) { return *language; }
  KJ_FAIL_ASSERT("python not supported");
}

Language Node() {
  KJ_IF_MAYBE(language, Language::FromName("node")) { return *language; }
  KJ_FAIL_ASSERT("node not supported");
}

// NOLINTNEXTLINE
TEST(ClassifyTest, Success) {
  StageOutcome outcome;
  EXPECT_EQ(Classify(outcome, Python(), ""), ErrorKind::NONE);
}

// NOLINTNEXTLINE
TEST(ClassifyTest, NonZeroExit) {
  StageOutcome outcome;
  outcome.exit_code = 1;
  EXPECT_EQ(Classify(outcome, Python(), "ZeroDivisionError: division by zero\n"),
            ErrorKind::RUNTIME_FAILURE);
}

// NOLINTNEXTLINE
TEST(ClassifyTest, Signal) {
  StageOutcome outcome;
  outcome.signal = SIGSEGV;
  EXPECT_EQ(Classify(outcome, Python(), ""), ErrorKind::RUNTIME_FAILURE);
  outcome.signal = SIGXCPU;
  EXPECT_EQ(Classify(outcome, Python(), ""), ErrorKind::RESOURCE_EXCEEDED);
}

// NOLINTNEXTLINE
TEST(ClassifyTest, TimeoutWinsOverEverything) {
  StageOutcome outcome;
  outcome.timed_out = true;
  outcome.memory_exceeded = true;
  outcome.signal = SIGKILL;
  EXPECT_EQ(Classify(outcome, Python(), ""), ErrorKind::TIMED_OUT);
}

// NOLINTNEXTLINE
TEST(ClassifyTest, MemoryWatcher) {
  StageOutcome outcome;
  outcome.memory_exceeded = true;
  outcome.signal = SIGKILL;
  EXPECT_EQ(Classify(outcome, Node(), ""), ErrorKind::RESOURCE_EXCEEDED);
}

// NOLINTNEXTLINE
TEST(ClassifyTest, InterpreterOutOfMemory) {
  StageOutcome outcome;
  outcome.exit_code = 1;
  EXPECT_EQ(Classify(outcome, Python(),
                     "Traceback (most recent call last):\n"
                     "  File \"user_script.py\", line 1, in <module>\n"
                     "MemoryError\n"),
            ErrorKind::RESOURCE_EXCEEDED);
  outcome.exit_code = 0;
  outcome.signal = SIGABRT;
  EXPECT_EQ(Classify(outcome, Node(),
                     "FATAL ERROR: Reached heap limit Allocation failed - "
                     "JavaScript heap out of memory\n"
                     " 1: 0xb7a940 node::Abort() [node]\n"),
            ErrorKind::RESOURCE_EXCEEDED);
}

// NOLINTNEXTLINE
TEST(ClassifyTest, MarkerOfTheOtherLanguage) {
  StageOutcome outcome;
  outcome.exit_code = 1;
  EXPECT_EQ(Classify(outcome, Node(), "MemoryError\n"),
            ErrorKind::RUNTIME_FAILURE);
}

// NOLINTNEXTLINE
TEST(ReportsOutOfMemoryTest, Lines) {
  EXPECT_TRUE(session::ReportsOutOfMemory("MemoryError: x\n", "MemoryError"));
  EXPECT_TRUE(session::ReportsOutOfMemory("a\nMemoryError\r\n", "MemoryError"));
  EXPECT_FALSE(session::ReportsOutOfMemory("print('MemoryError is bad')\n",
                                           "MemoryError"));
  EXPECT_FALSE(session::ReportsOutOfMemory("anything", ""));
}

// NOLINTNEXTLINE
TEST(InstallNoticeTest, ExitCode) {
  StageOutcome outcome;
  outcome.exit_code = 1;
  std::string notice = session::InstallNotice(
      "pip", outcome, 120000,
      "ERROR: No matching distribution found for bogus");
  EXPECT_THAT(notice, StartsWith("[install] pip failed with exit code 1\n"));
  EXPECT_THAT(notice, HasSubstr("No matching distribution found for bogus\n"));
}

// NOLINTNEXTLINE
TEST(InstallNoticeTest, Timeout) {
  StageOutcome outcome;
  outcome.timed_out = true;
  EXPECT_EQ(session::InstallNotice("npm", outcome, 120000, ""),
            "[install] npm failed: timed out after 120 s\n");
}

}  // namespace
