#include "session/request.hpp"

#include <string>

#include <capnp/message.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using session::Request;
using session::Validate;

class RequestTest : public ::testing::Test {
 protected:
  RequestTest() : request_(message_.initRoot<capnproto::ExecutionRequest>()) {
    request_.setCode("print(2 + 2)");
  }

  bool Check() { return Validate(request_.asReader(), &validated_, &error_); }

  capnp::MallocMessageBuilder message_;
  capnproto::ExecutionRequest::Builder request_;
  Request validated_;
  std::string error_;
};

// NOLINTNEXTLINE
TEST_F(RequestTest, DefaultsToPython) {
  ASSERT_TRUE(Check()) << error_;
  EXPECT_EQ(validated_.code, "print(2 + 2)");
  EXPECT_EQ(validated_.language.kind, runtime::Language::Kind::PYTHON);
  EXPECT_TRUE(validated_.requirements.empty());
  EXPECT_TRUE(validated_.files.empty());
}

// NOLINTNEXTLINE
TEST_F(RequestTest, Node) {
  request_.setLanguage("node");
  ASSERT_TRUE(Check()) << error_;
  EXPECT_EQ(validated_.language.entry_file, "user_script.js");
}

// NOLINTNEXTLINE
TEST_F(RequestTest, MissingCode) {
  capnp::MallocMessageBuilder message;
  auto empty = message.initRoot<capnproto::ExecutionRequest>();
  EXPECT_FALSE(Validate(empty.asReader(), &validated_, &error_));
  EXPECT_THAT(error_, HasSubstr("code"));
}

// NOLINTNEXTLINE
TEST_F(RequestTest, CodeTooLarge) {
  std::string code(session::kMaxCodeBytes + 1, 'x');
  request_.setCode(code.c_str());
  EXPECT_FALSE(Check());
}

// NOLINTNEXTLINE
TEST_F(RequestTest, UnknownLanguage) {
  request_.setLanguage("ruby");
  EXPECT_FALSE(Check());
  EXPECT_THAT(error_, HasSubstr("'ruby'"));
}

// NOLINTNEXTLINE
TEST_F(RequestTest, Requirements) {
  auto requirements = request_.initRequirements(2);
  requirements.set(0, "numpy");
  requirements.set(1, "pandas==2.1.0");
  ASSERT_TRUE(Check()) << error_;
  EXPECT_THAT(validated_.requirements,
              ::testing::ElementsAre("numpy", "pandas==2.1.0"));
}

// NOLINTNEXTLINE
TEST_F(RequestTest, RequirementLooksLikeAnOption) {
  request_.initRequirements(1).set(0, "--index-url=http://evil");
  EXPECT_FALSE(Check());
  EXPECT_THAT(error_, HasSubstr("starts with '-'"));
}

// NOLINTNEXTLINE
TEST_F(RequestTest, RequirementWithWhitespace) {
  request_.initRequirements(1).set(0, "numpy pandas");
  EXPECT_FALSE(Check());
  request_.initRequirements(1).set(0, "");
  EXPECT_FALSE(Check());
}

// NOLINTNEXTLINE
TEST_F(RequestTest, TooManyRequirements) {
  auto requirements = request_.initRequirements(session::kMaxRequirements + 1);
  for (size_t i = 0; i < requirements.size(); i++) {
    requirements.set(i, ("pkg" + std::to_string(i)).c_str());
  }
  EXPECT_FALSE(Check());
}

// NOLINTNEXTLINE
TEST_F(RequestTest, FileUrls) {
  auto urls = request_.initFileUrls(2);
  urls.set(0, "https://example.com/data/sales.csv?version=2");
  urls.set(1, "HTTP://example.com/logo.png#top");
  ASSERT_TRUE(Check()) << error_;
  ASSERT_EQ(validated_.files.size(), 2u);
  EXPECT_EQ(validated_.files[0].name, "sales.csv");
  EXPECT_EQ(validated_.files[1].name, "logo.png");
}

// NOLINTNEXTLINE
TEST_F(RequestTest, FileUrlReplacingTheCode) {
  request_.initFileUrls(1).set(0, "https://example.com/user_script.py");
  EXPECT_FALSE(Check());
}

// NOLINTNEXTLINE
TEST_F(RequestTest, FileUrlsWithTheSameName) {
  auto urls = request_.initFileUrls(2);
  urls.set(0, "https://example.com/2023/data.csv");
  urls.set(1, "https://mirror.example.org/2024/data.csv?raw=1");
  EXPECT_FALSE(Check());
  EXPECT_THAT(error_, HasSubstr("data.csv"));
}

// NOLINTNEXTLINE
TEST(RemoteFileNameTest, Names) {
  EXPECT_EQ(session::RemoteFileName("https://example.com/a/b.txt"), "b.txt");
  EXPECT_EQ(session::RemoteFileName("http://example.com:8080/b.txt?x=/y"),
            "b.txt");
  EXPECT_EQ(session::RemoteFileName("ftp://example.com/b.txt"), "");
  EXPECT_EQ(session::RemoteFileName("file:///etc/passwd"), "");
  EXPECT_EQ(session::RemoteFileName("https://example.com"), "");
  EXPECT_EQ(session::RemoteFileName("https://example.com/"), "");
  EXPECT_EQ(session::RemoteFileName("https://example.com/dir/"), "");
  EXPECT_EQ(session::RemoteFileName("https://example.com/.."), "");
  EXPECT_EQ(session::RemoteFileName("https://example.com/.bashrc"), "");
  EXPECT_EQ(session::RemoteFileName("https:///b.txt"), "");
  EXPECT_EQ(session::RemoteFileName("https://example.com/a b.txt"), "");
  EXPECT_EQ(session::RemoteFileName("https://example.com/a\\b.txt"), "");
}

}  // namespace
