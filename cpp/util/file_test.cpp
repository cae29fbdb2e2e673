#include "util/file.hpp"
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/time.h>
#include <unistd.h>
#include <array>
#include <cstdio>
#include <fstream>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::StartsWith;
using ::testing::UnorderedElementsAreArray;

const std::string test_tmpdir = "/tmp/codebox_testdir";

int unlink_cb(const char* fpath, const struct stat* /*unused*/, int /*unused*/,
              struct FTW* /*unused*/) {
  int rv = remove(fpath);
  if (rv) perror(fpath);
  return rv;
}

int rmrf(const char* path) {
  return nftw(path, unlink_cb, 64, FTW_DEPTH | FTW_PHYS);
}

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

void writeFile(util::File::ChunkReceiver* receiver,
               const std::string& content) {
  auto data = reinterpret_cast<const kj::byte*>(content.data());  // NOLINT
  size_t written = 0;
  while (written < content.size()) {
    size_t size = std::min(content.size() - written,
                           static_cast<size_t>(util::kChunkSize));
    util::File::Chunk chunk(data + written, size);
    (*receiver)(chunk);
    written += size;
  }
  (*receiver)(util::File::Chunk());
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

std::string readFile(util::File::ChunkProducer* producer) {
  util::File::Chunk chunk;
  std::string content;
  while ((chunk = (*producer)()).size()) {
    content += std::string(chunk.asChars().begin(), chunk.size());
  }
  return content;
}

bool fileExists(const std::string& path) {
  auto file = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (file < 0) return false;
  close(file);
  return true;
}

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

std::string makeTestDir(const std::string& name) {
  mkdir(test_tmpdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::string testdir = test_tmpdir + "/" + name;
  rmrf(testdir.c_str());
  mkdir(testdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  return testdir;
}

/*
 * ListFiles
 */

// NOLINTNEXTLINE
TEST(File, ListFiles) {
  std::string testdir = makeTestDir("list_files");
  std::vector<std::string> files;
  for (auto name : {"file42", "file12", "file68"}) {
    files.push_back(testdir + "/" + name);
  }

  for (const auto& file : files) {
    writeFile(file, "fooo");
  }
  chdir("/");
  auto foundFiles = util::File::ListFiles(testdir);
  EXPECT_THAT(files, UnorderedElementsAreArray(foundFiles));
}

// NOLINTNEXTLINE
TEST(File, ListFilesOldestFirst) {
  std::string testdir = makeTestDir("list_files");
  std::array<std::string, 3> names = {"c", "a", "b"};
  for (size_t i = 0; i < names.size(); i++) {
    std::string path = testdir + "/" + names[i];
    writeFile(path, "x");
    struct timeval times[2] = {{1000, 0}, {1000 + static_cast<time_t>(i), 0}};
    utimes(path.c_str(), times);
  }
  // Same modification time as "a": ordered by path.
  writeFile(testdir + "/0", "x");
  struct timeval times[2] = {{1001, 0}, {1001, 0}};
  utimes((testdir + "/0").c_str(), times);
  EXPECT_THAT(util::File::ListFiles(testdir),
              ElementsAre(testdir + "/c", testdir + "/0", testdir + "/a",
                          testdir + "/b"));
}

// NOLINTNEXTLINE
TEST(File, ListFilesNotRecursive) {
  std::string testdir = makeTestDir("list_files");
  writeFile(testdir + "/top", "x");
  mkdir((testdir + "/sub").c_str(), S_IRWXU);
  writeFile(testdir + "/sub/inner", "x");
  symlink("/etc/passwd", (testdir + "/link").c_str());
  EXPECT_THAT(util::File::ListFiles(testdir, false),
              ElementsAre(testdir + "/top"));
  EXPECT_THAT(util::File::ListFiles(testdir, true),
              UnorderedElementsAreArray(
                  {testdir + "/top", testdir + "/sub/inner"}));
}

// NOLINTNEXTLINE
TEST(File, ListFilesEmpty) {
  std::string testdir = makeTestDir("list_files");
  chdir("/");
  auto foundFiles = util::File::ListFiles(testdir);
  EXPECT_THAT(foundFiles, IsEmpty());
}

// NOLINTNEXTLINE
TEST(File, ListFilesNoSuchDir) {
  std::string testdir = test_tmpdir + "/lolnope/ahah";
  chdir("/");
  auto foundFiles = util::File::ListFiles(testdir);
  EXPECT_THAT(foundFiles, IsEmpty());
}

/*
 * Read
 */

// NOLINTNEXTLINE
TEST(File, Read) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  std::string content = "lallabalalla\n";
  writeFile(filepath, content);
  auto reader = util::File::Read(filepath);
  std::string realContent = readFile(&reader);
  EXPECT_EQ(content, realContent);
}

// NOLINTNEXTLINE
TEST(File, ReadBigFile) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/bigfile";
  std::string content(util::kChunkSize * 2 + 1, 'x');

  writeFile(filepath, content);
  auto reader = util::File::Read(filepath);
  std::string realContent = readFile(&reader);
  EXPECT_EQ(content, realContent);
}

// NOLINTNEXTLINE
TEST(File, ReadNoSuchFile) {
  std::string filepath = "/no/such/file";
  EXPECT_THROW(util::File::Read(filepath), std::system_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST(File, ReadSymlink) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/link";
  symlink("/etc/passwd", filepath.c_str());
  EXPECT_THROW(util::File::Read(filepath), std::system_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST(File, ReadString) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "lallabalalla\n");
  EXPECT_EQ(util::File::ReadString(filepath), "lallabalalla\n");
  EXPECT_EQ(util::File::ReadString(filepath, 5), "lalla");
  EXPECT_EQ(util::File::ReadString(filepath, 0), "");
}

// NOLINTNEXTLINE
TEST(File, ReadStringBigFileLimit) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/bigfile";
  writeFile(filepath, std::string(util::kChunkSize * 2 + 1, 'x'));
  EXPECT_EQ(util::File::ReadString(filepath, util::kChunkSize + 3).size(),
            util::kChunkSize + 3);
}

/*
 * ReadTail
 */

// NOLINTNEXTLINE
TEST(File, ReadTail) {
  std::string testdir = makeTestDir("readtail");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "first\nsecond\nthird\n");
  EXPECT_EQ(util::File::ReadTail(filepath, 6), "third\n");
  EXPECT_EQ(util::File::ReadTail(filepath, 1000), "first\nsecond\nthird\n");
  EXPECT_EQ(util::File::ReadTail(filepath, 0), "");
}

// NOLINTNEXTLINE
TEST(File, ReadTailNoSuchFile) {
  std::string testdir = makeTestDir("readtail");
  EXPECT_THROW(util::File::ReadTail(testdir + "/nope", 10),  // NOLINT
               std::system_error);
}

/*
 * Write
 */

// NOLINTNEXTLINE
TEST(File, Write) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content = "wowowow\n";
  {
    auto writer = util::File::Write(filepath);
    writeFile(&writer, content);
  }
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteBigFile) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/bigfile";
  std::string content(util::kChunkSize * 2 + 1, 'x');
  {
    auto writer = util::File::Write(filepath);
    writeFile(&writer, content);
  }
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteNotOverwrite) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content{"alsdasdl"};
  writeFile(filepath, content);
  {
    auto writer = util::File::Write(filepath, false);
    writeFile(&writer, "this should not be written");
  }
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteOverwrite) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content{"alsdasdl"};
  writeFile(filepath, "this should not be here");
  {
    auto writer = util::File::Write(filepath, true);
    writeFile(&writer, content);
  }
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteExistsNotOk) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content{"this should stay here"};
  writeFile(filepath, content);
  EXPECT_THROW(util::File::Write(filepath, false, false),  // NOLINT
               std::system_error);
  ASSERT_EQ(content, readFile(filepath));
}

/*
 * WriteString
 */

// NOLINTNEXTLINE
TEST(File, WriteString) {
  std::string testdir = makeTestDir("writestring");
  std::string filepath = testdir + "/new/dir/file";
  util::File::WriteString(filepath, "first");
  EXPECT_EQ(readFile(filepath), "first");
  util::File::WriteString(filepath, "");
  EXPECT_EQ(readFile(filepath), "");
  EXPECT_THAT(util::File::ListFiles(testdir + "/new/dir"),
              ElementsAre(filepath));
}

/*
 * MakeDirs
 */

// NOLINTNEXTLINE
TEST(File, MakeDirs) {
  std::string testdir = makeTestDir("makeDirs");
  std::string dirpath = testdir + "/wow/such/dir";
  EXPECT_FALSE(dirExists(dirpath));
  util::File::MakeDirs(dirpath);
  EXPECT_TRUE(dirExists(dirpath));
}

// NOLINTNEXTLINE
TEST(File, MakeDirsCannot) {
  std::string testdir = makeTestDir("makeDirs");
  std::string dirpath1 = testdir + "/nope";
  mkdir(dirpath1.c_str(), 0);
  std::string dirpath = dirpath1 + "/wow/such/dir";
  EXPECT_THROW(util::File::MakeDirs(dirpath), std::system_error);  // NOLINT
}

/*
 * Remove
 */

// NOLINTNEXTLINE
TEST(File, Remove) {
  std::string testdir = makeTestDir("remove");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "holaa");
  util::File::Remove(filepath);
  EXPECT_FALSE(fileExists(filepath));
}

// NOLINTNEXTLINE
TEST(File, RemoveNoSuchFile) {
  std::string testdir = makeTestDir("remove");
  std::string filepath = testdir + "/file";
  EXPECT_THROW(util::File::Remove(filepath), std::system_error);  // NOLINT
}

/*
 * RemoveTree
 */

// NOLINTNEXTLINE
TEST(File, RemoveTree) {
  std::string testdir = makeTestDir("removetree");
  std::string dirpath = testdir + "/dir";
  std::string dirpath2 = dirpath + "/baz";
  mkdir(dirpath.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  mkdir(dirpath2.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::array<std::string, 3> files = {dirpath + "/foo", dirpath + "/bar",
                                      dirpath2 + "/buz"};
  for (const auto& file : files) writeFile(file, "holaa");
  util::File::RemoveTree(dirpath);
  for (const auto& file : files) EXPECT_FALSE(fileExists(file));
  EXPECT_FALSE(dirExists(dirpath));
  EXPECT_FALSE(dirExists(dirpath2));
}

// NOLINTNEXTLINE
TEST(File, RemoveTreeNoSuchFile) {
  std::string testdir = makeTestDir("removetree");
  std::string dirpath = testdir + "/nope/noo";
  EXPECT_THROW(util::File::RemoveTree(dirpath), std::system_error);  // NOLINT
}

/*
 * ShareTree
 */

// NOLINTNEXTLINE
TEST(File, ShareTree) {
  std::string testdir = makeTestDir("sharetree");
  std::string dirpath = testdir + "/dir";
  mkdir(dirpath.c_str(), S_IRWXU);
  writeFile(dirpath + "/file", "foo");
  util::File::ShareTree(dirpath);
  struct stat dirStat {};
  struct stat fileStat {};
  ASSERT_NE(stat(dirpath.c_str(), &dirStat), -1);
  ASSERT_NE(stat((dirpath + "/file").c_str(), &fileStat), -1);
  EXPECT_EQ(dirStat.st_mode & 0777, 0777u);
  EXPECT_EQ(fileStat.st_mode & 0777, 0666u);
}

/*
 * JoinPath
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a/b", "c/d"), "a/b/c/d");
}

// NOLINTNEXTLINE
TEST(File, JoinPathFirstAbs) {
  EXPECT_EQ(util::File::JoinPath("/a/b", "c/d"), "/a/b/c/d");
}

// NOLINTNEXTLINE
TEST(File, JoinPathSecondAbs) {
  EXPECT_EQ(util::File::JoinPath("/a/b", "/c/d"), "/c/d");
}

/*
 * BaseDir
 */

// NOLINTNEXTLINE
TEST(File, BaseDir) { EXPECT_EQ(util::File::BaseDir("a/b/c"), "a/b"); }

// NOLINTNEXTLINE
TEST(File, BaseDirSingleFile) { EXPECT_EQ(util::File::BaseDir("a"), ""); }

/*
 * BaseName
 */

// NOLINTNEXTLINE
TEST(File, BaseName) { EXPECT_EQ(util::File::BaseName("a/b/c"), "c"); }

// NOLINTNEXTLINE
TEST(File, BaseNameSingleFile) { EXPECT_EQ(util::File::BaseName("a"), "a"); }

/*
 * Size
 */

// NOLINTNEXTLINE
TEST(File, Size) {
  std::string testdir = makeTestDir("size");
  std::string filepath = testdir + "/file";
  std::string content = "foobar";
  writeFile(filepath, content);
  EXPECT_EQ(util::File::Size(filepath), content.size());
}

// NOLINTNEXTLINE
TEST(File, SizeEmpty) {
  std::string testdir = makeTestDir("size");
  std::string filepath = testdir + "/file";
  std::string content;
  writeFile(filepath, content);
  EXPECT_EQ(util::File::Size(filepath), content.size());
}

// NOLINTNEXTLINE
TEST(File, SizeNoSuchFile) {
  std::string testdir = makeTestDir("size");
  std::string filepath = testdir + "/nope/nono";
  EXPECT_LT(util::File::Size(filepath), 0);
}

/*
 * Exists
 */

// NOLINTNEXTLINE
TEST(File, Exists) {
  std::string testdir = makeTestDir("size");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "foobar");
  EXPECT_TRUE(util::File::Exists(filepath));
}

// NOLINTNEXTLINE
TEST(File, ExistsNoSuchFile) {
  std::string testdir = makeTestDir("size");
  std::string filepath = testdir + "/nope";
  EXPECT_FALSE(util::File::Exists(filepath));
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(TempDir, TempDir) {
  std::string testdir = makeTestDir("tempdir");
  std::string tempdirPath;
  {
    util::TempDir tempdir(testdir);
    tempdirPath = tempdir.Path();
    EXPECT_TRUE(dirExists(tempdirPath));
    EXPECT_THAT(tempdir.Path(), StartsWith(testdir));
  }
  EXPECT_FALSE(dirExists(tempdirPath));
}

// NOLINTNEXTLINE
TEST(TempDir, TempDirKeep) {
  std::string testdir = makeTestDir("tempdir");
  std::string tempdirPath;
  {
    util::TempDir tempdir(testdir);
    tempdir.Keep();
    tempdirPath = tempdir.Path();
    EXPECT_TRUE(dirExists(tempdirPath));
    EXPECT_THAT(tempdir.Path(), StartsWith(testdir));
  }
  EXPECT_TRUE(dirExists(tempdirPath));
}

// NOLINTNEXTLINE
TEST(TempDir, TempDirMove) {
  std::string testdir = makeTestDir("tempdir");
  std::string tempdirPath;
  {
    util::TempDir tempdir(testdir);
    tempdirPath = tempdir.Path();
    EXPECT_TRUE(dirExists(tempdirPath));
    {
      util::TempDir other = std::move(tempdir);
      EXPECT_TRUE(dirExists(tempdirPath));
    }
    EXPECT_FALSE(dirExists(tempdirPath));
  }
}

// NOLINTNEXTLINE
TEST(TempDir, TempDirNamed) {
  std::string testdir = makeTestDir("tempdir");
  {
    util::TempDir tempdir(testdir, "session");
    EXPECT_EQ(tempdir.Path(), testdir + "/session");
    EXPECT_TRUE(dirExists(tempdir.Path()));
    EXPECT_THROW(util::TempDir(testdir, "session"),  // NOLINT
                 std::system_error);
  }
  EXPECT_FALSE(dirExists(testdir + "/session"));
}

// NOLINTNEXTLINE
TEST(TempDir, TempDirRemove) {
  std::string testdir = makeTestDir("tempdir");
  util::TempDir tempdir(testdir);
  writeFile(tempdir.Path() + "/file", "foo");
  tempdir.Remove();
  EXPECT_FALSE(dirExists(tempdir.Path()));
  tempdir.Remove();
}

}  // namespace
