#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <sys/types.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/function.h>

namespace util {

static const constexpr uint32_t kChunkSize = 1024 * 1024;

class File {
 public:
  // A non-owning pointer to a sequence of bytes, usually representing a part of
  // a file.
  using Chunk = kj::ArrayPtr<const kj::byte>;

  // A ChunkReceiver is a function that should be called one or more times with
  // a valid Chunk. An empty Chunk represents EOF.
  using ChunkReceiver = kj::Function<void(Chunk)>;

  // Subsequent calls to this function produce consecutive Chunks from some
  // source. On EOF, an empty Chunk is returned.
  using ChunkProducer = kj::Function<Chunk()>;

  // Lists the regular files in a directory, oldest modification first (ties
  // are broken by path). Subdirectories are visited only if recursive is set.
  static std::vector<std::string> ListFiles(const std::string& path,
                                            bool recursive = true);

  // Reads the file specified by path in chunks, stopping after limit bytes.
  static ChunkProducer Read(
      const std::string& path,
      uint64_t limit = std::numeric_limits<uint64_t>::max());

  // Reads at most limit bytes of the file into a string.
  static std::string ReadString(
      const std::string& path,
      uint64_t limit = std::numeric_limits<uint64_t>::max());

  // Reads the last max_bytes bytes of the file into a string.
  static std::string ReadTail(const std::string& path, uint64_t max_bytes);

  // Returns a receiver that writes to the given file, the file ends when an
  // empty chunk is received, and finalizes the write when destroyed.
  static ChunkReceiver Write(const std::string& path, bool overwrite = false,
                             bool exist_ok = true);

  // Atomically replaces the content of path with content.
  static void WriteString(const std::string& path, const std::string& content);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Recursively changes the owner of a tree.
  static void ChangeOwner(const std::string& path, uid_t uid, gid_t gid);

  // Makes a tree readable and writable by every user.
  static void ShareTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Creates base/name, which must not exist yet.
  TempDir(const std::string& base, const std::string& name);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  // Removes the folder now. Calling it more than once has no effect.
  void Remove();

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    removed_ = other.removed_;
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
  bool removed_ = false;
};

}  // namespace util

#endif
