#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <system_error>
#include <tuple>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

thread_local std::vector<std::tuple<int64_t, int64_t, std::string>> files;
thread_local bool list_recursive = true;

std::vector<std::string> OsListFiles(const std::string& path, bool recursive) {
  list_recursive = recursive;
  KJ_ASSERT(nftw(path.c_str(),
                 [](const char* fpath, const struct stat* sb, int typeflags,
                    struct FTW* ftwbuf) {
                   if (typeflags == FTW_D && ftwbuf->level > 0 &&
                       !list_recursive) {
                     return FTW_SKIP_SUBTREE;
                   }
                   if (typeflags != FTW_F) return FTW_CONTINUE;
                   files.emplace_back(sb->st_mtim.tv_sec, sb->st_mtim.tv_nsec,
                                      fpath);
                   return FTW_CONTINUE;
                 },
                 64, FTW_PHYS | FTW_MOUNT | FTW_ACTIONRETVAL) != -1,
            path, strerror(errno));
  std::sort(files.begin(), files.end());
  std::vector<std::string> ret;
  ret.reserve(files.size());
  for (auto& f : files) ret.push_back(std::move(std::get<2>(f)));
  files.clear();
  return ret;
};

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

thread_local uid_t chown_uid = 0;
thread_local gid_t chown_gid = 0;

bool OsChangeOwner(const std::string& path, uid_t uid, gid_t gid) {
  chown_uid = uid;
  chown_gid = gid;
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) {
                return lchown(fpath, chown_uid, chown_gid);
              },
              64, FTW_PHYS | FTW_MOUNT) != -1;
}

bool OsShareTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) {
                if (typeflags == FTW_D) return chmod(fpath, 0777);
                if (typeflags == FTW_F) return chmod(fpath, 0666);
                return 0;
              },
              64, FTW_PHYS | FTW_MOUNT) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  char data[max_path_len];
  data[0] = 0;
  strncat(data, tmp->c_str(), max_path_len - 1);  // NOLINT
  int fd = mkostemp(data, O_CLOEXEC);             // NOLINT
  *tmp = data;                                    // NOLINT
  return kj::AutoCloseFd(fd);
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false, bool exist_ok = true) {
  // This may not have the desired effect if src is a symlink.
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    if (!exist_ok || errno != EEXIST) return errno;
    return 0;
  }
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

util::File::ChunkProducer OsRead(const std::string& path, uint64_t limit) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY | O_NOFOLLOW)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::unique_ptr<uint64_t> alreadyRead = std::make_unique<uint64_t>(0);
  std::unique_ptr<std::array<kj::byte, util::kChunkSize>> buf =
      std::make_unique<std::array<kj::byte, util::kChunkSize>>();
  return [fd = std::move(fd), path, alreadyRead = std::move(alreadyRead), limit,
          buf = std::move(buf)]() mutable {
    if (fd.get() == -1) return util::File::Chunk();
    ssize_t amount;
    uint64_t toRead = util::kChunkSize;
    if (*alreadyRead + toRead > limit) toRead = limit - *alreadyRead;
    if (toRead == 0) return util::File::Chunk();
    while ((amount = read(fd, buf->data(), toRead))) {  // NOLINT
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      *alreadyRead += amount;
      return util::File::Chunk(buf->data(), amount);
    }
    if (amount == -1) {
      fd = nullptr;
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    return util::File::Chunk();
  };
}

util::File::ChunkReceiver OsWrite(const std::string& path, bool overwrite,
                                  bool exist_ok) {
  std::string temp_file;
  auto fd = OsTempFile(path, &temp_file);

  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  auto done = kj::heap<bool>();
  auto pos = kj::heap<size_t>();
  auto finalize = [done = done.get(), pos = pos.get(), temp_file]() {
    if (!*done) {
      kj::UnwindDetector detector;
      detector.catchExceptionsIfUnwinding(
          [temp_file]() { util::File::Remove(temp_file); });
      if (*pos > 0) {
        KJ_LOG(WARNING, "File never finalized!");
      }
    }
  };
  return [fd = std::move(fd), temp_file, path, overwrite, exist_ok,
          done = std::move(done), pos = std::move(pos),
          _ = kj::defer(std::move(finalize))](util::File::Chunk chunk) mutable {
    if (fd.get() == -1) return;
    if (chunk.size() == 0) {
      *done = true;
      if (fsync(fd) == -1 ||
          OsAtomicMove(temp_file, path, overwrite, exist_ok)) {
        throw std::system_error(errno, std::system_category(), "Write " + path);
      }
      fd = kj::AutoCloseFd();
      return;
    }
    *pos = 0;
    while (*pos < chunk.size()) {
      ssize_t written = write(fd, chunk.begin() + *pos,  // NOLINT
                              chunk.size() - *pos);
      if (written == -1 && errno == EINTR) continue;
      if (written == -1) {
        fd = nullptr;
        throw std::system_error(errno, std::system_category(),
                                "write " + temp_file);
      }
      *pos += written;
    }
  };
}

}  // namespace

namespace util {
std::vector<std::string> File::ListFiles(const std::string& path,
                                         bool recursive) {
  MakeDirs(path);
  return OsListFiles(path, recursive);
}

File::ChunkProducer File::Read(const std::string& path, uint64_t limit) {
  return OsRead(path, limit);
}

std::string File::ReadString(const std::string& path, uint64_t limit) {
  std::string content;
  auto producer = Read(path, limit);
  Chunk chunk;
  while ((chunk = producer()).size()) {
    content.append(chunk.asChars().begin(), chunk.size());
  }
  return content;
}

std::string File::ReadTail(const std::string& path, uint64_t max_bytes) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY | O_NOFOLLOW)};
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  struct stat st {};
  if (fstat(fd, &st) == -1) {
    throw std::system_error(errno, std::system_category(), "stat " + path);
  }
  uint64_t size = st.st_size;
  off_t start = size > max_bytes ? size - max_bytes : 0;
  std::string content(size - start, '\0');
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t amount =
        pread(fd, &content[pos], content.size() - pos, start + pos);  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    if (amount == 0) break;
    pos += amount;
  }
  content.resize(pos);
  return content;
}

File::ChunkReceiver File::Write(const std::string& path, bool overwrite,
                                bool exist_ok) {
  MakeDirs(BaseDir(path));
  KJ_ASSERT(!(overwrite && !exist_ok));
  if (!overwrite && Size(path) >= 0) {
    if (exist_ok) return [](Chunk chunk) {};
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  return OsWrite(path, overwrite, exist_ok);
}

void File::WriteString(const std::string& path, const std::string& content) {
  auto receiver = Write(path, /*overwrite=*/true);
  if (!content.empty()) {
    receiver(Chunk(reinterpret_cast<const kj::byte*>(content.data()),  // NOLINT
                   content.size()));
  }
  receiver(Chunk());
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove");
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

void File::ChangeOwner(const std::string& path, uid_t uid, gid_t gid) {
  if (!OsChangeOwner(path, uid, gid)) {
    throw std::system_error(errno, std::system_category(), "chown " + path);
  }
}

void File::ShareTree(const std::string& path) {
  if (!OsShareTree(path)) {
    throw std::system_error(errno, std::system_category(), "chmod " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}

TempDir::TempDir(const std::string& base, const std::string& name) {
  File::MakeDirs(base);
  std::string path = File::JoinPath(base, name);
  if (mkdir(path.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) == -1) {
    throw std::system_error(errno, std::system_category(), "mkdir " + path);
  }
  path_ = std::move(path);
}

void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }

void TempDir::Remove() {
  if (keep_ || moved_ || removed_) return;
  removed_ = true;
  File::RemoveTree(path_);
}

TempDir::~TempDir() {  // NOLINT
  if (!keep_ && !moved_ && !removed_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
