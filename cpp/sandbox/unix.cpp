#include "sandbox/unix.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <grp.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <kj/debug.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

struct ProcStat {
  pid_t pid = 0;
  pid_t ppid = 0;
  pid_t session = 0;
  int64_t rss_pages = 0;
};

// Parent, session and resident set size of pid, from /proc/pid/stat.
bool ReadProcStat(pid_t pid, ProcStat* stat) {
  char path[64] = {};
  snprintf(path, sizeof(path), "/proc/%d/stat", pid);  // NOLINT
  int fd = open(path, O_RDONLY | O_CLOEXEC);
  if (fd == -1) return false;
  char buf[1024] = {};
  ssize_t num_read = read(fd, buf, sizeof(buf) - 1);
  close(fd);
  if (num_read <= 0) return false;
  // The command name may contain anything, fields restart after its ')'.
  const char* fields = strrchr(buf, ')');
  if (fields == nullptr) return false;
  char state = 0;
  stat->pid = pid;
  // NOLINTNEXTLINE
  return sscanf(fields + 1,
                " %c %d %*d %d %*s %*s %*s %*s %*s %*s %*s %*s %*s %*s %*s "
                "%*s %*s %*s %*s %*s %*s %" SCNd64,
                &state, &stat->ppid, &stat->session, &stat->rss_pages) == 4;
}

// Resident memory of root together with every process it spawned: its
// descendants and whatever stayed in its session.
int64_t TreeMemoryUsageKb(pid_t root) {
  DIR* proc = opendir("/proc");
  if (proc == nullptr) return 0;
  std::vector<ProcStat> stats;
  while (dirent* entry = readdir(proc)) {
    if (!isdigit(static_cast<unsigned char>(entry->d_name[0]))) continue;
    ProcStat stat;
    if (ReadProcStat(atoi(entry->d_name), &stat)) stats.push_back(stat);
  }
  closedir(proc);

  std::unordered_map<pid_t, std::vector<const ProcStat*>> children;
  std::vector<const ProcStat*> pending;
  for (const ProcStat& stat : stats) {
    children[stat.ppid].push_back(&stat);
    if (stat.pid == root || stat.session == root) pending.push_back(&stat);
  }
  std::unordered_set<pid_t> counted;
  int64_t pages = 0;
  while (!pending.empty()) {
    const ProcStat* stat = pending.back();
    pending.pop_back();
    if (!counted.insert(stat->pid).second) continue;
    pages += stat->rss_pages;
    auto it = children.find(stat->pid);
    if (it == children.end()) continue;
    pending.insert(pending.end(), it->second.begin(), it->second.end());
  }
  return pages * (sysconf(_SC_PAGESIZE) / 1024);
}

// The functions below run in the forked child: no dynamic memory allocation.
// They return 0 on success or an errno value, and set *step to the name of
// the failing operation.

const constexpr size_t kPathLen = sandbox::ExecutionOptions::str_len + 64;

int WriteProcFile(const char* path, const char* content) {
  int fd = open(path, O_WRONLY | O_CLOEXEC);
  if (fd == -1) return errno;
  ssize_t len = strlen(content);  // NOLINT
  if (write(fd, content, len) != len) {
    int err = errno != 0 ? errno : EIO;
    close(fd);
    return err;
  }
  close(fd);
  return 0;
}

int WriteFile(const char* path, const char* content) {
  int fd = open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd == -1) return errno;
  close(fd);
  return WriteProcFile(path, content);
}

// Creates an empty file to mount something on.
int Touch(const char* path) {
  int fd = open(path, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) return errno;
  close(fd);
  return 0;
}

int MakeDirs(const char* path) {
  char buf[kPathLen] = {};
  strncpy(buf, path, sizeof(buf) - 1);  // NOLINT
  for (char* p = buf + 1; *p; p++) {
    if (*p != '/') continue;
    *p = '\0';
    if (mkdir(buf, 0755) == -1 && errno != EEXIST) return errno;
    *p = '/';
  }
  if (mkdir(buf, 0755) == -1 && errno != EEXIST) return errno;
  return 0;
}

// Enters new network and mount namespaces, and a pid namespace for the
// children, as requested. Without root privileges a user namespace is needed
// as well, in which the current identity is kept.
int CreateNamespaces(bool network, bool filesystem, const char** step) {
  uid_t uid = geteuid();
  gid_t gid = getegid();
  int flags = 0;
  if (network) flags |= CLONE_NEWNET;
  if (filesystem) flags |= CLONE_NEWNS | CLONE_NEWPID;
  if (uid != 0) flags |= CLONE_NEWUSER;
  *step = "unshare";
  if (unshare(flags) == -1) return errno;
  if (uid == 0) return 0;
  char map[64] = {};
  *step = "setgroups";
  int err = WriteProcFile("/proc/self/setgroups", "deny");
  if (err != 0) return err;
  *step = "uid_map";
  snprintf(map, sizeof(map), "%u %u 1\n", uid, uid);  // NOLINT
  err = WriteProcFile("/proc/self/uid_map", map);
  if (err != 0) return err;
  *step = "gid_map";
  snprintf(map, sizeof(map), "%u %u 1\n", gid, gid);  // NOLINT
  return WriteProcFile("/proc/self/gid_map", map);
}

// Mount point of the new root while it is assembled. Whatever it covers
// stays reachable from the descriptors opened before.
const char* const kStagingDir = "/tmp";

// Host directories visible, read-only, in the new root.
const char* const kSystemDirs[] = {"/usr",   "/bin",   "/sbin",  "/lib",
                                   "/lib32", "/lib64", "/libx32"};

// Entries of the host /etc needed by the dynamic loader, name resolution,
// TLS and time zones.
const char* const kEtcEntries[] = {
    "ld.so.cache", "ld.so.conf",      "ld.so.conf.d", "nsswitch.conf",
    "resolv.conf", "hosts",           "host.conf",    "gai.conf",
    "protocols",   "services",        "localtime",    "timezone",
    "ssl",         "ca-certificates", "pki",          "alternatives",
    "mime.types"};

const char* const kDevices[] = {"null", "zero", "full", "random", "urandom"};

const char* const kDevLinks[][2] = {{"fd", "/proc/self/fd"},
                                    {"stdin", "/proc/self/fd/0"},
                                    {"stdout", "/proc/self/fd/1"},
                                    {"stderr", "/proc/self/fd/2"}};

// Binds source on target. A read-only remount has to repeat the flags of the
// source mount, which may be locked in a user namespace.
int BindMount(const char* source, const char* target, bool read_only) {
  if (mount(source, target, nullptr, MS_BIND | MS_REC, nullptr) == -1)
    return errno;
  if (!read_only) return 0;
  struct statvfs vfs {};
  if (statvfs(target, &vfs) == -1) return errno;
  unsigned long flags = MS_REMOUNT | MS_BIND | MS_RDONLY;  // NOLINT
  if (vfs.f_flag & ST_NOSUID) flags |= MS_NOSUID;
  if (vfs.f_flag & ST_NODEV) flags |= MS_NODEV;
  if (vfs.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
  if (vfs.f_flag & ST_NOATIME) flags |= MS_NOATIME;
  if (vfs.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
  if (vfs.f_flag & ST_RELATIME) flags |= MS_RELATIME;
  if (mount(nullptr, target, nullptr, flags, nullptr) == -1) return errno;
  return 0;
}

int MountTmpfs(const char* target, const char* mount_options) {
  if (mkdir(target, 0755) == -1 && errno != EEXIST) return errno;
  if (mount("tmpfs", target, "tmpfs", MS_NOSUID | MS_NODEV,
            mount_options) == -1)
    return errno;
  return 0;
}

// Fills the staging tmpfs: system directories, a minimal /etc and /dev,
// fresh /tmp and /proc, and the workspace (root_fd) at its host path.
int AssembleRoot(const char* root, int root_fd, int uid, int gid,
                 const char** step) {
  char source[kPathLen] = {};
  char target[kPathLen] = {};
  struct stat st {};
  for (const char* dir : kSystemDirs) {
    if (lstat(dir, &st) == -1) continue;
    snprintf(target, sizeof(target), "%s%s", kStagingDir, dir);  // NOLINT
    if (S_ISLNK(st.st_mode)) {
      char link[PATH_MAX] = {};
      *step = "readlink";
      if (readlink(dir, link, sizeof(link) - 1) == -1) return errno;
      *step = "symlink";
      if (symlink(link, target) == -1) return errno;
      continue;
    }
    if (!S_ISDIR(st.st_mode)) continue;
    *step = "mkdir";
    if (mkdir(target, 0755) == -1) return errno;
    *step = "bind system directory";
    int err = BindMount(dir, target, true);
    if (err != 0) return err;
  }

  snprintf(target, sizeof(target), "%s/etc", kStagingDir);  // NOLINT
  *step = "mkdir";
  if (mkdir(target, 0755) == -1) return errno;
  for (const char* entry : kEtcEntries) {
    snprintf(source, sizeof(source), "/etc/%s", entry);  // NOLINT
    if (stat(source, &st) == -1) continue;
    snprintf(target, sizeof(target), "%s/etc/%s", kStagingDir, entry);  // NOLINT
    *step = "bind /etc";
    int err = 0;
    if (S_ISDIR(st.st_mode)) {
      if (mkdir(target, 0755) == -1) err = errno;
    } else {
      err = Touch(target);
    }
    if (err == 0) err = BindMount(source, target, true);
    if (err != 0) return err;
  }
  // The only account the code can see is its own.
  char line[kPathLen] = {};
  *step = "write /etc/passwd";
  snprintf(line, sizeof(line), "sandbox:x:%d:%d:sandbox:%s:/bin/sh\n",  // NOLINT
           uid, gid, root);
  snprintf(target, sizeof(target), "%s/etc/passwd", kStagingDir);  // NOLINT
  int err = WriteFile(target, line);
  if (err != 0) return err;
  *step = "write /etc/group";
  snprintf(line, sizeof(line), "sandbox:x:%d:\n", gid);  // NOLINT
  snprintf(target, sizeof(target), "%s/etc/group", kStagingDir);  // NOLINT
  err = WriteFile(target, line);
  if (err != 0) return err;

  snprintf(target, sizeof(target), "%s/dev", kStagingDir);  // NOLINT
  *step = "mount /dev";
  if (mkdir(target, 0755) == -1) return errno;
  if (mount("tmpfs", target, "tmpfs", MS_NOSUID | MS_NOEXEC,
            "mode=0755,size=64k") == -1)
    return errno;
  for (const char* device : kDevices) {
    snprintf(source, sizeof(source), "/dev/%s", device);  // NOLINT
    snprintf(target, sizeof(target), "%s/dev/%s", kStagingDir,  // NOLINT
             device);
    *step = "bind device";
    err = Touch(target);
    if (err == 0) err = BindMount(source, target, false);
    if (err != 0) return err;
  }
  for (const auto& link : kDevLinks) {
    snprintf(target, sizeof(target), "%s/dev/%s", kStagingDir,  // NOLINT
             link[0]);
    *step = "symlink";
    if (symlink(link[1], target) == -1) return errno;
  }
  snprintf(target, sizeof(target), "%s/dev/shm", kStagingDir);  // NOLINT
  *step = "mount /dev/shm";
  err = MountTmpfs(target, "mode=1777,size=64m");
  if (err != 0) return err;

  // Before the workspace, which may live under /tmp.
  snprintf(target, sizeof(target), "%s/tmp", kStagingDir);  // NOLINT
  *step = "mount /tmp";
  err = MountTmpfs(target, "mode=1777,size=64m");
  if (err != 0) return err;

  // Only a process of the new pid namespace sees its own processes here.
  snprintf(target, sizeof(target), "%s/proc", kStagingDir);  // NOLINT
  *step = "mount /proc";
  if (mkdir(target, 0555) == -1) return errno;
  if (mount("proc", target, "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC,
            nullptr) == -1)
    return errno;

  snprintf(target, sizeof(target), "%s%s", kStagingDir, root);  // NOLINT
  *step = "mkdir";
  err = MakeDirs(target);
  if (err != 0) return err;
  // root_fd belongs to this mount namespace: it can be bound even if a
  // mount above now covers its path.
  snprintf(source, sizeof(source), "/proc/self/fd/%d", root_fd);  // NOLINT
  *step = "bind workspace";
  return BindMount(source, target, false);
}

// Makes the staging tmpfs the root, drops the host root and makes the new
// one read-only. Only the mounts on top of it stay writable.
int PivotRoot(const char** step) {
  *step = "chdir";
  if (chdir(kStagingDir) == -1) return errno;
  *step = "mkdir";
  if (mkdir(".old_root", 0700) == -1) return errno;
  *step = "pivot_root";
  if (syscall(SYS_pivot_root, ".", ".old_root") == -1) return errno;
  *step = "chdir";
  if (chdir("/") == -1) return errno;
  *step = "umount old root";
  if (umount2("/.old_root", MNT_DETACH) == -1) return errno;
  if (rmdir("/.old_root") == -1) return errno;
  *step = "remount root";
  if (mount(nullptr, "/", nullptr,
            MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV,
            nullptr) == -1)
    return errno;
  return 0;
}

// Replaces the root of the current mount namespace with a minimal tree where
// the only writable host directory is root, an absolute canonical path.
int BuildRoot(const char* root, int uid, int gid, const char** step) {
  *step = "mount private";
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1)
    return errno;
  *step = "open root";
  int root_fd = open(root, O_PATH | O_DIRECTORY | O_CLOEXEC);
  if (root_fd == -1) return errno;
  *step = "mount staging tmpfs";
  int err = 0;
  if (mount("tmpfs", kStagingDir, "tmpfs", MS_NOSUID | MS_NODEV,
            "mode=0755,size=16m") == -1)
    err = errno;
  if (err == 0) err = AssembleRoot(root, root_fd, uid, gid, step);
  close(root_fd);
  if (err != 0) return err;
  return PivotRoot(step);
}

// First process of the pid namespace: reaps every orphan until the main
// process exits, then reports its wait status on status_fd. The whole
// namespace is killed when it exits.
[[noreturn]] void Reap(pid_t main_pid, int status_fd) {
  while (true) {
    int status = 0;
    pid_t pid = waitpid(-1, &status, 0);
    if (pid == -1 && errno == EINTR) continue;
    if (pid == -1) _exit(1);
    if (pid != main_pid) continue;
    if (write(status_fd, &status, sizeof(status)) != sizeof(status)) _exit(1);
    _exit(0);
  }
}

// Parent of the pid namespace: waits for its first process and ends the same
// way the main process did.
[[noreturn]] void Monitor(pid_t init_pid, int status_fd) {
  int status = 0;
  while (waitpid(init_pid, &status, 0) == -1) {
    if (errno != EINTR) _exit(1);
  }
  int main_status = 0;
  if (read(status_fd, &main_status, sizeof(main_status)) ==
      sizeof(main_status)) {
    status = main_status;
  }
  if (WIFSIGNALED(status)) {
    int sig = WTERMSIG(status);
    struct rlimit no_core {};
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, sig);
    if (setrlimit(RLIMIT_CORE, &no_core) == 0 &&
        signal(sig, SIG_DFL) != SIG_ERR &&
        sigprocmask(SIG_UNBLOCK, &set, nullptr) == 0) {
      kill(getpid(), sig);
    }
    _exit(128 + sig);
  }
  _exit(WIFEXITED(status) ? WEXITSTATUS(status) : 1);
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::CanIsolate(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  // Below /tmp, like the workspaces: the staging mount covers it.
  char dir[] = "/tmp/codebox-isolation-XXXXXX";
  if (mkdtemp(dir) == nullptr) {
    *error_msg = "mkdtemp: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  int step_fds[2] = {};
  if (pipe2(step_fds, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    rmdir(dir);
    return false;
  }
  int pid = fork();
  if (pid == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    close(step_fds[0]);
    close(step_fds[1]);
    rmdir(dir);
    return false;
  }
  if (pid == 0) {
    close(step_fds[0]);
    const char* step = nullptr;
    int err = CreateNamespaces(true, true, &step);
    if (err == 0) {
      step = "fork";
      int init_pid = fork();
      if (init_pid == -1) err = errno;
      if (init_pid == 0) {
        err = BuildRoot(dir, geteuid(), getegid(), &step);
        if (err == 0) {
          step = "access workspace";
          if (access(dir, R_OK | W_OK | X_OK) == -1) err = errno;
        }
        if (err != 0 && write(step_fds[1], step, strlen(step)) == -1) {
          _exit(EIO);
        }
        _exit(err);
      }
      int status = 0;
      while (init_pid > 0 && waitpid(init_pid, &status, 0) == -1) {
        if (errno != EINTR) {
          err = errno;
          break;
        }
      }
      if (err == 0) err = WIFEXITED(status) ? WEXITSTATUS(status) : ECHILD;
      _exit(err);
    }
    if (write(step_fds[1], step, strlen(step)) == -1) _exit(EIO);
    _exit(err);
  }
  close(step_fds[1]);
  int status = 0;
  bool reaped = waitpid(pid, &status, 0) == pid;
  char step[128] = {};
  ssize_t step_len = read(step_fds[0], step, sizeof(step) - 1);
  close(step_fds[0]);
  rmdir(dir);
  if (!reaped) {
    *error_msg = "waitpid failed";
    return false;
  }
  if (!WIFEXITED(status)) {
    *error_msg = "isolation check terminated abnormally";
    return false;
  }
  if (WEXITSTATUS(status) != 0) {
    *error_msg = step_len > 0 ? step : "namespaces";
    *error_msg += ": ";
    *error_msg += mystrerror(WEXITSTATUS(status), buf,  // NOLINT
                             kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  options_ = &options;
  std::string reason;
  if ((options.isolate_network || options.isolate_filesystem) &&
      !options.require_isolation && !CanIsolate(&reason)) {
    relaxed_.reset(new ExecutionOptions(options));
    relaxed_->isolate_network = false;
    relaxed_->isolate_filesystem = false;
    options_ = relaxed_.get();
  }
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  // The new root mirrors the workspace at its canonical path. A missing
  // directory is reported by the child.
  if (realpath(options_->root, root_path_) == nullptr) {
    strncpy(root_path_, options_->root, sizeof(root_path_) - 1);  // NOLINT
  }
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  parent_pid_ = getpid();
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    if (write(pipe_fds_[1], &len, sizeof(len)) != sizeof(len) ||
        write(pipe_fds_[1], buf, len) != len) {
      _Exit(2);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // New session and process group, so that the whole group can be killed.
  if (setsid() == -1) die("setsid", errno);

  // The output files live outside root, open them before hiding anything.
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  stdin_fd = open(options_->stdin_file[0] ? options_->stdin_file : "/dev/null",
                  O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open", errno);
  if (options_->stdout_file[0]) {
    stdout_fd =
        open(options_->stdout_file, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
             S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open", errno);
  }
  if (options_->stderr_file[0]) {
    stderr_fd =
        open(options_->stderr_file, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
             S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open", errno);
  }

  if (options_->isolate_network || options_->isolate_filesystem) {
    const char* step = nullptr;
    int err = CreateNamespaces(options_->isolate_network,
                               options_->isolate_filesystem, &step);
    if (err != 0) die(step, err);
  }

  if (options_->isolate_filesystem) {
    // This process stays outside the new pid namespace, the next one is its
    // first process and the one after runs the program.
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);
    if (getppid() != parent_pid_) _Exit(1);
    int status_fds[2] = {};
    if (pipe2(status_fds, O_CLOEXEC) == -1) die("pipe2", errno);  // NOLINT
    int init_pid = fork();
    if (init_pid == -1) die("fork", errno);
    if (init_pid != 0) {
      close(pipe_fds_[1]);
      close(status_fds[1]);
      Monitor(init_pid, status_fds[0]);
    }
    close(status_fds[0]);
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);
    bool drop = geteuid() == 0 && options_->uid >= 0 && options_->gid >= 0;
    const char* step = nullptr;
    int err = BuildRoot(root_path_, drop ? options_->uid : geteuid(),
                        drop ? options_->gid : getegid(), &step);
    if (err != 0) die(step, err);
    int main_pid = fork();
    if (main_pid == -1) die("fork", errno);
    if (main_pid != 0) {
      close(pipe_fds_[1]);
      Reap(main_pid, status_fds[1]);
    }
    close(status_fds[1]);
  }

  if (chdir(root_path_) == -1) {
    die("chdir", errno);
  }

  decltype(options_->args) args = {};
  memcpy(args, options_->args, sizeof(args));
  char* argsp[ExecutionOptions::narg + 1] = {};
  size_t narg = 0;
  // NOLINTNEXTLINE
  for (size_t i = 0; i < ExecutionOptions::narg; i++) {
    if (!args[i][0]) break;
    argsp[narg++] = &args[i][0];
  }

  decltype(options_->env) env = {};
  memcpy(env, options_->env, sizeof(env));
  char* envp[ExecutionOptions::nenv + 1] = {};
  size_t nenv = 0;
  // NOLINTNEXTLINE
  for (size_t i = 0; i < ExecutionOptions::nenv; i++) {
    if (!env[i][0]) break;
    envp[nenv++] = &env[i][0];
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->address_space_kb * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
  SET_RLIM(CORE, 0);
  SET_RLIM(STACK, options_->max_stack_kb ? options_->max_stack_kb * 1024
                                         : RLIM_INFINITY);
#undef SET_RLIM

  if (options_->nice != 0 && setpriority(PRIO_PROCESS, 0, options_->nice) == -1)
    die("setpriority", errno);

  if (geteuid() == 0 && options_->uid >= 0 && options_->gid >= 0) {
    if (setgroups(0, nullptr) == -1) die("setgroups", errno);
    if (setgid(options_->gid) == -1) die("setgid", errno);
    if (setuid(options_->uid) == -1) die("setuid", errno);
  }
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) die("prctl", errno);
  // Changing credentials clears the parent death signal: set it last.
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);
  // Inside a pid namespace the parent is its first process, which takes the
  // namespace down with it.
  if (!options_->isolate_filesystem && getppid() != parent_pid_) _Exit(1);

  execve(options_->executable, argsp, envp);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  ssize_t error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    KJ_SYSCALL(read(pipe_fds_[0], error, error_len), "Failed to read from fd");
    close(pipe_fds_[0]);
    waitpid(child_pid_, nullptr, 0);
    *error_msg = error;
    return false;
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  int child_status = 0;
  bool has_exited = false;
  int64_t memory_usage = 0;
  struct rusage rusage {};
  while (true) {
    if (options_->wall_limit_millis &&
        elapsed_millis() >= options_->wall_limit_millis) {
      info->wall_limit_exceeded = true;
      break;
    }
    int64_t mem = TreeMemoryUsageKb(child_pid_);
    if (mem > memory_usage) memory_usage = mem;
    if (options_->memory_limit_kb != 0 &&
        memory_usage > options_->memory_limit_kb) {
      info->memory_limit_exceeded = true;
      break;
    }
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!has_exited) {
    // The child leads its own process group: kill everything it spawned.
    if (kill(-child_pid_, SIGKILL) == -1 && kill(child_pid_, SIGKILL) == -1) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "kill: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
      return false;
    }
    if (wait4(child_pid_, &child_status, 0, &rusage) != child_pid_) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
      return false;
    }
  }
  // Leftover processes of the group must not outlive the execution.
  kill(-child_pid_, SIGKILL);
  info->memory_usage_kb = std::max<int64_t>(memory_usage, rusage.ru_maxrss);
  // A peak between two polls.
  if (options_->memory_limit_kb != 0 &&
      info->memory_usage_kb > options_->memory_limit_kb) {
    info->memory_limit_exceeded = true;
  }
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->killed = info->signal == SIGKILL || info->signal == SIGXCPU;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  if (info->signal != 0) {
    strncpy(info->message, strsignal(info->signal),  // NOLINT
            sizeof(info->message) - 1);
  } else if (info->status_code != 0) {
    strncpy(info->message, "Non-zero return code",  // NOLINT
            sizeof(info->message) - 1);
  }
  return true;
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
