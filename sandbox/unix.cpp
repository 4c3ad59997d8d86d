#include "sandbox/unix.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Resident set size of a running process, from /proc.
int GetProcessMemoryUsage(pid_t pid, long long* memory_usage_kb) {
  int fd = open(("/proc/" + std::to_string(pid) + "/statm").c_str(),
                O_RDONLY | O_CLOEXEC);
  if (fd == -1) return fd;
  char buf[1024] = {};
  int num_read = 0;
  int cur = 0;
  do {
    cur = read(fd, buf + num_read, sizeof(buf) - 1 - num_read);
    if (cur < 0) {
      close(fd);
      return -1;
    }
    num_read += cur;
  } while (cur > 0 && num_read < static_cast<int>(sizeof(buf)) - 1);
  close(fd);
  long long size = 0;
  long long resident = 0;
  if (sscanf(buf, "%lld %lld", &size, &resident) != 2) return -1;
  *memory_usage_kb = resident * (sysconf(_SC_PAGESIZE) / 1024);
  return 0;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  // The child must not allocate memory: another thread may hold the allocator
  // lock while we fork.
  arg_storage_.clear();
  args_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  for (std::vector<char>& arg : arg_storage_) args_.push_back(arg.data());
  args_.push_back(nullptr);
  return OnSetup(error_msg);
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      ssize_t ignored = write(pipe_fds_[1], buf, len);
      (void)ignored;
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session: we do not receive Ctrl-Cs from the terminal, and the whole
  // group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = options_->stdin_fd;
  int stdout_fd = options_->stdout_fd;
  int stderr_fd = -1;
  if (options_->stdin_file != "") {
    stdin_fd = open(options_->stdin_file.c_str(), O_RDONLY);
    if (stdin_fd == -1) die("open", errno);
  } else if (stdin_fd == -1) {
    stdin_fd = open("/dev/null", O_RDONLY);
    if (stdin_fd == -1) die("open /dev/null", errno);
  }
  if (options_->stdout_file != "") {
    stdout_fd = creat(options_->stdout_file.c_str(), S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("creat", errno);
  }
  if (options_->stderr_file != "") {
    stderr_fd = creat(options_->stderr_file.c_str(), S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("creat", errno);
  }

  if (options_->root != "" && chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
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

  // Stack size: as large as allowed.
  struct rlimit rlim;
  if (getrlimit(RLIMIT_STACK, &rlim) == -1) die("getrlimit STACK", errno);
  rlim.rlim_cur = rlim.rlim_max;
  if (setrlimit(RLIMIT_STACK, &rlim) == -1) die("setrlim STACK", errno);

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }
  int count = 0;
  do {
    execv(args_[0], args_.data());
    usleep(100);
    // At most 16 retries: ETXTBSY only lasts while a sibling fork still holds
    // a freshly written executable open.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    ssize_t got = read(pipe_fds_[0], error, error_len);
    if (got < 0) got = 0;
    close(pipe_fds_[0]);
    waitpid(child_pid_, nullptr, 0);
    *error_msg = std::string(error, got);
    return false;
  }
  close(pipe_fds_[0]);

  std::atomic<long long> memory_usage{0};
  std::atomic<bool> done{false};
  std::thread memory_watcher(
      [&memory_usage, &done](int pid) {
        while (!done) {
          long long mem;
          if (GetProcessMemoryUsage(pid, &mem) == 0) {
            if (mem > memory_usage) memory_usage = mem;
          }
          std::this_thread::sleep_for(std::chrono::microseconds(500));
        }
      },
      child_pid_);

  auto program_start = std::chrono::high_resolution_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::high_resolution_clock::now() - program_start)
        .count();
  };

  auto stop_watcher = [&done, &memory_watcher]() {
    done = true;
    memory_watcher.join();
  };

  // TODO(veluca): wait4 is marked as obsolete and replaced by waitpid, but
  // waitpid does not return the resource usage of the child. Moreover,
  // getrusage() may not work for that purpose as other children may have exited
  // in the meantime.
  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (elapsed_millis() < options_->wall_limit_millis) {
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      kill(-child_pid_, SIGKILL);
      stop_watcher();
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  if (!has_exited) {
    if (options_->wall_limit_millis) {
      VLOG(1) << "Killing process group " << child_pid_ << " after "
              << elapsed_millis() << "ms";
      if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
        kill(child_pid_, SIGKILL);
      }
      info->killed = true;
    }
    int ret;
    while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
           errno == EINTR) {
    }
    if (ret != child_pid_) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      stop_watcher();
      return false;
    }
  }
  stop_watcher();
  info->wall_time_millis = elapsed_millis();
  // ru_maxrss is in kilobytes on Linux and catches peaks the watcher missed.
  info->memory_usage_kb = std::max<long long>(memory_usage, rusage.ru_maxrss);
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;

  OnFinish(info);
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
