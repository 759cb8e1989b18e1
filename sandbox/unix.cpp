#include "sandbox/unix.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
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
  long long pages = 0;
  if (sscanf(buf, "%lld", &pages) != 1) return -1;
  static const long page_kb = sysconf(_SC_PAGESIZE) / 1024;
  *memory_usage_kb = pages * page_kb;
  return 0;
}

// Moves everything that can be read from fd without blocking into capture.
// Returns false when the write end has been closed by every writer.
bool Drain(int fd, sandbox::OutputCapture* capture) {
  char buf[4096];
  while (true) {
    ssize_t amount = read(fd, buf, sizeof(buf));
    if (amount > 0) {
      capture->Append(buf, amount);
      continue;
    }
    if (amount == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    PLOG(WARNING) << "read";
    return false;
  }
}

void KillGroup(pid_t pgid) {
  if (kill(-pgid, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill " << -pgid;
  }
}

void CloseFd(int* fd) {
  if (*fd == -1) return;
  close(*fd);
  *fd = -1;
}

void AddString(const std::string& s, std::vector<std::vector<char>>* storage) {
  storage->emplace_back(s.begin(), s.end());
  storage->back().push_back(0);
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr int kPollIntervalMillis = 10;

Unix::~Unix() { CloseFds(); }

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  *info = ExecutionInfo();
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) {
    CloseFds();
    return false;
  }
  return Wait(info, error_msg);
}

void Unix::CloseFds() {
  CloseFd(&pipe_fds_[0]);
  CloseFd(&pipe_fds_[1]);
  CloseFd(&stdout_fds_[0]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[0]);
  CloseFd(&stderr_fds_[1]);
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  auto fail = [this, &buf, error_msg](const char* what) {
    *error_msg = what;
    *error_msg += ": ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    CloseFds();
    return false;
  };
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) return fail("pipe2");
  if (pipe2(stdout_fds_, O_CLOEXEC) == -1) return fail("pipe2");
  if (pipe2(stderr_fds_, O_CLOEXEC) == -1) return fail("pipe2");
  if (fcntl(stdout_fds_[0], F_SETFL, O_NONBLOCK) == -1 ||
      fcntl(stderr_fds_[0], F_SETFL, O_NONBLOCK) == -1) {
    return fail("fcntl");
  }

  arg_storage_.clear();
  args_.clear();
  AddString(options_->executable, &arg_storage_);
  for (const std::string& arg : options_->args) AddString(arg, &arg_storage_);
  for (std::vector<char>& arg : arg_storage_) args_.push_back(arg.data());
  args_.push_back(nullptr);

  env_storage_.clear();
  env_.clear();
  for (const std::string& var : options_->env) AddString(var, &env_storage_);
  for (std::vector<char>& var : env_storage_) env_.push_back(var.data());
  env_.push_back(nullptr);
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  } else {
    Child();
  }
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
      while (write(pipe_fds_[1], buf, len) == -1 && errno == EINTR) {
      }
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session: the child leads a process group that can be killed as a
  // whole, and does not receive Ctrl-Cs from the terminal.
  if (setsid() == -1) die("setsid", errno);

  // Signals blocked by the calling thread would be inherited.
  sigset_t empty_set;
  sigemptyset(&empty_set);
  if (sigprocmask(SIG_SETMASK, &empty_set, nullptr) == -1) {
    die("sigprocmask", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
  if (close(STDIN_FILENO) == -1 && errno != EBADF) die("close", errno);
#define DUP(field, fd)                          \
  {                                             \
    int ret = dup2(field##_fds_[1], fd);        \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim;
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

  SET_RLIM(AS, static_cast<rlim_t>(options_->memory_limit_kb) * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, static_cast<rlim_t>(options_->max_file_size_kb) * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(STACK, static_cast<rlim_t>(options_->max_stack_kb) * 1024);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  int count = 0;
  do {
    execve(options_->executable.c_str(), args_.data(), env_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  char errbuf[kStrErrorBufSize] = {};
  CloseFd(&pipe_fds_[1]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[1]);

  int error_len = 0;
  ssize_t header = 0;
  do {
    header = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (header == -1 && errno == EINTR);
  if (header == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    ssize_t amount = read(pipe_fds_[0], error, error_len);
    *error_msg = amount > 0 ? std::string(error, amount) : "child setup failed";
    int status = 0;
    while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
    }
    CloseFds();
    return false;
  }
  CloseFd(&pipe_fds_[0]);

  info->stdout_capture = OutputCapture(options_->max_output_bytes);
  info->stderr_capture = OutputCapture(options_->max_output_bytes);

  std::atomic<long long> memory_usage{0};
  std::atomic<bool> done{false};
  std::thread memory_watcher(
      [&memory_usage, &done](int pid) {
        while (!done) {
          long long mem;
          if (GetProcessMemoryUsage(pid, &mem) == 0) {
            if (mem > memory_usage) memory_usage = mem;
          }
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
      },
      child_pid_);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  struct pollfd fds[2] = {{stdout_fds_[0], POLLIN, 0},
                          {stderr_fds_[0], POLLIN, 0}};
  OutputCapture* captures[2] = {&info->stdout_capture, &info->stderr_capture};

  // The leader is only observed here, not reaped, so that its pid keeps
  // naming the process group until the group has been killed.
  while (true) {
    if (options_->wall_limit_millis &&
        elapsed_millis() >= options_->wall_limit_millis) {
      info->wall_limit_exceeded = true;
      break;
    }
    if (options_->memory_limit_kb &&
        memory_usage >= options_->memory_limit_kb) {
      info->memory_limit_exceeded = true;
      break;
    }
    if (options_->cancelled != nullptr && *options_->cancelled) {
      info->cancelled = true;
      break;
    }
    if (poll(fds, 2, kPollIntervalMillis) == -1 && errno != EINTR) {
      PLOG(WARNING) << "poll";
      std::this_thread::sleep_for(
          std::chrono::milliseconds(kPollIntervalMillis));
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd != -1 && fds[i].revents) {
        if (!Drain(fds[i].fd, captures[i])) fds[i].fd = -1;
      }
    }
    siginfo_t child_info = {};
    if (waitid(P_PID, child_pid_, &child_info, WEXITED | WNOHANG | WNOWAIT) ==
        -1) {
      if (errno == EINTR) continue;
      PLOG(ERROR) << "waitid " << child_pid_;
      break;
    }
    if (child_info.si_pid == child_pid_) break;
  }

  // Also takes care of descendants that outlived a normally exiting leader.
  KillGroup(child_pid_);

  // wait4 rather than waitpid, as only wait4 reports the resource usage.
  int child_status = 0;
  struct rusage rusage = {};
  pid_t waited = 0;
  do {
    waited = wait4(child_pid_, &child_status, 0, &rusage);
  } while (waited == -1 && errno == EINTR);
  done = true;
  memory_watcher.join();
  if (waited != child_pid_) {
    *error_msg = "wait4: ";
    *error_msg += mystrerror(errno, errbuf, kStrErrorBufSize);
    CloseFds();
    return false;
  }

  // Whatever is still buffered in the pipes.
  for (int i = 0; i < 2; i++) {
    if (fds[i].fd != -1) Drain(fds[i].fd, captures[i]);
  }

  info->memory_usage_kb = memory_usage;
  if (options_->memory_limit_kb &&
      info->memory_usage_kb >= options_->memory_limit_kb) {
    info->memory_limit_exceeded = true;
  }
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;

  CloseFds();
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
