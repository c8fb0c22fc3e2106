#include "util/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadBufSize = 64 * 1024;

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrorString(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  return std::string(prefix) + ": " + mystrerror(err, buf, kStrErrorBufSize);
}

// Writes to a pipe whose reader went away must not kill the whole server.
void IgnoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

bool SetFlag(int fd, int cmd_get, int cmd_set, int flag) {
  int flags = fcntl(fd, cmd_get);
  if (flags == -1) return false;
  return fcntl(fd, cmd_set, flags | flag) != -1;
}

// The descriptors are created close-on-exec atomically: other threads may
// fork at any time.
bool MakePipe(int fds[2], std::string* error_msg) {
  if (pipe2(fds, O_CLOEXEC) == -1) {
    *error_msg = ErrorString("pipe2", errno);
    return false;
  }
  return true;
}

void CloseFd(int* fd) {
  if (*fd != -1) close(*fd);
  *fd = -1;
}

// Function that is executed in the child process. Only async-signal-safe
// calls are allowed here, as the parent may be multithreaded.
[[noreturn]] void Child(char* const* argv, const char* cwd, int stdin_fd,
                        int stdout_fd, int stderr_fd, int error_fd) {
  auto die = [error_fd](const char* prefix, int err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    char errbuf[kStrErrorBufSize] = {};
    strncat(buf, prefix, 64);                                         // NOLINT
    strncat(buf, ": ", 3);                                            // NOLINT
    strncat(buf, mystrerror(err, errbuf, kStrErrorBufSize),           // NOLINT
            kStrErrorBufSize);
    ssize_t len = strlen(buf);  // NOLINT
    if (write(error_fd, &len, sizeof(len)) == sizeof(len)) {
      ssize_t ignored = write(error_fd, buf, len);
      (void)ignored;
    }
    _Exit(127);
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  struct sigaction sa {};
  sa.sa_handler = SIG_DFL;
  if (sigaction(SIGPIPE, &sa, nullptr) == -1) die("sigaction", errno);
  sigset_t empty;
  sigemptyset(&empty);
  if (sigprocmask(SIG_SETMASK, &empty, nullptr) == -1)
    die("sigprocmask", errno);

  if (dup2(stdin_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fd, STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fd, STDERR_FILENO) == -1) die("redir stderr", errno);

  if (cwd[0] && chdir(cwd) == -1) die("chdir", errno);

  execvp(argv[0], argv);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(127);
}

}  // namespace

namespace util {

bool Process::Run(const ProcessOptions& options, ProcessInfo* info,
                  std::string* error_msg) {
  if (options.args.empty()) {
    *error_msg = "exec: empty command";
    return false;
  }
  IgnoreSigpipe();

  // Everything the child needs is allocated before forking.
  std::vector<std::vector<char>> args;
  for (const std::string& s : options.args) {
    std::vector<char> arg(s.begin(), s.end());
    arg.push_back('\0');
    args.push_back(std::move(arg));
  }
  std::vector<char*> argv(args.size() + 1);
  for (size_t i = 0; i < args.size(); i++) argv[i] = args[i].data();
  argv.back() = nullptr;
  const char* cwd = options.cwd.c_str();

  int stdin_pipe[2];
  int stdout_pipe[2];
  int stderr_pipe[2];
  int error_pipe[2];
  if (!MakePipe(stdin_pipe, error_msg)) return false;
  if (!MakePipe(stdout_pipe, error_msg)) {
    close(stdin_pipe[0]);
    close(stdin_pipe[1]);
    return false;
  }
  if (!MakePipe(stderr_pipe, error_msg)) {
    for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0],
                   stdout_pipe[1]})
      close(fd);
    return false;
  }
  if (!MakePipe(error_pipe, error_msg)) {
    for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0],
                   stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]})
      close(fd);
    return false;
  }

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  pid_t child_pid = fork();
  if (child_pid == -1) {
    *error_msg = ErrorString("fork", errno);
    for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0],
                   stdout_pipe[1], stderr_pipe[0], stderr_pipe[1],
                   error_pipe[0], error_pipe[1]})
      close(fd);
    return false;
  }
  if (child_pid == 0) {
    Child(argv.data(), cwd, stdin_pipe[0], stdout_pipe[1], stderr_pipe[1],
          error_pipe[1]);
  }

  close(stdin_pipe[0]);
  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  close(error_pipe[1]);

  auto wait_child = [child_pid](int* child_status) {
    while (waitpid(child_pid, child_status, 0) == -1) {
      if (errno != EINTR) return false;
    }
    return true;
  };

  // The error pipe is closed by exec on success, otherwise it carries the
  // reason why the child could not start.
  ssize_t error_len = 0;
  ssize_t num_read = 0;
  do {
    num_read = read(error_pipe[0], &error_len, sizeof(error_len));
  } while (num_read == -1 && errno == EINTR);
  if (num_read == sizeof(error_len)) {
    char error[kStrErrorBufSize + 128] = {};
    error_len = std::min<ssize_t>(error_len, sizeof(error) - 1);
    ssize_t got = read(error_pipe[0], error, error_len);
    *error_msg = got > 0 ? std::string(error, got) : "exec: unknown error";
    close(error_pipe[0]);
    close(stdin_pipe[1]);
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);
    int child_status = 0;
    wait_child(&child_status);
    return false;
  }
  close(error_pipe[0]);

  int in_fd = stdin_pipe[1];
  int out_fd = stdout_pipe[0];
  int err_fd = stderr_pipe[0];
  size_t stdin_written = 0;
  if (options.stdin_data.empty() ||
      !SetFlag(in_fd, F_GETFL, F_SETFL, O_NONBLOCK)) {
    CloseFd(&in_fd);
  }

  info->stdout_data.clear();
  info->stderr_data.clear();
  info->killed = false;
  info->output_truncated = false;
  std::vector<char> buf(kReadBufSize);

  while (out_fd != -1 || err_fd != -1) {
    int timeout = -1;
    if (options.wall_limit_millis != 0) {
      int64_t remaining = options.wall_limit_millis - elapsed_millis();
      if (remaining <= 0) {
        kill(-child_pid, SIGKILL);
        kill(child_pid, SIGKILL);
        info->killed = true;
        break;
      }
      timeout = static_cast<int>(std::min<int64_t>(remaining, 1000));
    }

    struct pollfd fds[3] = {};
    int* owners[3] = {};
    nfds_t nfds = 0;
    if (in_fd != -1) {
      fds[nfds] = {in_fd, POLLOUT, 0};
      owners[nfds++] = &in_fd;
    }
    if (out_fd != -1) {
      fds[nfds] = {out_fd, POLLIN, 0};
      owners[nfds++] = &out_fd;
    }
    if (err_fd != -1) {
      fds[nfds] = {err_fd, POLLIN, 0};
      owners[nfds++] = &err_fd;
    }

    int ret = poll(fds, nfds, timeout);
    if (ret == -1) {
      if (errno == EINTR) continue;
      *error_msg = ErrorString("poll", errno);
      kill(-child_pid, SIGKILL);
      kill(child_pid, SIGKILL);
      CloseFd(&in_fd);
      CloseFd(&out_fd);
      CloseFd(&err_fd);
      int child_status = 0;
      wait_child(&child_status);
      return false;
    }

    for (nfds_t i = 0; i < nfds; i++) {
      if (fds[i].revents == 0) continue;
      int* fd = owners[i];
      if (fd == &in_fd) {
        size_t left = options.stdin_data.size() - stdin_written;
        ssize_t written =
            write(in_fd, options.stdin_data.data() + stdin_written,
                  std::min(left, kReadBufSize));
        if (written > 0) {
          stdin_written += written;
          if (stdin_written == options.stdin_data.size()) CloseFd(&in_fd);
        } else if (written == -1 && errno != EAGAIN && errno != EINTR) {
          // The child closed its standard input.
          CloseFd(&in_fd);
        }
        continue;
      }
      std::string* dest =
          fd == &out_fd ? &info->stdout_data : &info->stderr_data;
      ssize_t amount = read(*fd, buf.data(), buf.size());
      if (amount > 0) {
        // Past the cap the pipe is still drained, so the child never blocks.
        size_t keep = amount;
        if (options.max_output_bytes > 0) {
          size_t room = dest->size() < options.max_output_bytes
                            ? options.max_output_bytes - dest->size()
                            : 0;
          if (room < keep) {
            keep = room;
            info->output_truncated = true;
          }
        }
        dest->append(buf.data(), keep);
      } else if (amount == 0 || (errno != EAGAIN && errno != EINTR)) {
        CloseFd(fd);
      }
    }
  }
  CloseFd(&in_fd);
  CloseFd(&out_fd);
  CloseFd(&err_fd);

  int child_status = 0;
  if (!wait_child(&child_status)) {
    *error_msg = ErrorString("waitpid", errno);
    return false;
  }

  info->wall_time_millis = elapsed_millis();
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  if (info->killed) {
    info->message = "Wall limit exceeded";
  } else if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  } else {
    info->message.clear();
  }
  return true;
}

}  // namespace util
