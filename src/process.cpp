/**
 * @file process.cpp
 * @brief Child process execution implementation
 *
 * @details fork + execvp with three pipes:
 *
 *          - stdout and stderr of the child
 *
 *          - a close-on-exec status pipe: it closes silently when exec
 *            succeeds, or carries errno when exec fails
 *
 * @note Everything the child touches between fork and exec is prepared before
 *       fork; the child only calls async-signal-safe functions.
 */

#include "smart_cut/process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace smart_cut {

namespace {

constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(10);

/// Pipe pair closed on scope exit
struct Pipe {
  int fds[2] = {-1, -1};

  bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
  int read_end() const { return fds[0]; }
  int write_end() const { return fds[1]; }

  void close_read() {
    if (fds[0] >= 0) {
      close(fds[0]);
      fds[0] = -1;
    }
  }
  void close_write() {
    if (fds[1] >= 0) {
      close(fds[1]);
      fds[1] = -1;
    }
  }

  ~Pipe() {
    close_read();
    close_write();
  }
};

/// Drain whatever is readable; false once the fd hits EOF or fails
bool drain(int fd, std::string &out) {
  char buf[4096];
  for (;;) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<size_t>(n));
      if (static_cast<size_t>(n) < sizeof(buf))
        return true;
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

int exit_code_of(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

int wait_child(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      return -1;
  }
  return exit_code_of(status);
}

/// Reap the child if it exits before the deadline; false if still running
bool wait_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline,
                      int &exit_code) {
  for (;;) {
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      exit_code = exit_code_of(status);
      return true;
    }
    if (r == -1) {
      if (errno == EINTR)
        continue;
      exit_code = -1;
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(REAP_POLL_INTERVAL);
  }
}

bool needs_quoting(const std::string &arg) {
  if (arg.empty())
    return true;
  for (char c : arg) {
    if (c == ' ' || c == '\'' || c == '"' || c == ';' || c == '[' ||
        c == ']' || c == '$' || c == '\\' || c == '&' || c == '|')
      return true;
  }
  return false;
}

} // anonymous namespace

// **---- Execution ----**

ProcessResult run_process(const std::string &program,
                          const std::vector<std::string> &args,
                          std::chrono::milliseconds timeout) {
  ProcessResult result;

  /// argv is built before fork so the child never allocates
  std::vector<std::string> storage;
  storage.reserve(args.size() + 1);
  storage.push_back(program);
  storage.insert(storage.end(), args.begin(), args.end());

  std::vector<char *> argv;
  argv.reserve(storage.size() + 1);
  for (auto &s : storage)
    argv.push_back(&s[0]);
  argv.push_back(nullptr);

  Pipe out_pipe, err_pipe, status_pipe;
  if (!out_pipe.open() || !err_pipe.open() || !status_pipe.open()) {
    result.spawn_failed = true;
    result.error = fmt::format("pipe failed: {}", std::strerror(errno));
    return result;
  }

  pid_t pid = fork();
  if (pid == -1) {
    result.spawn_failed = true;
    result.error = fmt::format("fork failed: {}", std::strerror(errno));
    return result;
  }

  if (pid == 0) {
    /// Child
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
    }
    dup2(out_pipe.write_end(), STDOUT_FILENO);
    dup2(err_pipe.write_end(), STDERR_FILENO);

    execvp(argv[0], argv.data());

    int err = errno;
    ssize_t ignored = write(status_pipe.write_end(), &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  /// Parent
  out_pipe.close_write();
  err_pipe.close_write();
  status_pipe.close_write();

  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe.read_end(), &exec_errno, sizeof(exec_errno));
  } while (n == -1 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    wait_child(pid);
    result.spawn_failed = true;
    result.error = fmt::format("cannot execute '{}': {}", program,
                               std::strerror(exec_errno));
    return result;
  }

  fcntl(out_pipe.read_end(), F_SETFL, O_NONBLOCK);
  fcntl(err_pipe.read_end(), F_SETFL, O_NONBLOCK);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool out_open = true;
  bool err_open = true;

  while (out_open || err_open) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open)
      fds[nfds++] = {out_pipe.read_end(), POLLIN, 0};
    if (err_open)
      fds[nfds++] = {err_pipe.read_end(), POLLIN, 0};

    int ready = poll(fds, nfds, static_cast<int>(std::min<long long>(
                                    remaining.count(), 1000)));
    if (ready == -1) {
      if (errno == EINTR)
        continue;
      result.error = fmt::format("poll failed: {}", std::strerror(errno));
      kill(pid, SIGKILL);
      break;
    }
    if (ready == 0)
      continue;

    for (nfds_t i = 0; i < nfds; ++i) {
      if (fds[i].revents == 0)
        continue;
      if (fds[i].fd == out_pipe.read_end()) {
        out_open = drain(fds[i].fd, result.stdout_text);
      } else {
        err_open = drain(fds[i].fd, result.stderr_text);
      }
    }
  }

  /// Both pipes can close while the child keeps running
  if (!result.timed_out && result.error.empty()) {
    int code = -1;
    if (wait_child_until(pid, deadline, code)) {
      result.exit_code = code;
      return result;
    }
    result.timed_out = true;
  }

  if (result.timed_out) {
    kill(pid, SIGKILL);
    result.error = fmt::format("'{}' timed out after {}s", program,
                               timeout.count() / 1000.0);
  }

  result.exit_code = wait_child(pid);
  return result;
}

std::string render_command_line(const std::string &program,
                                const std::vector<std::string> &args) {
  std::string line = program;
  for (const auto &arg : args) {
    line += ' ';
    if (!needs_quoting(arg)) {
      line += arg;
      continue;
    }
    line += '\'';
    for (char c : arg) {
      if (c == '\'')
        line += "'\\''";
      else
        line += c;
    }
    line += '\'';
  }
  return line;
}

} // namespace smart_cut
