/**
 * @file ffmpeg_executor.cpp
 * @brief Process supervision implementation
 */

#include "loopweave/ffmpeg_executor.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#include <fmt/core.h>

#include "loopweave/errors.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace loopweave {

namespace {

/// Append to the captured stderr, keeping only the last STDERR_TAIL_BYTES
void append_tail(std::string &tail, const char *data, size_t n) {
  tail.append(data, n);
  if (tail.size() > STDERR_TAIL_BYTES)
    tail.erase(0, tail.size() - STDERR_TAIL_BYTES);
}

/// Read whatever is left in the pipe after the child is gone
void drain(int fd, std::string &tail) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags != -1)
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  char buf[4096];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_tail(tail, buf, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    break;
  }
}

void fill_status(ProcessResult &r, int status) {
  if (WIFEXITED(status)) {
    r.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    r.term_signal = WTERMSIG(status);
  }
}

} // anonymous namespace

std::string ProcessResult::describe() const {
  if (timed_out)
    return fmt::format("timed out after {:.1f}s", elapsed_sec);
  if (term_signal != 0)
    return fmt::format("killed by signal {} ({})", term_signal,
                       strsignal(term_signal));
  return fmt::format("exit code {}", exit_code);
}

ProcessResult run_process(const std::vector<std::string> &argv,
                          double timeout_sec) {
  if (argv.empty())
    throw CompositionError("empty command line");

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    c_argv.push_back(const_cast<char *>(a.c_str()));
  c_argv.push_back(nullptr);

  int err_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) == -1)
    throw CompositionError("cannot create stderr pipe", argv[0],
                           std::strerror(errno));

  const auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid == -1) {
    int e = errno;
    close(err_pipe[0]);
    close(err_pipe[1]);
    throw CompositionError("cannot fork", argv[0], std::strerror(e));
  }

  if (pid == 0) {
    // **---- CHILD ----**
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDWR);
    if (devnull != -1) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
    }
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(c_argv[0], c_argv.data());

    /// Only reached if exec failed; report through the pipe
    const char *msg = "exec failed: ";
    (void)!write(STDERR_FILENO, msg, std::strlen(msg));
    const char *why = std::strerror(errno);
    (void)!write(STDERR_FILENO, why, std::strlen(why));
    _exit(127);
  }

  // **---- PARENT ----**

  /// Set the group from both sides; whichever runs first wins the race
  setpgid(pid, pid);
  close(err_pipe[1]);
  const int err_fd = err_pipe[0];

  ProcessResult result;
  const bool has_deadline = timeout_sec > 0.0;
  const auto deadline =
      start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                  std::chrono::duration<double>(timeout_sec));

  bool pipe_open = true;
  bool reaped = false;
  int status = 0;
  char buf[4096];

  while (!reaped) {
    int wait_ms = 200;
    if (has_deadline) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        result.timed_out = true;
        reaped = true;
        break;
      }
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                      deadline - now)
                      .count();
      wait_ms = static_cast<int>(std::clamp<long long>(left, 1, 200));
    }

    if (pipe_open) {
      pollfd pfd{err_fd, POLLIN, 0};
      int r = poll(&pfd, 1, wait_ms);
      if (r > 0) {
        ssize_t n = read(err_fd, buf, sizeof(buf));
        if (n > 0)
          append_tail(result.stderr_tail, buf, static_cast<size_t>(n));
        else if (n == 0 || errno != EINTR)
          pipe_open = false;
      } else if (r < 0 && errno != EINTR) {
        pipe_open = false;
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
    }

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid)
      reaped = true;
  }

  drain(err_fd, result.stderr_tail);
  close(err_fd);

  fill_status(result, status);
  if (result.timed_out) {
    result.exit_code = -1;
    result.term_signal = SIGKILL;
  }
  result.elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - start)
                           .count();
  return result;
}

// **---- MemoryFile ----**

MemoryFile::MemoryFile(const char *name, const std::string &content) {
  fd_ = static_cast<int>(syscall(SYS_memfd_create, name, MFD_CLOEXEC));
  if (fd_ == -1)
    throw CompositionError("failed to create memory file", name,
                           std::strerror(errno));

  size_t written = 0;
  while (written < content.size()) {
    ssize_t n = write(fd_, content.data() + written, content.size() - written);
    if (n == -1) {
      if (errno == EINTR)
        continue;
      int e = errno;
      close(fd_);
      fd_ = -1;
      throw CompositionError("failed to write memory file", name,
                             std::strerror(e));
    }
    written += static_cast<size_t>(n);
  }

  path_ = fmt::format("/proc/{}/fd/{}", getpid(), fd_);
}

MemoryFile::~MemoryFile() {
  if (fd_ != -1)
    close(fd_);
}

} // namespace loopweave
