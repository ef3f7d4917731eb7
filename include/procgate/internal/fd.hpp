#pragma once

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <utility>

#include "procgate/platform.hpp"
#include "procgate/result.hpp"

namespace procgate::internal {

class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(-1); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] int release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(int fd) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

  explicit operator bool() const noexcept { return fd_ >= 0; }

 private:
  int fd_{-1};
};

inline Error make_fd_error(errc code, const char* context) {
  return Error{.code = make_error_code(code),
               .context = context,
               .cause = std::error_code(errno, std::system_category())};
}

inline Result<void> set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags == -1) {
    return make_fd_error(errc::pipe_failed, "fcntl(F_GETFL)");
  }
  if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return make_fd_error(errc::pipe_failed, "fcntl(F_SETFL)");
  }
  return {};
}

/// Create a pipe whose ends are both close-on-exec.
inline Result<std::pair<unique_fd, unique_fd>> create_pipe() {
  std::array<int, 2> fds{};
#if PROCGATE_PLATFORM_LINUX
  if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
    return make_fd_error(errc::pipe_failed, "pipe2");
  }
  return std::make_pair(unique_fd(fds[0]), unique_fd(fds[1]));
#else
  if (::pipe(fds.data()) == -1) {
    return make_fd_error(errc::pipe_failed, "pipe");
  }
  unique_fd read_end(fds[0]);
  unique_fd write_end(fds[1]);
  for (int fd : fds) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags == -1 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
      return make_fd_error(errc::pipe_failed, "fcntl(F_SETFD)");
    }
  }
  return std::make_pair(std::move(read_end), std::move(write_end));
#endif
}

// Blocks SIGPIPE on the calling thread so writes to a pipe whose reader has
// exited fail with EPIPE. A SIGPIPE raised while the guard was active is
// consumed on destruction, unless one was already pending before.
class ScopedSigpipeBlock {
 public:
  ScopedSigpipeBlock() {
    sigset_t pending;
    sigemptyset(&pending);
    ::sigpending(&pending);
    was_pending_ = sigismember(&pending, SIGPIPE) == 1;

    sigset_t block;
    sigemptyset(&block);
    sigaddset(&block, SIGPIPE);
    blocked_ = ::pthread_sigmask(SIG_BLOCK, &block, &previous_) == 0;
  }

  ~ScopedSigpipeBlock() {
    if (!blocked_) {
      return;
    }
    sigset_t pending;
    sigemptyset(&pending);
    if (!was_pending_ && ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
      sigset_t pipe_only;
      sigemptyset(&pipe_only);
      sigaddset(&pipe_only, SIGPIPE);
      int signo = 0;
      ::sigwait(&pipe_only, &signo);
    }
    ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
  }

  ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
  ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

 private:
  sigset_t previous_{};
  bool was_pending_ = false;
  bool blocked_ = false;
};

}  // namespace procgate::internal
