#include "procgate/internal/communicate.hpp"

#include <poll.h>

#include <array>
#include <cerrno>
#include <system_error>
#include <utility>

#include "procgate/internal/fd.hpp"

namespace procgate::internal {

namespace {

constexpr std::size_t kBufferSize = 8192;

struct ReadTarget {
  PipeReader* pipe;
  std::string* out;
};

// Closes every pipe still open when communicate returns, on all paths.
struct PipeCloser {
  PipeWriter* stdin_pipe;
  std::array<ReadTarget, 2>& targets;

  ~PipeCloser() {
    if (stdin_pipe != nullptr) {
      stdin_pipe->close();
    }
    for (auto& target : targets) {
      if (target.pipe != nullptr) {
        target.pipe->close();
      }
    }
  }
};

bool would_block(const Error& error) {
  return error.cause == std::errc::resource_unavailable_try_again ||
         error.cause == std::errc::operation_would_block;
}

// Returns false once the reader hit EOF.
Result<bool> read_available(ReadTarget& target) {
  std::array<char, kBufferSize> buffer{};
  while (true) {
    auto count = target.pipe->read_some(buffer.data(), buffer.size());
    if (!count) {
      if (would_block(count.error())) {
        return true;
      }
      return count.error();
    }
    if (*count == 0) {
      target.pipe->close();
      return false;
    }
    target.out->append(buffer.data(), *count);
  }
}

}  // namespace

Result<CommunicateResult> communicate(PipeWriter* stdin_pipe, std::string_view input,
                                      PipeReader* stdout_pipe, PipeReader* stderr_pipe,
                                      const Deadline& deadline) {
  CommunicateResult result;
  std::array targets = {
      ReadTarget{.pipe = stdout_pipe, .out = &result.stdout_data},
      ReadTarget{.pipe = stderr_pipe, .out = &result.stderr_data},
  };
  PipeCloser closer{.stdin_pipe = stdin_pipe, .targets = targets};
  ScopedSigpipeBlock sigpipe_guard;

  if (stdin_pipe != nullptr && stdin_pipe->is_open()) {
    if (input.empty()) {
      stdin_pipe->close();
    } else {
      auto nonblocking = set_nonblocking(stdin_pipe->native_handle());
      if (!nonblocking) {
        return nonblocking.error();
      }
    }
  }
  for (auto& target : targets) {
    if (target.pipe == nullptr || !target.pipe->is_open()) {
      continue;
    }
    auto nonblocking = set_nonblocking(target.pipe->native_handle());
    if (!nonblocking) {
      return nonblocking.error();
    }
  }

  auto writing = [&] { return stdin_pipe != nullptr && stdin_pipe->is_open(); };
  auto reading = [](const ReadTarget& target) {
    return target.pipe != nullptr && target.pipe->is_open();
  };

  std::size_t written = 0;
  std::array<pollfd, 3> pollfds{};
  while (writing() || reading(targets[0]) || reading(targets[1])) {
    if (deadline.expired()) {
      return Error{.code = make_error_code(errc::timeout), .context = "timeout"};
    }
    // Slot 0 is stdin, slots 1 and 2 the readers; fd -1 makes poll skip a slot.
    pollfds[0] = pollfd{.fd = writing() ? stdin_pipe->native_handle() : -1,
                        .events = POLLOUT,
                        .revents = 0};
    for (std::size_t i = 0; i < targets.size(); ++i) {
      pollfds[i + 1] = pollfd{.fd = reading(targets[i]) ? targets[i].pipe->native_handle() : -1,
                              .events = POLLIN,
                              .revents = 0};
    }

    int poll_result = ::poll(pollfds.data(), pollfds.size(), deadline.poll_timeout_ms());
    if (poll_result == -1) {
      if (errno == EINTR) {
        continue;
      }
      return make_fd_error(errc::read_failed, "poll");
    }
    if (poll_result == 0) {
      return Error{.code = make_error_code(errc::timeout), .context = "timeout"};
    }

    if (writing() && pollfds[0].revents != 0) {
      while (written < input.size()) {
        auto count = stdin_pipe->write_some(input.data() + written, input.size() - written);
        if (count) {
          written += *count;
          continue;
        }
        if (!would_block(count.error())) {
          result.write_error = std::move(count.error());
        }
        break;
      }
      if (written == input.size() || result.write_error) {
        stdin_pipe->close();
      }
    }

    for (std::size_t i = 0; i < targets.size(); ++i) {
      if (!reading(targets[i]) || (pollfds[i + 1].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      auto more = read_available(targets[i]);
      if (!more) {
        return more.error();
      }
    }
  }

  return result;
}

}  // namespace procgate::internal
