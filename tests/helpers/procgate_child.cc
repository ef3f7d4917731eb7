// Test helper that stands in for an external tool. Flags are applied in the
// order: grandchild, sleep, stdin handling, output, open fd report, exit.

#include <dirent.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "procgate/platform.hpp"

namespace {

constexpr int kParseBase = 10;
constexpr std::size_t kIoBufferSize = 4096;
constexpr int kGrandchildSleepMs = 10000;
constexpr long kFallbackMaxFd = 256;

struct Options {
  std::size_t stdout_bytes = 0;
  std::size_t stderr_bytes = 0;
  std::optional<std::string> stdout_text;
  std::optional<std::string> stderr_text;
  std::optional<int> exit_code;
  std::optional<int> sleep_ms;
  std::optional<int> raise_signal;
  std::optional<std::string> grandchild_pid_file;
  std::optional<std::string> write_open_fds;
  bool echo_stdin = false;
  bool consume_stdin = false;
  bool close_stdin = false;
};

bool parse_size(const std::string& value, std::size_t* out) {
  char* end = nullptr;
  errno = 0;
  unsigned long long parsed = std::strtoull(value.c_str(), &end, kParseBase);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    return false;
  }
  *out = static_cast<std::size_t>(parsed);
  return true;
}

bool parse_int(const std::string& value, std::optional<int>* out) {
  char* end = nullptr;
  errno = 0;
  long parsed = std::strtol(value.c_str(), &end, kParseBase);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    return false;
  }
  *out = static_cast<int>(parsed);
  return true;
}

bool parse_args(int argc, char* argv[], Options* options) {  // NOLINT(modernize-avoid-c-arrays)
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--stdout-bytes" && has_value) {
      if (!parse_size(argv[++i], &options->stdout_bytes)) {
        return false;
      }
    } else if (arg == "--stderr-bytes" && has_value) {
      if (!parse_size(argv[++i], &options->stderr_bytes)) {
        return false;
      }
    } else if (arg == "--stdout-text" && has_value) {
      options->stdout_text = argv[++i];
    } else if (arg == "--stderr-text" && has_value) {
      options->stderr_text = argv[++i];
    } else if (arg == "--exit-code" && has_value) {
      if (!parse_int(argv[++i], &options->exit_code)) {
        return false;
      }
    } else if (arg == "--sleep-ms" && has_value) {
      if (!parse_int(argv[++i], &options->sleep_ms)) {
        return false;
      }
    } else if (arg == "--raise-signal" && has_value) {
      if (!parse_int(argv[++i], &options->raise_signal)) {
        return false;
      }
    } else if (arg == "--grandchild-pid-file" && has_value) {
      options->grandchild_pid_file = argv[++i];
    } else if (arg == "--write-open-fds" && has_value) {
      options->write_open_fds = argv[++i];
    } else if (arg == "--echo-stdin") {
      options->echo_stdin = true;
    } else if (arg == "--consume-stdin") {
      options->consume_stdin = true;
    } else if (arg == "--close-stdin") {
      options->close_stdin = true;
    } else {
      return false;
    }
  }
  return true;
}

void write_bytes(std::ostream& stream, std::size_t count, char fill) {
  std::string buffer(kIoBufferSize, fill);
  while (count > 0) {
    std::size_t amount = std::min(count, buffer.size());
    stream.write(buffer.data(), static_cast<std::streamsize>(amount));
    count -= amount;
  }
}

// Copies stdin to stdout when echo is set, otherwise discards it.
void drain_stdin(bool echo) {
  std::array<char, kIoBufferSize> buffer{};
  while (true) {
    ssize_t count = ::read(STDIN_FILENO, buffer.data(), buffer.size());
    if (count == 0) {
      return;
    }
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    if (!echo) {
      continue;
    }
    ssize_t offset = 0;
    while (offset < count) {
      ssize_t written = ::write(STDOUT_FILENO, buffer.data() + offset, count - offset);
      if (written > 0) {
        offset += written;
      } else if (written == -1 && errno == EINTR) {
        continue;
      } else {
        return;
      }
    }
  }
}

std::vector<int> list_open_fds() {
  std::vector<int> fds;
#if PROCGATE_PLATFORM_LINUX
  DIR* dir = ::opendir("/proc/self/fd");
  if (!dir) {
    return fds;
  }
  int dir_fd = ::dirfd(dir);
  while (dirent* entry = ::readdir(dir)) {
    if (entry->d_name[0] == '.') {
      continue;
    }
    char* end = nullptr;
    long value = std::strtol(entry->d_name, &end, kParseBase);
    if (*end != '\0' || static_cast<int>(value) == dir_fd) {
      continue;
    }
    fds.push_back(static_cast<int>(value));
  }
  ::closedir(dir);
#else
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) {
    max_fd = kFallbackMaxFd;
  }
  for (int fd = 0; fd < max_fd; ++fd) {
    errno = 0;
    if (::fcntl(fd, F_GETFD) != -1 || errno != EBADF) {
      fds.push_back(fd);
    }
  }
#endif
  std::ranges::sort(fds);
  return fds;
}

void write_open_fds_file(const std::string& path) {
  auto fds = list_open_fds();
  std::ofstream file(path);
  for (std::size_t i = 0; i < fds.size(); ++i) {
    if (i > 0) {
      file << ' ';
    }
    file << fds[i];
  }
}

// The grandchild keeps the parent's process group and outlives the parent
// unless the whole group is signalled.
bool spawn_grandchild(const std::string& pid_file) {
  pid_t pid = ::fork();
  if (pid < 0) {
    return false;
  }
  if (pid == 0) {
    ::close(STDOUT_FILENO);
    ::close(STDERR_FILENO);
    std::this_thread::sleep_for(std::chrono::milliseconds(kGrandchildSleepMs));
    std::_Exit(0);
  }
  std::ofstream file(pid_file);
  file << pid;
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  Options options;
  if (!parse_args(argc, argv, &options)) {
    std::cerr << "invalid args" << '\n';
    return 2;
  }

  if (options.grandchild_pid_file && !spawn_grandchild(*options.grandchild_pid_file)) {
    std::cerr << "fork failed" << '\n';
    return 1;
  }

  if (options.sleep_ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(*options.sleep_ms));
  }

  if (options.close_stdin) {
    ::close(STDIN_FILENO);
  } else if (options.echo_stdin || options.consume_stdin) {
    drain_stdin(options.echo_stdin);
  }

  if (options.stdout_text) {
    std::cout << *options.stdout_text;
  }
  write_bytes(std::cout, options.stdout_bytes, 'a');
  if (options.stderr_text) {
    std::cerr << *options.stderr_text;
  }
  write_bytes(std::cerr, options.stderr_bytes, 'b');

  if (options.write_open_fds) {
    write_open_fds_file(*options.write_open_fds);
  }

  std::cout.flush();
  std::cerr.flush();

  if (options.raise_signal) {
    ::signal(*options.raise_signal, SIG_DFL);
    ::raise(*options.raise_signal);
    // Signals whose default action is ignore fall through to the exit code.
  }
  return options.exit_code.value_or(0);
}
