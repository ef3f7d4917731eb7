#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <string>
#include <vector>

#include "procgate/internal/backend.hpp"
#include "procgate/internal/deadline.hpp"
#include "procgate/internal/fd.hpp"
#include "procgate/internal/wait_policy.hpp"

extern char** environ;

namespace procgate::internal {

namespace {

Error make_errno_error(errc code, const char* context) {
  return Error{.code = make_error_code(code),
               .context = context,
               .cause = std::error_code(errno, std::system_category())};
}

Error make_spawn_error(int error, const char* context) {
  return Error{.code = make_error_code(errc::spawn_failed),
               .context = context,
               .cause = std::error_code(error, std::system_category())};
}

ExitStatus to_exit_status(int status) {
  if (WIFEXITED(status)) {
    return ExitStatus::exited(WEXITSTATUS(status), static_cast<std::uint32_t>(status));
  }
  return ExitStatus::other(static_cast<std::uint32_t>(status));
}

Result<ExitStatus> wait_pid(pid_t pid) {
  int status = 0;
  while (true) {
    pid_t rv = ::waitpid(pid, &status, 0);
    if (rv == pid) {
      return to_exit_status(status);
    }
    if (rv == -1 && errno == EINTR) {
      continue;
    }
    return make_errno_error(errc::wait_failed, "waitpid");
  }
}

Result<void> send_signal(const Spawned& spawned, int signo) {
  pid_t target = spawned.pgid ? -(*spawned.pgid) : spawned.pid;
  if (::kill(target, signo) == -1) {
    return make_errno_error(errc::kill_failed, "kill");
  }
  return {};
}

struct SpawnActionState {
  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;
  bool actions_ready = false;
  bool attr_ready = false;

  ~SpawnActionState() {
    if (actions_ready) {
      posix_spawn_file_actions_destroy(&actions);
    }
    if (attr_ready) {
      posix_spawnattr_destroy(&attr);
    }
  }
};

// One child stream: the end the child sees is dup2'ed onto target_fd, the
// other end stays with the parent.
struct StreamPipe {
  unique_fd parent_end;
  unique_fd child_end;
};

Result<StreamPipe> make_stream_pipe(bool child_reads) {
  auto pipe_result = create_pipe();
  if (!pipe_result) {
    return pipe_result.error();
  }
  auto [read_end, write_end] = std::move(pipe_result.value());
  if (child_reads) {
    return StreamPipe{.parent_end = std::move(write_end), .child_end = std::move(read_end)};
  }
  return StreamPipe{.parent_end = std::move(read_end), .child_end = std::move(write_end)};
}

class PosixBackend final : public Backend {
 public:
  Result<Spawned> spawn(const SpawnSpec& spec) override {
    if (spec.argv.empty() || spec.argv.front().empty()) {
      return Error{.code = make_error_code(errc::empty_argv), .context = "argv"};
    }

    auto stdin_pipe = make_stream_pipe(true);
    if (!stdin_pipe) {
      return stdin_pipe.error();
    }
    auto stdout_pipe = make_stream_pipe(false);
    if (!stdout_pipe) {
      return stdout_pipe.error();
    }
    auto stderr_pipe = make_stream_pipe(false);
    if (!stderr_pipe) {
      return stderr_pipe.error();
    }

    SpawnActionState state;
    int rc = posix_spawn_file_actions_init(&state.actions);
    if (rc != 0) {
      return make_spawn_error(rc, "posix_spawn_file_actions_init");
    }
    state.actions_ready = true;
    rc = posix_spawnattr_init(&state.attr);
    if (rc != 0) {
      return make_spawn_error(rc, "posix_spawnattr_init");
    }
    state.attr_ready = true;

    // All pipe ends are O_CLOEXEC, so only the dup2'ed copies survive exec.
    const std::pair<int, int> redirects[] = {
        {stdin_pipe->child_end.get(), STDIN_FILENO},
        {stdout_pipe->child_end.get(), STDOUT_FILENO},
        {stderr_pipe->child_end.get(), STDERR_FILENO},
    };
    for (const auto& [from, to] : redirects) {
      rc = posix_spawn_file_actions_adddup2(&state.actions, from, to);
      if (rc != 0) {
        return make_spawn_error(rc, "posix_spawn_file_actions_adddup2");
      }
    }

    const bool grouped = spec.opts.new_process_group.value_or(false);
    if (grouped) {
      rc = posix_spawnattr_setpgroup(&state.attr, 0);
      if (rc != 0) {
        return make_spawn_error(rc, "posix_spawnattr_setpgroup");
      }
      rc = posix_spawnattr_setflags(&state.attr, POSIX_SPAWN_SETPGROUP);
      if (rc != 0) {
        return make_spawn_error(rc, "posix_spawnattr_setflags");
      }
    }

    std::vector<std::string> argv_copy = spec.argv;
    std::vector<char*> argv_c;
    argv_c.reserve(argv_copy.size() + 1);
    for (auto& arg : argv_copy) {
      argv_c.push_back(arg.data());
    }
    argv_c.push_back(nullptr);

    pid_t pid = -1;
    rc = ::posix_spawnp(&pid, argv_c[0], &state.actions, &state.attr, argv_c.data(), environ);
    if (rc != 0) {
      return make_spawn_error(rc, "posix_spawnp");
    }

    Spawned spawned;
    spawned.pid = pid;
    if (grouped) {
      spawned.pgid = pid;
    }
    spawned.stdin_fd = stdin_pipe->parent_end.release();
    spawned.stdout_fd = stdout_pipe->parent_end.release();
    spawned.stderr_fd = stderr_pipe->parent_end.release();
    return spawned;
  }

  Result<ExitStatus> wait(Spawned& spawned, std::optional<std::chrono::milliseconds> timeout,
                          std::chrono::milliseconds kill_grace) override {
    WaitOps ops;
    ops.try_wait = [&]() { return try_wait(spawned); };
    ops.wait_blocking = [&]() { return wait_pid(spawned.pid); };
    ops.terminate = [&]() { return terminate(spawned); };
    ops.kill = [&]() { return kill(spawned); };
    return wait_with_timeout(ops, default_clock(), timeout, kill_grace);
  }

  Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) override {
    int status = 0;
    while (true) {
      pid_t rv = ::waitpid(spawned.pid, &status, WNOHANG);
      if (rv == spawned.pid) {
        return std::optional<ExitStatus>(to_exit_status(status));
      }
      if (rv == 0) {
        return std::optional<ExitStatus>();
      }
      if (errno == EINTR) {
        continue;
      }
      return make_errno_error(errc::wait_failed, "waitpid");
    }
  }

  Result<void> terminate(Spawned& spawned) override { return send_signal(spawned, SIGTERM); }

  Result<void> kill(Spawned& spawned) override { return send_signal(spawned, SIGKILL); }
};

std::atomic<Backend*> g_backend_override{nullptr};

}  // namespace

ScopedBackendOverride::ScopedBackendOverride(Backend& backend)
    : previous_(g_backend_override.exchange(&backend)) {}

ScopedBackendOverride::~ScopedBackendOverride() { g_backend_override.store(previous_); }

Backend& default_backend() {
  if (auto* override_backend = g_backend_override.load()) {
    return *override_backend;
  }
  static PosixBackend backend;
  return backend;
}

}  // namespace procgate::internal
