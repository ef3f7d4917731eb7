#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "procgate/child.hpp"
#include "procgate/command.hpp"
#include "procgate/result.hpp"
#include "procgate/status.hpp"

namespace procgate::internal {

struct SpawnSpec {
  std::vector<std::string> argv;
  SpawnOptions opts;
};

// Parent ends of the child's standard streams are always piped.
struct Spawned {
  int pid = -1;
  std::optional<int> pgid;
  std::optional<int> stdin_fd;
  std::optional<int> stdout_fd;
  std::optional<int> stderr_fd;
};

class Backend {
 public:
  virtual ~Backend() = default;
  virtual Result<Spawned> spawn(const SpawnSpec& spec) = 0;
  virtual Result<ExitStatus> wait(Spawned& spawned,
                                  std::optional<std::chrono::milliseconds> timeout,
                                  std::chrono::milliseconds kill_grace) = 0;
  virtual Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) = 0;
  virtual Result<void> terminate(Spawned& spawned) = 0;
  virtual Result<void> kill(Spawned& spawned) = 0;
};

class ScopedBackendOverride {
 public:
  explicit ScopedBackendOverride(Backend& backend);
  ~ScopedBackendOverride();
  ScopedBackendOverride(const ScopedBackendOverride&) = delete;
  ScopedBackendOverride& operator=(const ScopedBackendOverride&) = delete;

 private:
  Backend* previous_ = nullptr;
};

Backend& default_backend();

struct ChildAccess {
  static std::unique_ptr<procgate::Child::Impl>& impl(procgate::Child& child) {
    return child.impl_;
  }
  static procgate::Child from_spawned(Spawned spawned);
};

}  // namespace procgate::internal
