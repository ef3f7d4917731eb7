#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "procgate/pipe.hpp"
#include "procgate/result.hpp"
#include "procgate/status.hpp"

namespace procgate {

namespace internal {
struct ChildAccess;
}  // namespace internal

/// @brief Wait configuration for child processes.
struct WaitOptions {
  /// @brief Default grace period before a forced kill.
  static constexpr std::chrono::milliseconds kDefaultKillGrace{200};
  /// @brief Optional timeout for waiting.
  std::optional<std::chrono::milliseconds> timeout;
  /// @brief Grace period after terminate before kill.
  std::chrono::milliseconds kill_grace{kDefaultKillGrace};
};

/// @brief Running child process handle.
///
/// Dropping a Child does not wait for the process; callers reap it with wait().
class Child {
 public:
  Child() = default;
  Child(Child&& other) noexcept;
  Child& operator=(Child&& other) noexcept;
  Child(const Child&) = delete;
  Child& operator=(const Child&) = delete;
  ~Child();

  /// @brief Process identifier, or -1 for an empty handle.
  [[nodiscard]] int id() const noexcept;

  /// @brief Take ownership of the stdin pipe, if present.
  std::optional<PipeWriter> take_stdin() noexcept;
  /// @brief Take ownership of the stdout pipe, if present.
  std::optional<PipeReader> take_stdout() noexcept;
  /// @brief Take ownership of the stderr pipe, if present.
  std::optional<PipeReader> take_stderr() noexcept;

  /// @brief Wait for child completion.
  Result<ExitStatus> wait();
  /// @brief Wait with timeout and termination policy.
  Result<ExitStatus> wait(WaitOptions options);

  /// @brief Send SIGKILL to the child (or its group).
  Result<void> kill();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

  friend struct internal::ChildAccess;
};

}  // namespace procgate
