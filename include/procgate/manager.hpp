#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "procgate/command.hpp"
#include "procgate/concurrency_gate.hpp"
#include "procgate/context.hpp"
#include "procgate/process_runner.hpp"
#include "procgate/result.hpp"
#include "procgate/task_group.hpp"

namespace procgate {

/// @brief Number of hardware threads, at least 1.
[[nodiscard]] int default_parallelism() noexcept;

/// @brief Manager configuration.
struct ManagerOptions {
  /// @brief Maximum number of processes running at once. Must be positive.
  int parallelism = default_parallelism();
  /// @brief Settings applied to every process.
  RunOptions run{};
};

/// @brief Runs external processes with bounded parallelism.
///
/// submit() blocks only until a slot is free; the process then runs on its
/// own thread, the slot is released, and the callback receives the process
/// output or its error. join() waits for every callback and reports the
/// first error any of them returned.
///
/// @code
/// auto manager = procgate::ConcurrentProcessManager::create_or_throw({.parallelism = 4});
/// for (const auto& file : files) {
///   manager->submit("gofmt", {"-l"}, read(file), [&](procgate::Result<std::string> out)
///                       -> procgate::Result<void> {
///     if (!out) {
///       return out.error();
///     }
///     report(file, *out);
///     return {};
///   });
/// }
/// manager->join_or_throw();
/// @endcode
class ConcurrentProcessManager {
 public:
  /// @brief Receives the runner result; a returned error fails join().
  ///
  /// Called exactly once per submit(), from an arbitrary thread, possibly
  /// concurrently with other callbacks.
  using Callback = std::function<Result<void>(Result<std::string> output)>;

  /// @brief Create a manager. Fails with `invalid_parallelism` when parallelism <= 0.
  [[nodiscard]] static Result<std::unique_ptr<ConcurrentProcessManager>> create(
      ManagerOptions options = {});
  /// @brief Create a manager or throw on invalid options.
  [[nodiscard]] static std::unique_ptr<ConcurrentProcessManager> create_or_throw(
      ManagerOptions options = {});

  /// @brief Waits for every submitted task. An error that was never joined is logged.
  ~ConcurrentProcessManager();
  ConcurrentProcessManager(const ConcurrentProcessManager&) = delete;
  ConcurrentProcessManager& operator=(const ConcurrentProcessManager&) = delete;

  /// @brief Run executable with arguments, feeding input on stdin.
  void submit(std::string executable, std::vector<std::string> arguments, std::string input,
              Callback on_complete);
  /// @brief Run a prepared command, feeding input on stdin.
  ///
  /// SpawnOptions set on the command are kept; ManagerOptions::run only
  /// fills in what the command leaves unset.
  void submit(Command command, std::string input, Callback on_complete);

  /// @brief Wait for every submitted task and return the first callback error.
  [[nodiscard]] Result<void> join();
  /// @brief join() or throw its error.
  void join_or_throw();

  /// @brief Stop admitting tasks.
  ///
  /// Tasks waiting for a slot, and tasks submitted later, skip their process
  /// and pass a `cancelled` error to their callback. Running processes are
  /// not interrupted.
  void cancel() noexcept;

  [[nodiscard]] int parallelism() const noexcept { return parallelism_; }
  [[nodiscard]] const Context& context() const noexcept { return context_; }

 private:
  explicit ConcurrentProcessManager(const ManagerOptions& options);

  const int parallelism_;
  Context context_;
  ConcurrencyGate gate_;
  ProcessRunner runner_;
  std::atomic<bool> joined_{false};
  // Last: its destructor waits for units that use the members above.
  TaskGroup group_;
};

}  // namespace procgate
