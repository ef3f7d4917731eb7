#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "procgate/child.hpp"
#include "procgate/command.hpp"
#include "procgate/context.hpp"
#include "procgate/result.hpp"
#include "procgate/status.hpp"

namespace procgate {

/// @brief Per-process execution settings.
struct RunOptions {
  /// @brief Abandon the run after this long. Unset waits indefinitely.
  std::optional<std::chrono::milliseconds> timeout;
  /// @brief Delay between SIGTERM and SIGKILL once the timeout fires.
  std::chrono::milliseconds kill_grace{WaitOptions::kDefaultKillGrace};
  /// @brief Start each child in its own process group so a timeout kill reaches its
  /// descendants.
  ///
  /// Unset groups children only when a timeout is configured, leaving them in
  /// the caller's foreground group (and within reach of Ctrl-C) otherwise. A
  /// value set on the Command itself takes precedence.
  std::optional<bool> new_process_group;
};

/// @brief Runs one external process to completion and classifies its exit.
///
/// The input is written to the child's stdin while stdout and stderr are
/// drained, so a child that produces output before reading all of its input
/// cannot deadlock the run. A non-zero exit with output is success: the
/// output is returned as findings.
class ProcessRunner {
 public:
  explicit ProcessRunner(RunOptions options = {});

  /// @brief Run command with input on stdin and return its stdout.
  ///
  /// Fails with:
  /// - `cancelled` if context is already cancelled (nothing is spawned);
  /// - a `failure::transport` error if the process cannot be started, fed,
  ///   drained or reaped;
  /// - a `failure::terminated` error if it was killed by a signal, timed
  ///   out, or exited non-zero without writing to stdout.
  ///
  /// A child that stops reading stdin early is judged by its exit: the
  /// broken pipe is reported as `write_failed` only when the exit alone
  /// would have been a success with empty stdout.
  ///
  /// A child that was started is always reaped before this returns.
  [[nodiscard]] Result<std::string> run(const Context& context, const Command& command,
                                        std::string_view input) const;

  /// @brief Run without a cancellation context.
  [[nodiscard]] Result<std::string> run(const Command& command, std::string_view input) const;

  [[nodiscard]] const RunOptions& options() const noexcept { return options_; }

 private:
  RunOptions options_;
};

/// @brief Map a finished process onto stdout or a terminated-class error.
///
/// program only labels error messages. stderr is quoted into the error
/// context and kept verbatim in Error::diagnostics.
[[nodiscard]] Result<std::string> classify_output(std::string_view program, Output output);

namespace internal {
// Double-quoted, escaped rendering of text for error messages.
std::string quote(std::string_view text);
}  // namespace internal

}  // namespace procgate
