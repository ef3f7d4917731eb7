#pragma once

#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "procgate/child.hpp"
#include "procgate/result.hpp"

namespace procgate {

/// @brief Options that affect process creation.
struct SpawnOptions {
  /// @brief Place the child in a new process group so signals reach its descendants.
  ///
  /// Unset leaves the choice to the caller of spawn(); a bare spawn() keeps
  /// the child in the parent's group.
  std::optional<bool> new_process_group;
};

/// @brief Executable plus ordered arguments.
///
/// The program is resolved through PATH of the current environment, which the
/// child inherits. All three standard streams of the child are pipes.
class Command {
 public:
  /// @brief Construct a command with argv[0]=program.
  explicit Command(std::string program);

  /// @brief Append a single argument.
  Command& arg(std::string value);
  /// @brief Append multiple arguments from an initializer list.
  Command& args(std::initializer_list<std::string_view> values);
  /// @brief Append multiple arguments.
  Command& args(std::span<const std::string> values);

  /// @brief Set spawn options.
  Command& options(SpawnOptions value);

  /// @brief Program name as given (argv[0]).
  [[nodiscard]] const std::string& program() const noexcept { return argv_.front(); }
  /// @brief Full argument vector including argv[0].
  [[nodiscard]] const std::vector<std::string>& argv() const noexcept { return argv_; }
  /// @brief Spawn options.
  [[nodiscard]] const SpawnOptions& spawn_options() const noexcept { return opts_; }

  /// @brief Spawn without waiting. stdin, stdout and stderr are piped.
  [[nodiscard]] Result<Child> spawn() const;

 private:
  std::vector<std::string> argv_;
  SpawnOptions opts_{};
};

}  // namespace procgate
