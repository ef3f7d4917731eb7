#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "procgate/platform.hpp"

#include "procgate/internal/expected.hpp"

namespace procgate {

/// @brief Error codes for procgate operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // Configuration / API misuse
  /// @brief Parallelism was zero or negative.
  invalid_parallelism,
  /// @brief Command has no program name.
  empty_argv,

  // Transport: the process could not be driven
  /// @brief Pipe creation failed.
  pipe_failed,
  /// @brief Process creation failed.
  spawn_failed,
  /// @brief Writing standard input failed.
  write_failed,
  /// @brief Reading standard output or error failed.
  read_failed,
  /// @brief Waiting for the process failed.
  wait_failed,
  /// @brief Sending a signal failed.
  kill_failed,

  // Abnormal termination
  /// @brief Process ended by signal or without an exit code.
  terminated,
  /// @brief Process exited non-zero and wrote nothing to stdout.
  exited_without_output,
  /// @brief Process exceeded its timeout and was killed.
  timeout,

  // Scheduling
  /// @brief The manager was cancelled before the task was admitted.
  cancelled,
  /// @brief A completion callback threw.
  callback_failed,
};

/// @brief Failure classes that errc values belong to.
///
/// Compare an error code against these with ==, for example
/// `error.code == failure::transport`.
enum class failure : std::uint8_t {
  /// @brief Infrastructure failure: spawn, pipe, write or wait.
  transport = 1,
  /// @brief Killed by signal, timed out, or non-zero exit without output.
  terminated,
  /// @brief Reported by a completion callback.
  callback,
  /// @brief Invalid configuration.
  configuration,
  /// @brief Work skipped because the manager was cancelled.
  cancelled,
};

/// @brief Error payload returned by procgate APIs.
struct Error {
  /// @brief Error code, usually in the procgate category.
  std::error_code code;
  /// @brief Human-readable context for the failure.
  std::string context;
  /// @brief Underlying OS error, if one caused this failure.
  std::error_code cause{};
  /// @brief Diagnostic text captured from the child's stderr.
  std::string diagnostics{};
};

/// @brief procgate error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Failure-class category for std::error_condition.
const std::error_category& failure_category() noexcept;
/// @brief Create an error_code in the procgate category.
std::error_code make_error_code(errc value) noexcept;
/// @brief Create an error_condition for a failure class.
std::error_condition make_error_condition(failure value) noexcept;

/// @brief Format an error as "context: message (cause)".
std::string to_string(const Error& error);

/// @brief Result type used by procgate APIs.
///
/// Unlike std::expected, an Error converts implicitly into any Result<T>.
template <typename T>
using Result = expected<T, Error>;

namespace internal {
/// @brief Throw an error as an exception (used by *_or_throw helpers).
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace procgate

namespace std {

/// @brief Enable implicit conversion from procgate::errc to std::error_code.
template <>
struct is_error_code_enum<procgate::errc> : true_type {};

/// @brief Enable comparison of error codes against procgate::failure.
template <>
struct is_error_condition_enum<procgate::failure> : true_type {};

}  // namespace std
