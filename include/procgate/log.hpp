#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace procgate {

/// @brief Diagnostic log severity, most severe first.
enum class LogLevel : std::uint8_t { error = 0, warn, info, debug, trace };

/// @brief Receives every message at or above the current threshold.
using LogSink = std::function<void(LogLevel, std::string_view)>;

/// @brief Set the threshold. Defaults to PROCGATE_LOG_LEVEL, or warn.
void set_log_level(LogLevel level) noexcept;
/// @brief Current threshold.
[[nodiscard]] LogLevel log_level() noexcept;

/// @brief Lower-case level name ("warn", "debug", ...).
[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;
/// @brief Parse a level name, case-insensitively.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// @brief Route log messages to a sink for the lifetime of this object.
class ScopedLogSinkOverride {
 public:
  explicit ScopedLogSinkOverride(const LogSink& sink);
  ~ScopedLogSinkOverride();
  ScopedLogSinkOverride(const ScopedLogSinkOverride&) = delete;
  ScopedLogSinkOverride& operator=(const ScopedLogSinkOverride&) = delete;

 private:
  const LogSink* previous_ = nullptr;
};

namespace internal {

[[nodiscard]] bool log_enabled(LogLevel level) noexcept;
void log(LogLevel level, std::string_view message) noexcept;

}  // namespace internal

}  // namespace procgate

// Arguments are only evaluated when the level is enabled.
#define PROCGATE_LOG(level, message)                                        \
  do {                                                                      \
    if (::procgate::internal::log_enabled(::procgate::LogLevel::level)) {   \
      ::procgate::internal::log(::procgate::LogLevel::level, (message));    \
    }                                                                       \
  } while (false)
