#include "procgate/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>

namespace procgate {

namespace {

constexpr LogLevel kDefaultLevel = LogLevel::warn;

LogLevel level_from_env() noexcept {
  const char* value = std::getenv("PROCGATE_LOG_LEVEL");
  if (value == nullptr) {
    return kDefaultLevel;
  }
  return parse_log_level(value).value_or(kDefaultLevel);
}

std::atomic<LogLevel>& level_storage() noexcept {
  static std::atomic<LogLevel> level{level_from_env()};
  return level;
}

std::atomic<const LogSink*> g_sink_override{nullptr};

void write_to_stderr(LogLevel level, std::string_view message) {
  static std::mutex stderr_mutex;
  std::string name(to_string(level));
  std::ranges::transform(name, name.begin(),
                         [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  std::lock_guard<std::mutex> lock(stderr_mutex);
  std::cerr << "[procgate] [" << name << "] " << message << '\n';
}

}  // namespace

void set_log_level(LogLevel level) noexcept { level_storage().store(level); }

LogLevel log_level() noexcept { return level_storage().load(); }

std::string_view to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::error:
      return "error";
    case LogLevel::warn:
      return "warn";
    case LogLevel::info:
      return "info";
    case LogLevel::debug:
      return "debug";
    case LogLevel::trace:
      return "trace";
  }
  return "unknown";
}

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
  constexpr LogLevel kAll[] = {LogLevel::error, LogLevel::warn, LogLevel::info, LogLevel::debug,
                               LogLevel::trace};
  for (LogLevel level : kAll) {
    auto name = to_string(level);
    bool same = std::ranges::equal(text, name, [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) == b;
    });
    if (same) {
      return level;
    }
  }
  if (std::ranges::equal(text, std::string_view("warning"), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
      })) {
    return LogLevel::warn;
  }
  return std::nullopt;
}

ScopedLogSinkOverride::ScopedLogSinkOverride(const LogSink& sink)
    : previous_(g_sink_override.exchange(&sink)) {}

ScopedLogSinkOverride::~ScopedLogSinkOverride() { g_sink_override.store(previous_); }

namespace internal {

bool log_enabled(LogLevel level) noexcept {
  return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(log_level());
}

void log(LogLevel level, std::string_view message) noexcept {
  if (!log_enabled(level)) {
    return;
  }
  try {
    if (const auto* sink = g_sink_override.load(); sink != nullptr && *sink) {
      (*sink)(level, message);
      return;
    }
    write_to_stderr(level, message);
  } catch (const std::exception&) {
    // A throwing sink loses the message.
  }
}

}  // namespace internal

}  // namespace procgate
