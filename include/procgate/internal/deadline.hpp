#pragma once

#include <chrono>
#include <optional>

namespace procgate::internal {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::chrono::steady_clock::time_point now() = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class ScopedClockOverride {
 public:
  explicit ScopedClockOverride(Clock& clock);
  ~ScopedClockOverride();
  ScopedClockOverride(const ScopedClockOverride&) = delete;
  ScopedClockOverride& operator=(const ScopedClockOverride&) = delete;

 private:
  Clock* previous_ = nullptr;
};

Clock& default_clock();

// Point in time after which a run is abandoned. An unbounded deadline never
// expires.
class Deadline {
 public:
  static Deadline unbounded() noexcept { return Deadline{}; }
  static Deadline after(std::optional<std::chrono::milliseconds> timeout);

  [[nodiscard]] bool bounded() const noexcept { return at_.has_value(); }
  [[nodiscard]] bool expired() const;
  // Time left, clamped at zero; nullopt when unbounded.
  [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;
  // Timeout argument for poll(2): -1 when unbounded.
  [[nodiscard]] int poll_timeout_ms() const;

 private:
  std::optional<std::chrono::steady_clock::time_point> at_;
};

}  // namespace procgate::internal
