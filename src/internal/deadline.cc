#include "procgate/internal/deadline.hpp"

#include <atomic>
#include <limits>
#include <thread>

namespace procgate::internal {

namespace {

class SteadyClock final : public Clock {
 public:
  std::chrono::steady_clock::time_point now() override { return std::chrono::steady_clock::now(); }

  void sleep_for(std::chrono::milliseconds duration) override {
    std::this_thread::sleep_for(duration);
  }
};

std::atomic<Clock*> g_clock_override{nullptr};

}  // namespace

ScopedClockOverride::ScopedClockOverride(Clock& clock)
    : previous_(g_clock_override.exchange(&clock)) {}

ScopedClockOverride::~ScopedClockOverride() { g_clock_override.store(previous_); }

Clock& default_clock() {
  if (auto* override_clock = g_clock_override.load()) {
    return *override_clock;
  }
  static SteadyClock clock;
  return clock;
}

Deadline Deadline::after(std::optional<std::chrono::milliseconds> timeout) {
  Deadline deadline;
  if (timeout) {
    deadline.at_ = default_clock().now() + *timeout;
  }
  return deadline;
}

bool Deadline::expired() const { return at_ && default_clock().now() >= *at_; }

std::optional<std::chrono::milliseconds> Deadline::remaining() const {
  if (!at_) {
    return std::nullopt;
  }
  auto now = default_clock().now();
  if (now >= *at_) {
    return std::chrono::milliseconds(0);
  }
  // Round up so a sub-millisecond remainder still waits.
  return std::chrono::ceil<std::chrono::milliseconds>(*at_ - now);
}

int Deadline::poll_timeout_ms() const {
  auto left = remaining();
  if (!left) {
    return -1;
  }
  constexpr auto kMaxPoll = std::numeric_limits<int>::max();
  return left->count() > kMaxPoll ? kMaxPoll : static_cast<int>(left->count());
}

}  // namespace procgate::internal
