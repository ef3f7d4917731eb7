#include "procgate/internal/wait_policy.hpp"

namespace procgate::internal {

namespace {

constexpr auto kSleepStep = std::chrono::milliseconds(1);

Error timeout_error() { return Error{.code = make_error_code(errc::timeout), .context = "timeout"}; }

// Polls until the process exits or the deadline passes. Returns the status if
// it exited, nullopt on deadline. The process is checked at least once, so a
// zero budget still observes a child that already exited.
Result<std::optional<ExitStatus>> poll_until(WaitOps& ops, Clock& clock,
                                             std::chrono::steady_clock::time_point deadline) {
  for (;;) {
    auto wait_result = ops.try_wait();
    if (!wait_result) {
      return wait_result.error();
    }
    if (wait_result->has_value()) {
      return wait_result.value();
    }
    if (clock.now() >= deadline) {
      return std::optional<ExitStatus>();
    }
    clock.sleep_for(kSleepStep);
  }
}

}  // namespace

Result<ExitStatus> wait_with_timeout(WaitOps& ops, Clock& clock,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::chrono::milliseconds kill_grace) {
  if (!timeout) {
    return ops.wait_blocking();
  }

  auto before_deadline = poll_until(ops, clock, clock.now() + *timeout);
  if (!before_deadline) {
    return before_deadline.error();
  }
  if (before_deadline->has_value()) {
    return **before_deadline;
  }

  auto term_result = ops.terminate();
  if (!term_result) {
    return term_result.error();
  }

  auto during_grace = poll_until(ops, clock, clock.now() + kill_grace);
  if (!during_grace) {
    return during_grace.error();
  }
  if (during_grace->has_value()) {
    return timeout_error();
  }

  auto kill_result = ops.kill();
  if (!kill_result) {
    return kill_result.error();
  }

  auto reaped = ops.wait_blocking();
  if (!reaped) {
    return reaped.error();
  }
  return timeout_error();
}

}  // namespace procgate::internal
