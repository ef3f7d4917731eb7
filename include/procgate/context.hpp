#pragma once

#include <atomic>
#include <memory>

namespace procgate {

/// @brief Cancellation token shared by a manager and everything it schedules.
///
/// Copies share state: cancelling any copy cancels all of them. Cancellation
/// is one-way.
class Context {
 public:
  /// @brief Create a fresh, uncancelled context.
  Context() : state_(std::make_shared<State>()) {}

  /// @brief Request cancellation.
  void cancel() noexcept { state_->cancelled.store(true, std::memory_order_release); }
  /// @brief True once cancel() was called on any copy.
  [[nodiscard]] bool cancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
  }

 private:
  struct State {
    std::atomic<bool> cancelled{false};
  };
  std::shared_ptr<State> state_;
};

}  // namespace procgate
