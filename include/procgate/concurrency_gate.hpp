#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "procgate/context.hpp"
#include "procgate/result.hpp"

namespace procgate {

class GateSlot;

/// @brief Counting semaphore that bounds how many tasks run at once.
///
/// Waiters are woken in no particular order; the only guarantee is that a
/// released slot is eventually taken by some waiter.
class ConcurrencyGate {
 public:
  /// @brief Create a gate with capacity slots. A zero capacity admits nothing.
  explicit ConcurrencyGate(std::size_t capacity);
  ConcurrencyGate(const ConcurrencyGate&) = delete;
  ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

  /// @brief Block until a slot is free, then take it.
  ///
  /// Returns `cancelled` once context is cancelled, whether or not a slot
  /// would have been available. Returns `invalid_parallelism` instead of
  /// blocking forever on a zero-capacity gate.
  [[nodiscard]] Result<void> acquire(const Context& context);
  /// @brief acquire() returning a guard that releases the slot on destruction.
  [[nodiscard]] Result<GateSlot> acquire_slot(const Context& context);
  /// @brief Return one slot taken by acquire().
  void release() noexcept;
  /// @brief Wake every waiter so it re-checks its context.
  void wake_all() noexcept;

  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  /// @brief Slots currently free.
  [[nodiscard]] std::size_t available() const;

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable freed_;
  std::size_t held_ = 0;
};

/// @brief Owns one acquired gate slot.
class GateSlot {
 public:
  GateSlot() = default;
  GateSlot(GateSlot&& other) noexcept;
  GateSlot& operator=(GateSlot&& other) noexcept;
  GateSlot(const GateSlot&) = delete;
  GateSlot& operator=(const GateSlot&) = delete;
  ~GateSlot();

  /// @brief True while the slot has not been released.
  [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }
  /// @brief Release early. Later calls are no-ops.
  void release() noexcept;

 private:
  friend class ConcurrencyGate;
  explicit GateSlot(ConcurrencyGate& gate) noexcept : gate_(&gate) {}

  ConcurrencyGate* gate_ = nullptr;
};

}  // namespace procgate
