#include "procgate/concurrency_gate.hpp"

#include <utility>

#include "procgate/log.hpp"

namespace procgate {

namespace {

Error cancelled_error() {
  return Error{.code = make_error_code(errc::cancelled), .context = "not admitted: cancelled"};
}

}  // namespace

ConcurrencyGate::ConcurrencyGate(std::size_t capacity) : capacity_(capacity) {}

Result<void> ConcurrencyGate::acquire(const Context& context) {
  if (capacity_ == 0) {
    return Error{.code = make_error_code(errc::invalid_parallelism),
                 .context = "concurrency gate has no slots"};
  }
  std::unique_lock<std::mutex> lock(mutex_);
  freed_.wait(lock, [&] { return context.cancelled() || held_ < capacity_; });
  if (context.cancelled()) {
    return cancelled_error();
  }
  ++held_;
  return {};
}

Result<GateSlot> ConcurrencyGate::acquire_slot(const Context& context) {
  auto acquired = acquire(context);
  if (!acquired) {
    return std::move(acquired.error());
  }
  return GateSlot(*this);
}

void ConcurrencyGate::release() noexcept {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_ == 0) {
      PROCGATE_LOG(error, "concurrency gate released more often than acquired");
      return;
    }
    --held_;
  }
  freed_.notify_one();
}

void ConcurrencyGate::wake_all() noexcept {
  // A waiter between its predicate check and its sleep holds the lock.
  { std::lock_guard<std::mutex> lock(mutex_); }
  freed_.notify_all();
}

std::size_t ConcurrencyGate::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_ - held_;
}

GateSlot::GateSlot(GateSlot&& other) noexcept : gate_(std::exchange(other.gate_, nullptr)) {}

GateSlot& GateSlot::operator=(GateSlot&& other) noexcept {
  if (this != &other) {
    release();
    gate_ = std::exchange(other.gate_, nullptr);
  }
  return *this;
}

GateSlot::~GateSlot() { release(); }

void GateSlot::release() noexcept {
  if (auto* gate = std::exchange(gate_, nullptr)) {
    gate->release();
  }
}

}  // namespace procgate
