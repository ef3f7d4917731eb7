#pragma once

#include <cstddef>
#include <functional>
#include <memory>

#include "procgate/result.hpp"

namespace procgate {

/// @brief Runs units of work on their own threads and collects the first error.
///
/// wait() returns only after every spawned unit has finished, even when one
/// failed early; nothing is cancelled on failure. Among several failing
/// units, the one that finishes first is reported.
class TaskGroup {
 public:
  /// @brief One unit of work.
  using Work = std::function<Result<void>()>;

  TaskGroup();
  /// @brief Blocks until every spawned unit has finished.
  ~TaskGroup();
  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  /// @brief Start work on a new thread.
  ///
  /// If no thread can be started, work runs on the calling thread before
  /// spawn() returns. A std::exception escaping work is recorded as
  /// `callback_failed`.
  void spawn(Work work);

  /// @brief Wait for every unit, then return the first error, if any.
  ///
  /// The group stays usable: more units may be spawned and waited for. A
  /// recorded error is reported by every later wait().
  [[nodiscard]] Result<void> wait();

  /// @brief Units spawned but not yet finished.
  [[nodiscard]] std::size_t outstanding() const;

 private:
  struct State;
  std::shared_ptr<State> state_;
};

}  // namespace procgate
