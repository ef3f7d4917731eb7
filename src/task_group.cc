#include "procgate/task_group.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

#include "procgate/log.hpp"

namespace procgate {

namespace {

// Moves the work out of its slot so its captures die before the unit is
// counted as finished.
Result<void> invoke(TaskGroup::Work& slot) {
  TaskGroup::Work work = std::move(slot);
  slot = nullptr;
  if (!work) {
    return {};
  }
  try {
    return work();
  } catch (const std::exception& e) {
    return Error{.code = make_error_code(errc::callback_failed),
                 .context = std::string("task threw: ") + e.what()};
  }
}

}  // namespace

struct TaskGroup::State {
  void run(Work& work);

  mutable std::mutex mutex;
  std::condition_variable finished;
  std::size_t outstanding = 0;
  // Claimed by the first failing unit; first_error is guarded by mutex.
  std::atomic<bool> error_claimed{false};
  std::optional<Error> first_error;
};

void TaskGroup::State::run(Work& work) {
  auto result = invoke(work);
  bool won = false;
  if (!result) {
    bool expected = false;
    won = error_claimed.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    if (!won) {
      PROCGATE_LOG(debug, "dropping later task error: " + to_string(result.error()));
    }
  }
  std::lock_guard<std::mutex> lock(mutex);
  if (won) {
    first_error = std::move(result.error());
  }
  if (--outstanding == 0) {
    finished.notify_all();
  }
}

TaskGroup::TaskGroup() : state_(std::make_shared<State>()) {}

TaskGroup::~TaskGroup() {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->finished.wait(lock, [&] { return state_->outstanding == 0; });
}

void TaskGroup::spawn(Work work) {
  // Shared with the thread so the work survives a failed thread start.
  auto unit = std::make_shared<Work>(std::move(work));
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->outstanding;
  }
  try {
    std::thread([state = state_, unit] { state->run(*unit); }).detach();
  } catch (const std::system_error& e) {
    PROCGATE_LOG(warn, std::string("could not start task thread, running inline: ") + e.what());
    state_->run(*unit);
  }
}

Result<void> TaskGroup::wait() {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->finished.wait(lock, [&] { return state_->outstanding == 0; });
  if (state_->first_error) {
    return *state_->first_error;
  }
  return {};
}

std::size_t TaskGroup::outstanding() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->outstanding;
}

}  // namespace procgate
