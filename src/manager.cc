#include "procgate/manager.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "procgate/log.hpp"

namespace procgate {

int default_parallelism() noexcept {
  return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
}

Result<std::unique_ptr<ConcurrentProcessManager>> ConcurrentProcessManager::create(
    ManagerOptions options) {
  if (options.parallelism <= 0) {
    return Error{.code = make_error_code(errc::invalid_parallelism),
                 .context = "parallelism must be positive, got " +
                            std::to_string(options.parallelism)};
  }
  return std::unique_ptr<ConcurrentProcessManager>(new ConcurrentProcessManager(options));
}

std::unique_ptr<ConcurrentProcessManager> ConcurrentProcessManager::create_or_throw(
    ManagerOptions options) {
  auto manager = create(std::move(options));
  if (!manager) {
    internal::throw_error(manager.error());
  }
  return std::move(manager).value();
}

ConcurrentProcessManager::ConcurrentProcessManager(const ManagerOptions& options)
    : parallelism_(options.parallelism),
      gate_(static_cast<std::size_t>(options.parallelism)),
      runner_(options.run) {}

ConcurrentProcessManager::~ConcurrentProcessManager() {
  auto result = group_.wait();
  if (!result && !joined_.load()) {
    PROCGATE_LOG(warn, "manager destroyed with an unjoined error: " + to_string(result.error()));
  }
}

void ConcurrentProcessManager::submit(std::string executable, std::vector<std::string> arguments,
                                      std::string input, Callback on_complete) {
  Command command(std::move(executable));
  command.args(arguments);
  submit(std::move(command), std::move(input), std::move(on_complete));
}

void ConcurrentProcessManager::submit(Command command, std::string input, Callback on_complete) {
  auto slot = gate_.acquire_slot(context_);
  if (!slot) {
    PROCGATE_LOG(debug, command.program() + " not admitted: " + to_string(slot.error()));
    group_.spawn([error = std::move(slot.error()), on_complete = std::move(on_complete)]() {
      return on_complete(error);
    });
    return;
  }
  PROCGATE_LOG(debug, "admitted " + command.program() + ", " +
                          std::to_string(gate_.available()) + " slots left");

  // std::function needs a copyable callable, so the slot is shared.
  auto held = std::make_shared<GateSlot>(std::move(*slot));
  group_.spawn([this, held, command = std::move(command), input = std::move(input),
                on_complete = std::move(on_complete)]() {
    auto output = runner_.run(context_, command, input);
    held->release();
    PROCGATE_LOG(debug, "finished " + command.program() + (output ? "" : " with an error"));
    return on_complete(std::move(output));
  });
}

Result<void> ConcurrentProcessManager::join() {
  joined_.store(true);
  return group_.wait();
}

void ConcurrentProcessManager::join_or_throw() {
  auto result = join();
  if (!result) {
    internal::throw_error(result.error());
  }
}

void ConcurrentProcessManager::cancel() noexcept {
  context_.cancel();
  gate_.wake_all();
}

}  // namespace procgate
