#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "procgate/internal/deadline.hpp"
#include "procgate/result.hpp"
#include "procgate/status.hpp"

namespace procgate::internal {

struct WaitOps {
  std::function<Result<std::optional<ExitStatus>>()> try_wait;
  std::function<Result<ExitStatus>()> wait_blocking;
  std::function<Result<void>()> terminate;
  std::function<Result<void>()> kill;
};

// Without a timeout this is a blocking wait. With one, the process is polled
// until the deadline, then sent SIGTERM, then SIGKILL once kill_grace has
// elapsed. Any path that had to signal the process reports errc::timeout.
Result<ExitStatus> wait_with_timeout(WaitOps& ops, Clock& clock,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::chrono::milliseconds kill_grace);

}  // namespace procgate::internal
