#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "procgate/internal/deadline.hpp"
#include "procgate/pipe.hpp"
#include "procgate/result.hpp"

namespace procgate::internal {

struct CommunicateResult {
  std::string stdout_data;
  std::string stderr_data;
  // Set when stdin could not be written in full. Draining continues after a
  // write failure so the child can still be reaped.
  std::optional<Error> write_error;
};

// Writes input to stdin_pipe and closes it, while reading stdout_pipe and
// stderr_pipe to EOF. Any pipe may be null. Every pipe is closed on return.
// Fails with errc::timeout if the deadline passes before both readers hit EOF.
Result<CommunicateResult> communicate(PipeWriter* stdin_pipe, std::string_view input,
                                      PipeReader* stdout_pipe, PipeReader* stderr_pipe,
                                      const Deadline& deadline);

}  // namespace procgate::internal
