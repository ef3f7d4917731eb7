#include "procgate/status.hpp"

#include <sys/wait.h>

namespace procgate {

ExitStatus ExitStatus::exited(
    int code, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::exited;
  status.code_ = code;
  status.native_ = native;
  return status;
}

ExitStatus ExitStatus::other(std::uint32_t native) noexcept {
  ExitStatus status;
  status.kind_ = Kind::other;
  status.native_ = native;
  return status;
}

std::optional<int> ExitStatus::code() const noexcept {
  if (kind_ != Kind::exited) {
    return std::nullopt;
  }
  return code_;
}

std::optional<int> ExitStatus::signal() const noexcept {
  if (kind_ != Kind::other) {
    return std::nullopt;
  }
  int raw = static_cast<int>(native_);
  if (WIFSIGNALED(raw)) {
    return WTERMSIG(raw);
  }
  return std::nullopt;
}

}  // namespace procgate
