#include "procgate/child.hpp"

#include "procgate/internal/backend.hpp"

namespace procgate {

struct Child::Impl {
  explicit Impl(internal::Spawned spawned) : spawned_(spawned) {
    if (spawned_.stdin_fd) {
      stdin_pipe.emplace(*spawned_.stdin_fd);
    }
    if (spawned_.stdout_fd) {
      stdout_pipe.emplace(*spawned_.stdout_fd);
    }
    if (spawned_.stderr_fd) {
      stderr_pipe.emplace(*spawned_.stderr_fd);
    }
  }

  internal::Spawned spawned_;
  std::optional<PipeWriter> stdin_pipe;
  std::optional<PipeReader> stdout_pipe;
  std::optional<PipeReader> stderr_pipe;
};

Child::Child(Child&& other) noexcept = default;
Child& Child::operator=(Child&& other) noexcept = default;
Child::~Child() = default;

namespace internal {

Child ChildAccess::from_spawned(Spawned spawned) {
  Child child;
  ChildAccess::impl(child) = std::make_unique<Child::Impl>(spawned);
  return child;
}

}  // namespace internal

namespace {

template <typename Pipe>
std::optional<Pipe> take(std::optional<Pipe>& slot) noexcept {
  auto pipe = std::move(slot);
  slot.reset();
  return pipe;
}

Error empty_handle(errc code, const char* context) {
  return Error{.code = make_error_code(code), .context = context};
}

}  // namespace

int Child::id() const noexcept { return impl_ ? impl_->spawned_.pid : -1; }

std::optional<PipeWriter> Child::take_stdin() noexcept {
  return impl_ ? take(impl_->stdin_pipe) : std::nullopt;
}

std::optional<PipeReader> Child::take_stdout() noexcept {
  return impl_ ? take(impl_->stdout_pipe) : std::nullopt;
}

std::optional<PipeReader> Child::take_stderr() noexcept {
  return impl_ ? take(impl_->stderr_pipe) : std::nullopt;
}

Result<ExitStatus> Child::wait() { return wait(WaitOptions{}); }

Result<ExitStatus> Child::wait(WaitOptions options) {
  if (!impl_) {
    return empty_handle(errc::wait_failed, "wait on empty child handle");
  }
  return internal::default_backend().wait(impl_->spawned_, options.timeout, options.kill_grace);
}

Result<void> Child::kill() {
  if (!impl_) {
    return empty_handle(errc::kill_failed, "kill on empty child handle");
  }
  return internal::default_backend().kill(impl_->spawned_);
}

}  // namespace procgate
