#include "procgate/result.hpp"

#include <stdexcept>

namespace procgate {

namespace {

failure failure_of(errc value) noexcept {
  switch (value) {
    case errc::invalid_parallelism:
    case errc::empty_argv:
      return failure::configuration;
    case errc::terminated:
    case errc::exited_without_output:
    case errc::timeout:
      return failure::terminated;
    case errc::cancelled:
      return failure::cancelled;
    case errc::callback_failed:
      return failure::callback;
    case errc::ok:
    case errc::pipe_failed:
    case errc::spawn_failed:
    case errc::write_failed:
    case errc::read_failed:
    case errc::wait_failed:
    case errc::kill_failed:
      break;
  }
  return failure::transport;
}

class procgate_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "procgate"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::invalid_parallelism:
        return "parallelism must be a positive integer";
      case errc::empty_argv:
        return "empty argv";
      case errc::pipe_failed:
        return "pipe failed";
      case errc::spawn_failed:
        return "spawn failed";
      case errc::write_failed:
        return "write failed";
      case errc::read_failed:
        return "read failed";
      case errc::wait_failed:
        return "wait failed";
      case errc::kill_failed:
        return "kill failed";
      case errc::terminated:
        return "terminated abnormally";
      case errc::exited_without_output:
        return "exited with non-zero status and empty output";
      case errc::timeout:
        return "timeout";
      case errc::cancelled:
        return "cancelled";
      case errc::callback_failed:
        return "callback failed";
    }
    return "unknown error";
  }

  [[nodiscard]] std::error_condition default_error_condition(int value) const noexcept override {
    if (static_cast<errc>(value) == errc::ok) {
      return {};
    }
    return make_error_condition(failure_of(static_cast<errc>(value)));
  }
};

class failure_category_impl : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "procgate.failure"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<failure>(value)) {
      case failure::transport:
        return "transport error";
      case failure::terminated:
        return "terminated abnormally";
      case failure::callback:
        return "callback error";
      case failure::configuration:
        return "configuration error";
      case failure::cancelled:
        return "cancelled";
    }
    return "unknown failure";
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static procgate_error_category category;
  return category;
}

const std::error_category& failure_category() noexcept {
  static failure_category_impl category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

std::error_condition make_error_condition(failure value) noexcept {
  return {static_cast<int>(value), failure_category()};
}

std::string to_string(const Error& error) {
  std::string out = error.context.empty() ? error.code.message() : error.context;
  if (!error.context.empty() && error.code.category() != error_category()) {
    out.append(": ").append(error.code.message());
  }
  if (error.cause) {
    out.append(": ").append(error.cause.message());
  }
  return out;
}

namespace internal {

[[noreturn]] void throw_error(const Error& error) {
  if (error.code.category() == std::system_category()) {
    throw std::system_error(error.code, error.context);
  }
  if (error.cause && error.cause.category() == std::system_category()) {
    throw std::system_error(error.cause, to_string(error));
  }
  throw std::runtime_error(to_string(error));
}

}  // namespace internal

}  // namespace procgate
