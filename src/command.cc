#include "procgate/command.hpp"

#include <utility>

#include "procgate/internal/backend.hpp"

namespace procgate {

Command::Command(std::string program) { argv_.emplace_back(std::move(program)); }

Command& Command::arg(std::string value) {
  argv_.emplace_back(std::move(value));
  return *this;
}

Command& Command::args(std::initializer_list<std::string_view> values) {
  for (auto value : values) {
    argv_.emplace_back(value);
  }
  return *this;
}

Command& Command::args(std::span<const std::string> values) {
  argv_.insert(argv_.end(), values.begin(), values.end());
  return *this;
}

Command& Command::options(SpawnOptions value) {
  opts_ = value;
  return *this;
}

Result<Child> Command::spawn() const {
  if (argv_.front().empty()) {
    return Error{.code = make_error_code(errc::empty_argv), .context = "argv"};
  }

  internal::SpawnSpec spec{.argv = argv_, .opts = opts_};
  auto spawned = internal::default_backend().spawn(spec);
  if (!spawned) {
    return spawned.error();
  }
  return internal::ChildAccess::from_spawned(spawned.value());
}

}  // namespace procgate
