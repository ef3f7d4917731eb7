#include "procgate/process_runner.hpp"

#include <cstdio>
#include <system_error>
#include <utility>

#include "procgate/internal/communicate.hpp"
#include "procgate/internal/deadline.hpp"
#include "procgate/log.hpp"

namespace procgate {

namespace {

// Keeps code and cause, prefixes the context with what was being attempted.
Error wrap(Error error, std::string what) {
  if (!error.context.empty()) {
    what += ": ";
    what += error.context;
  }
  error.context = std::move(what);
  return error;
}

// Used after the run has already failed: the child must not outlive us.
void kill_and_reap(Child& child, const std::string& program) {
  auto killed = child.kill();
  if (!killed) {
    PROCGATE_LOG(debug, "kill " + program + ": " + to_string(killed.error()));
  }
  auto reaped = child.wait();
  if (!reaped) {
    PROCGATE_LOG(warn, "could not reap " + program + ": " + to_string(reaped.error()));
  }
}

Error timeout_error(const std::string& program, const RunOptions& options,
                    std::string stderr_data) {
  std::string context = program + " timed out";
  if (options.timeout) {
    context += " after " + std::to_string(options.timeout->count()) + "ms";
  }
  context += ". stderr: " + internal::quote(stderr_data);
  return Error{.code = make_error_code(errc::timeout),
               .context = std::move(context),
               .diagnostics = std::move(stderr_data)};
}

std::string describe_exit(const std::string& program, const ExitStatus& status) {
  if (auto code = status.code()) {
    return program + " exited with status " + std::to_string(*code);
  }
  if (auto sig = status.signal()) {
    return program + " was terminated by signal " + std::to_string(*sig);
  }
  return program + " was terminated";
}

bool broken_pipe(const Error& error) { return error.cause == std::errc::broken_pipe; }

template <typename Pipe>
Pipe* ptr(std::optional<Pipe>& pipe) {
  return pipe ? &*pipe : nullptr;
}

}  // namespace

namespace internal {

std::string quote(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default: {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f) {
          char buf[5];
          std::snprintf(buf, sizeof(buf), "\\x%02x", byte);
          out += buf;
        } else {
          out.push_back(c);
        }
      }
    }
  }
  out.push_back('"');
  return out;
}

}  // namespace internal

Result<std::string> classify_output(std::string_view program, Output output) {
  if (output.status.success()) {
    return std::move(output.stdout_data);
  }
  const auto code = output.status.code();
  if (!code) {
    std::string context(program);
    context += " was terminated";
    if (auto sig = output.status.signal()) {
      context += " by signal " + std::to_string(*sig);
    }
    context += ". stderr: " + internal::quote(output.stderr_data);
    return Error{.code = make_error_code(errc::terminated),
                 .context = std::move(context),
                 .diagnostics = std::move(output.stderr_data)};
  }
  if (*code != 0 && output.stdout_data.empty()) {
    std::string context(program);
    context += " exited with status " + std::to_string(*code) +
               " but stdout was empty. stderr: " + internal::quote(output.stderr_data);
    return Error{.code = make_error_code(errc::exited_without_output),
                 .context = std::move(context),
                 .diagnostics = std::move(output.stderr_data)};
  }
  return std::move(output.stdout_data);
}

ProcessRunner::ProcessRunner(RunOptions options) : options_(options) {}

Result<std::string> ProcessRunner::run(const Command& command, std::string_view input) const {
  return run(Context{}, command, input);
}

Result<std::string> ProcessRunner::run(const Context& context, const Command& command,
                                       std::string_view input) const {
  const std::string& program = command.program();
  if (context.cancelled()) {
    return Error{.code = make_error_code(errc::cancelled),
                 .context = program + " was not started: cancelled"};
  }

  Command spawnable = command;
  if (!spawnable.spawn_options().new_process_group) {
    spawnable.options(SpawnOptions{
        .new_process_group = options_.new_process_group.value_or(options_.timeout.has_value())});
  }
  const auto deadline = internal::Deadline::after(options_.timeout);

  auto child = spawnable.spawn();
  if (!child) {
    if (child.error().code == errc::pipe_failed) {
      return wrap(std::move(child.error()), "could not make stdin pipe for " + program + " process");
    }
    return wrap(std::move(child.error()), "could not start " + program + " process");
  }
  PROCGATE_LOG(debug, "started " + program + " (pid " + std::to_string(child->id()) + ")");

  auto stdin_pipe = child->take_stdin();
  auto stdout_pipe = child->take_stdout();
  auto stderr_pipe = child->take_stderr();
  auto io = internal::communicate(ptr(stdin_pipe), input, ptr(stdout_pipe), ptr(stderr_pipe),
                                  deadline);
  if (!io) {
    kill_and_reap(*child, program);
    if (io.error().code == errc::timeout) {
      return timeout_error(program, options_, {});
    }
    return wrap(std::move(io.error()), "could not read output of " + program + " process");
  }

  auto status = child->wait(WaitOptions{.timeout = deadline.remaining(),
                                        .kill_grace = options_.kill_grace});
  if (!status) {
    if (status.error().code == errc::timeout) {
      return timeout_error(program, options_, std::move(io->stderr_data));
    }
    return wrap(std::move(status.error()), "could not wait for " + program + " process");
  }
  PROCGATE_LOG(trace, program + " exited with native status " + std::to_string(status->native()) +
                          ", " + std::to_string(io->stdout_data.size()) + " bytes of stdout");

  if (io->write_error) {
    // A child may legitimately exit without reading all of its input; its
    // exit then decides, unless that exit says nothing at all.
    Output output{.status = *status,
                  .stdout_data = std::move(io->stdout_data),
                  .stderr_data = io->stderr_data};
    if (broken_pipe(*io->write_error) &&
        !(output.status.success() && output.stdout_data.empty())) {
      PROCGATE_LOG(debug, program + " stopped reading stdin: " + describe_exit(program, *status));
      return classify_output(program, std::move(output));
    }
    Error error = wrap(std::move(*io->write_error),
                       "could not write to stdin of " + program + " process");
    error.context += "; " + describe_exit(program, *status) +
                     ". stderr: " + internal::quote(io->stderr_data);
    error.diagnostics = std::move(io->stderr_data);
    return error;
  }
  return classify_output(program, Output{.status = *status,
                                         .stdout_data = std::move(io->stdout_data),
                                         .stderr_data = std::move(io->stderr_data)});
}

}  // namespace procgate
