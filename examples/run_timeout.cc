#include <chrono>
#include <iostream>

#include "procgate/process_runner.hpp"

int main() {
  procgate::RunOptions options;
  options.timeout = std::chrono::milliseconds(10);
  options.kill_grace = std::chrono::milliseconds(10);

  // clang-format off
  const auto cmd = procgate::Command{"/bin/sleep"}
                       .arg("1");
  // clang-format on

  auto out = procgate::ProcessRunner(options).run(cmd, "");
  if (out) {
    std::cerr << "expected timeout but process exited\n";
    return 1;
  }
  if (out.error().code != procgate::errc::timeout ||
      out.error().code != procgate::failure::terminated) {
    std::cerr << "unexpected error: " << procgate::to_string(out.error()) << "\n";
    return 1;
  }
  return 0;
}
