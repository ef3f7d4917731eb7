#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "procgate/manager.hpp"

// Uppercases a few inputs through tr(1), two at a time.
int main() {
  auto manager = procgate::ConcurrentProcessManager::create({.parallelism = 2});
  if (!manager) {
    std::cerr << "create failed: " << procgate::to_string(manager.error()) << "\n";
    return 1;
  }

  const std::vector<std::string> words = {"alpha", "beta", "gamma", "delta", "epsilon"};
  std::mutex print_mutex;
  for (const auto& word : words) {
    (*manager)->submit("tr", {"a-z", "A-Z"}, word,
                       [&, word](procgate::Result<std::string> out) -> procgate::Result<void> {
                         if (!out) {
                           return out.error();
                         }
                         std::lock_guard<std::mutex> lock(print_mutex);
                         std::cout << word << " -> " << *out << "\n";
                         return {};
                       });
  }

  auto joined = (*manager)->join();
  if (!joined) {
    std::cerr << "join failed: " << procgate::to_string(joined.error()) << "\n";
    return 1;
  }
  return 0;
}
