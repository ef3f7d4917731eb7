#pragma once

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace procgate::support {

namespace fs = std::filesystem;

// Location of the procgate_child helper. PROCGATE_CHILD_PATH in the
// environment wins over the path baked in by the build.
inline std::string helper_path() {
  const char* override_path = std::getenv("PROCGATE_CHILD_PATH");
  if (override_path && fs::exists(override_path)) {
    return override_path;
  }
#ifdef PROCGATE_CHILD_BUILD_PATH
  if (fs::exists(PROCGATE_CHILD_BUILD_PATH)) {
    return PROCGATE_CHILD_BUILD_PATH;
  }
#endif
  std::cerr << "procgate_child helper not found\n";
  return "";
}

}  // namespace procgate::support
