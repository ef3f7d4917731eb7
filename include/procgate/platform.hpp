#pragma once

/// @file platform.hpp
/// @brief Platform and standard feature detection macros.

#include <version>

// Values are 0 or 1 for use in #if expressions.

#if defined(__linux__)
/// @brief True when building for Linux.
#define PROCGATE_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define PROCGATE_PLATFORM_LINUX 0
#endif

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define PROCGATE_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define PROCGATE_PLATFORM_MACOS 0
#endif

#if !defined(_WIN32) && (defined(__unix__) || PROCGATE_PLATFORM_MACOS || PROCGATE_PLATFORM_LINUX)
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define PROCGATE_PLATFORM_POSIX 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define PROCGATE_PLATFORM_POSIX 0
#endif

#if !PROCGATE_PLATFORM_POSIX
#error "procgate spawns processes through POSIX primitives only"
#endif

#if __cplusplus < 202002L
#error "procgate requires at least C++20"
#endif
