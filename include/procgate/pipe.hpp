#pragma once

#include <cstddef>

#include "procgate/result.hpp"

namespace procgate {

/// @brief Read end of a pipe owned by procgate.
class PipeReader {
 public:
  /// @brief Construct an empty reader.
  PipeReader() = default;
  /// @brief Take ownership of a native file descriptor.
  explicit PipeReader(int fd) : fd_(fd) {}
  PipeReader(PipeReader&& other) noexcept;
  PipeReader& operator=(PipeReader&& other) noexcept;
  PipeReader(const PipeReader&) = delete;
  PipeReader& operator=(const PipeReader&) = delete;
  ~PipeReader();

  /// @brief Native file descriptor, or -1 once closed.
  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  /// @brief True while the descriptor is open.
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
  /// @brief Close the pipe. Safe to call repeatedly.
  void close() noexcept;

  /// @brief Read up to n bytes into data. Returns 0 at EOF.
  ///
  /// On a non-blocking descriptor with nothing buffered the error's cause is
  /// `std::errc::resource_unavailable_try_again`.
  [[nodiscard]] Result<std::size_t> read_some(void* data, std::size_t n) const;

 private:
  int fd_{-1};
};

/// @brief Write end of a pipe owned by procgate.
class PipeWriter {
 public:
  /// @brief Construct an empty writer.
  PipeWriter() = default;
  /// @brief Take ownership of a native file descriptor.
  explicit PipeWriter(int fd) : fd_(fd) {}
  PipeWriter(PipeWriter&& other) noexcept;
  PipeWriter& operator=(PipeWriter&& other) noexcept;
  PipeWriter(const PipeWriter&) = delete;
  PipeWriter& operator=(const PipeWriter&) = delete;
  ~PipeWriter();

  /// @brief Native file descriptor, or -1 once closed.
  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  /// @brief True while the descriptor is open.
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
  /// @brief Close the pipe, signalling EOF to the reader.
  void close() noexcept;

  /// @brief Write up to n bytes from data.
  ///
  /// A reader that went away surfaces as `write_failed` with cause EPIPE.
  [[nodiscard]] Result<std::size_t> write_some(const void* data, std::size_t n) const;

 private:
  int fd_{-1};
};

}  // namespace procgate
