#include "procgate/pipe.hpp"

#include <unistd.h>

#include <cerrno>

namespace procgate {

namespace {

Error make_errno_error(errc code, const char* context) {
  return Error{.code = make_error_code(code),
               .context = context,
               .cause = std::error_code(errno, std::system_category())};
}

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace

PipeReader::PipeReader(PipeReader&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

PipeReader& PipeReader::operator=(PipeReader&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

PipeReader::~PipeReader() { close(); }

void PipeReader::close() noexcept { close_fd(fd_); }

Result<std::size_t> PipeReader::read_some(void* data, std::size_t n) const {
  if (fd_ < 0) {
    return Error{.code = make_error_code(errc::read_failed), .context = "read on closed pipe"};
  }
  while (true) {
    ssize_t rv = ::read(fd_, data, n);
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno == EINTR) {
      continue;
    }
    return make_errno_error(errc::read_failed, "read");
  }
}

PipeWriter::PipeWriter(PipeWriter&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

PipeWriter& PipeWriter::operator=(PipeWriter&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

PipeWriter::~PipeWriter() { close(); }

void PipeWriter::close() noexcept { close_fd(fd_); }

Result<std::size_t> PipeWriter::write_some(const void* data, std::size_t n) const {
  if (fd_ < 0) {
    return Error{.code = make_error_code(errc::write_failed), .context = "write on closed pipe"};
  }
  while (true) {
    ssize_t rv = ::write(fd_, data, n);
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno == EINTR) {
      continue;
    }
    return make_errno_error(errc::write_failed, "write");
  }
}

}  // namespace procgate
