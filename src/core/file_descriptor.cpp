#include "codebox/core/file_descriptor.hpp"

#include <array>
#include <cerrno>
#include <expected>
#include <string>
#include <utility>
#include <fmt/core.h>

#include <fcntl.h>
#include <unistd.h>

#include "codebox/core/syscall.hpp"

namespace codebox::core {

FileDescriptor::FileDescriptor(int fd, bool owning) noexcept
    : fd_(fd), owning_(owning) {}

FileDescriptor::~FileDescriptor() noexcept {
  if (owning_ && fd_ >= 0) {
    [[maybe_unused]] auto _ = syscall::close_fd(fd_);
    // Ignore errors in destructor
  }
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_), owning_(other.owning_) {
  other.fd_     = -1;
  other.owning_ = false;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    if (owning_ && fd_ >= 0) {
      [[maybe_unused]] auto _ = syscall::close_fd(fd_);
    }
    fd_           = other.fd_;
    owning_       = other.owning_;
    other.fd_     = -1;
    other.owning_ = false;
  }
  return *this;
}

auto FileDescriptor::get() const noexcept -> int {
  return fd_;
}

auto FileDescriptor::release() noexcept -> int {
  int fd  = fd_;
  fd_     = -1;
  owning_ = false;
  return fd;
}

void FileDescriptor::reset(int fd, bool owning) noexcept {
  if (owning_ && fd_ >= 0) {
    [[maybe_unused]] auto _ = syscall::close_fd(fd_);
  }
  fd_     = fd;
  owning_ = owning;
}

auto FileDescriptor::valid() const noexcept -> bool {
  return fd_ >= 0;
}

auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>> {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(fmt::format("Failed to create pipe: {}", syscall::error_message(errno)));
  }

  FileDescriptor read_end(fds[0]);
  FileDescriptor write_end(fds[1]);

  if (auto result = syscall::set_nonblocking(read_end.get()); !result) {
    return std::unexpected(fmt::format("Failed to make pipe non-blocking: {}", syscall::error_message(result.error())));
  }

  return std::make_pair(std::move(read_end), std::move(write_end));
}

} // namespace codebox::core
