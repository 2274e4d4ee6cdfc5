// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "FileDescriptor.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace sb {

FileDescriptor::FileDescriptor() noexcept : mNativeHandle(-1) {}

FileDescriptor::FileDescriptor(int handle) noexcept : mNativeHandle(handle) {}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : mNativeHandle(other.mNativeHandle) {
  other.mNativeHandle = -1;
}

auto FileDescriptor::operator=(FileDescriptor&& other) noexcept -> FileDescriptor& {
  if (this != &other) {
    this->reset(other.mNativeHandle);
    other.mNativeHandle = -1;
  }
  return *this;
}

FileDescriptor::~FileDescriptor() { this->reset(); }

auto FileDescriptor::native_handle() const noexcept -> int { return mNativeHandle; }

auto FileDescriptor::duplicate() const -> FileDescriptor {
  int copy = ::fcntl(mNativeHandle, F_DUPFD_CLOEXEC, 0);
  if (copy == -1) {
    throw std::system_error(errno, std::generic_category(), "Failed to duplicate file descriptor");
  }
  return FileDescriptor{copy};
}

auto FileDescriptor::release() noexcept -> int {
  int handle = mNativeHandle;
  mNativeHandle = -1;
  return handle;
}

auto FileDescriptor::reset(int newHandle) noexcept -> void {
  if (mNativeHandle != -1) {
    ::close(mNativeHandle);
  }
  mNativeHandle = newHandle;
}

FileDescriptorHandle::FileDescriptorHandle(int handle) noexcept : mNativeHandle(handle) {}

FileDescriptorHandle::FileDescriptorHandle(const FileDescriptor& fd) noexcept
    : mNativeHandle(fd.native_handle()) {}

auto FileDescriptorHandle::native_handle() const noexcept -> int { return mNativeHandle; }

} // namespace sb
