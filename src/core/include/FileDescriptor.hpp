// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <compare>

namespace sb {

/// Owning wrapper around a POSIX file descriptor. Closes the descriptor on destruction.
class FileDescriptor {
public:
  FileDescriptor() noexcept;
  explicit FileDescriptor(int handle) noexcept;

  FileDescriptor(const FileDescriptor&) = delete;
  auto operator=(const FileDescriptor&) -> FileDescriptor& = delete;

  FileDescriptor(FileDescriptor&& other) noexcept;
  auto operator=(FileDescriptor&& other) noexcept -> FileDescriptor&;

  ~FileDescriptor();

  auto native_handle() const noexcept -> int;

  auto is_valid() const noexcept -> bool { return mNativeHandle != -1; }

  /// Returns a new descriptor referring to the same open file. Throws std::system_error.
  auto duplicate() const -> FileDescriptor;

  /// Gives up ownership without closing.
  auto release() noexcept -> int;

  auto reset(int newHandle = -1) noexcept -> void;

private:
  int mNativeHandle;
};

class FileDescriptorHandle {
public:
  FileDescriptorHandle() noexcept : mNativeHandle(-1) {}

  FileDescriptorHandle(const FileDescriptor& fd) noexcept;

  explicit FileDescriptorHandle(int handle) noexcept;

  auto native_handle() const noexcept -> int;

  friend auto operator<=>(FileDescriptorHandle, FileDescriptorHandle) = default;

private:
  int mNativeHandle;
};

} // namespace sb
