// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "FileDescriptor.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace sb {

/**
 * @brief An anonymous memory file mapped into this process.
 *
 * The backing file is created with memfd_create so that its descriptor can be handed to a
 * window system server (wl_shm, MIT-SHM) which maps the same pages. The mapping and the
 * descriptor are released on destruction.
 */
class SharedMemory {
public:
  SharedMemory() = default;

  /// Creates and maps a file of @p size bytes. Throws std::system_error on failure.
  SharedMemory(const std::string& name, std::size_t size);

  SharedMemory(const SharedMemory&) = delete;
  auto operator=(const SharedMemory&) -> SharedMemory& = delete;

  SharedMemory(SharedMemory&& other) noexcept;
  auto operator=(SharedMemory&& other) noexcept -> SharedMemory&;

  ~SharedMemory();

  auto fd() const noexcept -> FileDescriptorHandle { return mFd; }

  /// A second descriptor for the same file, for APIs that take ownership of the descriptor.
  auto duplicate_fd() const -> FileDescriptor { return mFd.duplicate(); }

  auto bytes() const noexcept -> std::span<std::byte> { return mBytes; }

  auto data() const noexcept -> void* { return mBytes.data(); }

  auto size() const noexcept -> std::size_t { return mBytes.size(); }

private:
  auto unmap() noexcept -> void;

  FileDescriptor mFd;
  std::span<std::byte> mBytes;
};

} // namespace sb
