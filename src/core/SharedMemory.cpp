// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "SharedMemory.hpp"
#include "narrow.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include <sys/mman.h>
#include <unistd.h>

namespace sb {

SharedMemory::SharedMemory(const std::string& name, std::size_t size)
    : mFd(::memfd_create(name.c_str(), MFD_CLOEXEC | MFD_ALLOW_SEALING)) {
  if (!mFd.is_valid()) {
    throw std::system_error(errno, std::generic_category(), "Failed to create shm file");
  }
  if (::ftruncate(mFd.native_handle(), narrow<off_t>(size)) == -1) {
    throw std::system_error(errno, std::generic_category(), "Failed to truncate shm file");
  }
  void* mapped = ::mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, mFd.native_handle(), 0);
  if (mapped == MAP_FAILED) {
    throw std::system_error(errno, std::generic_category(), "Failed to mmap shm file");
  }
  mBytes = std::span<std::byte>(static_cast<std::byte*>(mapped), size);
}

SharedMemory::SharedMemory(SharedMemory&& other) noexcept
    : mFd(std::move(other.mFd)), mBytes(std::exchange(other.mBytes, {})) {}

auto SharedMemory::operator=(SharedMemory&& other) noexcept -> SharedMemory& {
  if (this != &other) {
    unmap();
    mFd = std::move(other.mFd);
    mBytes = std::exchange(other.mBytes, {});
  }
  return *this;
}

SharedMemory::~SharedMemory() { unmap(); }

auto SharedMemory::unmap() noexcept -> void {
  if (!mBytes.empty()) {
    ::munmap(mBytes.data(), mBytes.size());
    mBytes = {};
  }
}

} // namespace sb
