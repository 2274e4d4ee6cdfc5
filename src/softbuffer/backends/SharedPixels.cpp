// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "SharedPixels.hpp"

#include <memory>

namespace sb::detail {

namespace {

class SharedPixelStorage : public PixelStorage {
public:
  SharedPixelStorage(const std::string& name, std::size_t bytes) : mMemory(name, bytes) {}

  auto data() noexcept -> std::uint32_t* override {
    return static_cast<std::uint32_t*>(mMemory.data());
  }

  auto capacity() const noexcept -> std::size_t override {
    return mMemory.size() / sizeof(std::uint32_t);
  }

  auto memory() const noexcept -> const SharedMemory& { return mMemory; }

private:
  SharedMemory mMemory;
};

} // namespace

auto allocate_shared_pixels(const std::string& name, std::uint32_t width, std::uint32_t height)
    -> SharedPixelBuffer {
  std::size_t bytes = PixelBuffer::checked_size_bytes(width, height);
  auto storage = std::make_unique<SharedPixelStorage>(name, bytes);
  const SharedMemory* memory = &storage->memory();
  return SharedPixelBuffer{PixelBuffer{std::move(storage), width, height}, memory};
}

} // namespace sb::detail
