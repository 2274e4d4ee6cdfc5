// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/PixelBuffer.hpp"
#include "softbuffer/Error.hpp"

#include <format>
#include <limits>
#include <stdexcept>

namespace sb {

namespace {

class HeapStorage : public PixelStorage {
public:
  explicit HeapStorage(std::size_t capacity)
      : mPixels(std::make_unique_for_overwrite<std::uint32_t[]>(capacity)), mCapacity(capacity) {}

  auto data() noexcept -> std::uint32_t* override { return mPixels.get(); }

  auto capacity() const noexcept -> std::size_t override { return mCapacity; }

private:
  std::unique_ptr<std::uint32_t[]> mPixels;
  std::size_t mCapacity;
};

} // namespace

auto PixelBuffer::checked_size_bytes(std::uint32_t width, std::uint32_t height) -> std::size_t {
  constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max() / sizeof(std::uint32_t);
  if (height != 0 && width > kMax / height) {
    throw Error(ErrorCode::SizeOutOfRange, std::format("{}x{} pixels overflow", width, height));
  }
  return static_cast<std::size_t>(width) * height * sizeof(std::uint32_t);
}

PixelBuffer::PixelBuffer(std::unique_ptr<PixelStorage> storage, std::uint32_t width,
                         std::uint32_t height)
    : mStorage(std::move(storage)), mWidth(width), mHeight(height) {
  if (!mStorage || mStorage->capacity() < size()) {
    throw std::logic_error("Pixel storage is smaller than width * height");
  }
}

auto PixelBuffer::allocate(std::uint32_t width, std::uint32_t height) -> PixelBuffer {
  std::size_t bytes = checked_size_bytes(width, height);
  return PixelBuffer{std::make_unique<HeapStorage>(bytes / sizeof(std::uint32_t)), width, height};
}

auto PixelBuffer::pixels() noexcept -> std::span<std::uint32_t> {
  if (!mStorage) {
    return {};
  }
  return std::span<std::uint32_t>(mStorage->data(), size());
}

auto PixelBuffer::pixels() const noexcept -> std::span<const std::uint32_t> {
  if (!mStorage) {
    return {};
  }
  return std::span<const std::uint32_t>(mStorage->data(), size());
}

auto PixelBuffer::view() noexcept -> PixelsView {
  return PixelsView{pixels(), Extents{mWidth, mHeight}};
}

} // namespace sb
