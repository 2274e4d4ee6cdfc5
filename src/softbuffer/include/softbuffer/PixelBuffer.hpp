// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "softbuffer/PixelsView.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace sb {

/// Memory that a PixelBuffer draws its pixels from. Heap memory for most backends, a
/// shared-memory mapping where the window system reads the pixels directly.
class PixelStorage {
public:
  virtual ~PixelStorage() = default;

  virtual auto data() noexcept -> std::uint32_t* = 0;

  /// Capacity in pixels.
  virtual auto capacity() const noexcept -> std::size_t = 0;
};

/**
 * @brief An owned block of width * height pixels packed as 0x00RRGGBB, row-major, without
 * padding between rows.
 *
 * A PixelBuffer never changes size. Backends replace the whole buffer on resize because memory
 * that was registered with a window system server cannot be grown in place.
 */
class PixelBuffer {
public:
  PixelBuffer() = default;

  /// Takes @p storage, which must hold at least width * height pixels.
  PixelBuffer(std::unique_ptr<PixelStorage> storage, std::uint32_t width, std::uint32_t height);

  /// Heap-allocates an uninitialised buffer. Throws Error(SizeOutOfRange) if the byte size
  /// overflows.
  static auto allocate(std::uint32_t width, std::uint32_t height) -> PixelBuffer;

  /// Byte size of a width * height buffer, or throws Error(SizeOutOfRange).
  static auto checked_size_bytes(std::uint32_t width, std::uint32_t height) -> std::size_t;

  auto width() const noexcept -> std::uint32_t { return mWidth; }
  auto height() const noexcept -> std::uint32_t { return mHeight; }

  auto empty() const noexcept -> bool { return mStorage == nullptr; }

  auto size() const noexcept -> std::size_t {
    return static_cast<std::size_t>(mWidth) * mHeight;
  }

  auto size_bytes() const noexcept -> std::size_t { return size() * sizeof(std::uint32_t); }

  auto stride_bytes() const noexcept -> std::size_t {
    return static_cast<std::size_t>(mWidth) * sizeof(std::uint32_t);
  }

  auto pixels() noexcept -> std::span<std::uint32_t>;
  auto pixels() const noexcept -> std::span<const std::uint32_t>;

  auto view() noexcept -> PixelsView;

  auto storage() noexcept -> PixelStorage* { return mStorage.get(); }

private:
  std::unique_ptr<PixelStorage> mStorage;
  std::uint32_t mWidth{};
  std::uint32_t mHeight{};
};

} // namespace sb
