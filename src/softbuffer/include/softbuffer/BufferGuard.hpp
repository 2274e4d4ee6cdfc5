// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "softbuffer/PixelsView.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace sb {

struct SurfaceState;

/**
 * @brief Exclusive write access to a Surface's pixel buffer for one frame.
 *
 * Obtained from Surface::buffer_mut(). The pixels are width() * height() values packed as
 * 0x00RRGGBB, row-major, without padding. Their initial contents are unspecified: they may be
 * a previous frame (see age()) or garbage, never guaranteed to be cleared.
 *
 * The guard cannot be copied. While it lives the surface refuses another buffer_mut(), resize()
 * and present(). Destroying the guard without calling present() discards the write session.
 *
 * The pixels belong to the surface. After the Surface is destroyed or assigned over they must
 * not be touched; present() then throws std::logic_error and destroying the guard does nothing.
 */
class BufferGuard {
public:
  BufferGuard(const BufferGuard&) = delete;
  auto operator=(const BufferGuard&) -> BufferGuard& = delete;

  BufferGuard(BufferGuard&& other) noexcept;
  auto operator=(BufferGuard&& other) noexcept -> BufferGuard&;

  ~BufferGuard();

  auto pixels() const noexcept -> std::span<std::uint32_t> { return mPixels; }

  auto view() const noexcept -> PixelsView {
    return PixelsView{mPixels, Extents{mWidth, mHeight}};
  }

  auto width() const noexcept -> std::uint32_t { return mWidth; }
  auto height() const noexcept -> std::uint32_t { return mHeight; }
  auto size() const noexcept -> std::size_t { return mPixels.size(); }

  /// 0: contents are undefined. 1: contents are the last presented frame. 2: contents are the
  /// frame presented before that.
  auto age() const noexcept -> std::uint8_t { return mAge; }

  auto operator[](std::size_t index) const noexcept -> std::uint32_t& { return mPixels[index]; }

  auto operator[](std::size_t x, std::size_t y) const noexcept -> std::uint32_t& {
    return mPixels[y * mWidth + x];
  }

  /// Presents the whole buffer and consumes the guard. Throws Error(PresentError) with the
  /// native cause nested; the surface stays sized and usable either way. Throws
  /// std::logic_error if the guard was already consumed or its surface is gone.
  auto present() && -> void;

private:
  friend class Surface;
  BufferGuard(const std::shared_ptr<SurfaceState>& state, std::span<std::uint32_t> pixels,
              std::uint32_t width, std::uint32_t height, std::uint8_t age) noexcept;

  auto release() noexcept -> std::shared_ptr<SurfaceState>;

  std::weak_ptr<SurfaceState> mState;
  std::span<std::uint32_t> mPixels;
  std::uint32_t mWidth;
  std::uint32_t mHeight;
  std::uint8_t mAge;
};

} // namespace sb
