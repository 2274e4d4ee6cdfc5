// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace sb {

struct Position {
  std::size_t x;
  std::size_t y;

  auto operator==(Position const&) const -> bool = default;
};

struct Extents {
  std::size_t width;
  std::size_t height;

  auto operator==(Extents const&) const -> bool = default;
};

/// Packs 8-bit channels into the 0x00RRGGBB layout used by every buffer.
constexpr auto rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept -> std::uint32_t {
  return (std::uint32_t{r} << 16) | (std::uint32_t{g} << 8) | std::uint32_t{b};
}

constexpr auto red(std::uint32_t pixel) noexcept -> std::uint8_t {
  return static_cast<std::uint8_t>(pixel >> 16);
}

constexpr auto green(std::uint32_t pixel) noexcept -> std::uint8_t {
  return static_cast<std::uint8_t>(pixel >> 8);
}

constexpr auto blue(std::uint32_t pixel) noexcept -> std::uint8_t {
  return static_cast<std::uint8_t>(pixel);
}

/// A non-owning 2-D window into row-major pixel memory. Rows may be further apart than the
/// view is wide when the view was produced by subview().
class PixelsView {
public:
  PixelsView() = default;

  explicit PixelsView(std::span<std::uint32_t> data, Extents extents) noexcept;

  auto width() const noexcept -> std::size_t { return mExtents.width; }
  auto height() const noexcept -> std::size_t { return mExtents.height; }

  auto data() const noexcept -> std::uint32_t* { return mData; }

  auto extents() const noexcept -> Extents { return mExtents; }

  /// Distance between two rows, in pixels.
  auto row_stride() const noexcept -> std::size_t { return mRowStride; }

  auto row(std::size_t y) const -> std::span<std::uint32_t>;

  auto subview(Position pos) const -> PixelsView;

  auto subview(Position pos, Extents extents) const -> PixelsView;

  auto fill(std::uint32_t pixel) const noexcept -> void;

  auto operator[](std::size_t x, std::size_t y) const noexcept -> std::uint32_t& {
    return mData[y * mRowStride + x];
  }

private:
  PixelsView(std::uint32_t* data, Extents extents, std::size_t rowStride) noexcept;

  std::uint32_t* mData{};
  Extents mExtents{};
  std::size_t mRowStride{};
};

} // namespace sb
