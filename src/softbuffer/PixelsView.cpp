// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/PixelsView.hpp"

#include <algorithm>
#include <stdexcept>

namespace sb {

PixelsView::PixelsView(std::span<std::uint32_t> data, Extents extents) noexcept
    : mData(data.data()), mExtents(extents), mRowStride(extents.width) {}

PixelsView::PixelsView(std::uint32_t* data, Extents extents, std::size_t rowStride) noexcept
    : mData(data), mExtents(extents), mRowStride(rowStride) {}

auto PixelsView::row(std::size_t y) const -> std::span<std::uint32_t> {
  if (y >= height()) {
    throw std::out_of_range("Row index exceeds view height");
  }
  return std::span<std::uint32_t>(mData + y * mRowStride, width());
}

auto PixelsView::subview(Position pos) const -> PixelsView {
  if (pos.x > width() || pos.y > height()) {
    throw std::out_of_range("Subview position exceeds parent view bounds");
  }
  return this->subview(pos, Extents{width() - pos.x, height() - pos.y});
}

auto PixelsView::subview(Position pos, Extents extents) const -> PixelsView {
  if (pos.x + extents.width > width() || pos.y + extents.height > height()) {
    throw std::out_of_range("Subview extents exceed parent view bounds");
  }
  return PixelsView{mData + pos.y * mRowStride + pos.x, extents, mRowStride};
}

auto PixelsView::fill(std::uint32_t pixel) const noexcept -> void {
  for (std::size_t y = 0; y < height(); ++y) {
    std::uint32_t* first = mData + y * mRowStride;
    std::fill(first, first + width(), pixel);
  }
}

} // namespace sb
