// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "OffscreenBackend.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace sb::detail {

/// Heap pixels that count as one allocation on the display while they live.
class OffscreenStorage : public PixelStorage {
public:
  OffscreenStorage(OffscreenDisplay& display, std::size_t capacity)
      : mDisplay(&display), mPixels(capacity) {
    mDisplay->allocate_buffer();
  }

  ~OffscreenStorage() override { mDisplay->release_buffer(); }

  OffscreenStorage(const OffscreenStorage&) = delete;
  auto operator=(const OffscreenStorage&) -> OffscreenStorage& = delete;

  auto data() noexcept -> std::uint32_t* override { return mPixels.data(); }

  auto capacity() const noexcept -> std::size_t override { return mPixels.size(); }

private:
  OffscreenDisplay* mDisplay;
  std::vector<std::uint32_t> mPixels;
};

OffscreenContext::OffscreenContext(OffscreenDisplay& display) : mDisplay(&display) {
  mDisplay->connect();
  Log::i("Connected to offscreen display {}", static_cast<const void*>(mDisplay));
}

OffscreenContext::~OffscreenContext() { mDisplay->disconnect(); }

auto OffscreenContext::create_surface(const WindowHandle& window)
    -> std::unique_ptr<BackendSurface> {
  return std::make_unique<OffscreenSurface>(*mDisplay, std::get<OffscreenWindowHandle>(window));
}

OffscreenSurface::OffscreenSurface(OffscreenDisplay& display, OffscreenWindowHandle window)
    : mDisplay(&display), mWindow(window) {
  mDisplay->bind_window(mWindow);
}

OffscreenSurface::~OffscreenSurface() {
  mSlots = {};
  mDisplay->unbind_window(mWindow);
}

auto OffscreenSurface::make_slot(std::uint32_t width, std::uint32_t height) -> Slot {
  std::size_t bytes = PixelBuffer::checked_size_bytes(width, height);
  auto storage = std::make_unique<OffscreenStorage>(*mDisplay, bytes / sizeof(std::uint32_t));
  return Slot{PixelBuffer{std::move(storage), width, height}, 0};
}

auto OffscreenSurface::resize(std::uint32_t width, std::uint32_t height) -> void {
  // If the second allocation throws, the first slot is destroyed and released again before the
  // exception leaves this function.
  std::array<Slot, 2> slots{make_slot(width, height), make_slot(width, height)};
  mSlots = std::move(slots);
  mBack = 0;
  mBackHandedOut = false;
}

auto OffscreenSurface::back_buffer() -> PixelBuffer& {
  mBackHandedOut = true;
  return mSlots[mBack].mBuffer;
}

auto OffscreenSurface::buffer_age() const noexcept -> std::uint8_t { return mSlots[mBack].mAge; }

auto OffscreenSurface::present() -> void {
  Slot& front = mSlots[mBack ^ 1];
  if (!mBackHandedOut && front.mAge != 0) {
    // nothing was drawn since the last present, so the front buffer is still the current frame
    mDisplay->accept_frame(mWindow, front.mBuffer.width(), front.mBuffer.height(),
                           std::as_const(front.mBuffer).pixels());
    return;
  }
  Slot& back = mSlots[mBack];
  mDisplay->accept_frame(mWindow, back.mBuffer.width(), back.mBuffer.height(),
                         std::as_const(back.mBuffer).pixels());
  back.mAge = 1;
  if (front.mAge != 0) {
    ++front.mAge;
  }
  mBack ^= 1;
  mBackHandedOut = false;
}

auto OffscreenSurface::fetch() -> std::vector<std::uint32_t> {
  const PixelBuffer& current = mSlots[mBack].mBuffer;
  std::vector<std::uint32_t> pixels(current.size(), 0);
  std::optional<OffscreenDisplay::Image> image = mDisplay->contents(mWindow);
  if (!image) {
    return pixels;
  }
  // The window shows the last frame; read the region the surface currently covers.
  std::uint32_t width = std::min(image->width, current.width());
  std::uint32_t height = std::min(image->height, current.height());
  for (std::uint32_t y = 0; y < height; ++y) {
    auto first = image->pixels.begin() + static_cast<std::ptrdiff_t>(y) * image->width;
    std::copy(first, first + width,
              pixels.begin() + static_cast<std::ptrdiff_t>(y) * current.width());
  }
  return pixels;
}

} // namespace sb::detail
