// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Backend.hpp"
#include "softbuffer/OffscreenDisplay.hpp"

#include <array>

namespace sb::detail {

class OffscreenContext : public BackendContext {
public:
  explicit OffscreenContext(OffscreenDisplay& display);
  ~OffscreenContext() override;

  OffscreenContext(const OffscreenContext&) = delete;
  auto operator=(const OffscreenContext&) -> OffscreenContext& = delete;

  auto platform() const noexcept -> Platform override { return Platform::Offscreen; }

  auto create_surface(const WindowHandle& window) -> std::unique_ptr<BackendSurface> override;

private:
  OffscreenDisplay* mDisplay;
};

/// Double-buffered: the display copies the back buffer on present and the two buffers swap. A
/// present without a new back_buffer() call shows the last frame again.
class OffscreenSurface : public BackendSurface {
public:
  OffscreenSurface(OffscreenDisplay& display, OffscreenWindowHandle window);
  ~OffscreenSurface() override;

  OffscreenSurface(const OffscreenSurface&) = delete;
  auto operator=(const OffscreenSurface&) -> OffscreenSurface& = delete;

  auto resize(std::uint32_t width, std::uint32_t height) -> void override;
  auto back_buffer() -> PixelBuffer& override;
  auto buffer_age() const noexcept -> std::uint8_t override;
  auto present() -> void override;
  auto fetch() -> std::vector<std::uint32_t> override;

private:
  struct Slot {
    PixelBuffer mBuffer;
    std::uint8_t mAge = 0;
  };

  auto make_slot(std::uint32_t width, std::uint32_t height) -> Slot;

  OffscreenDisplay* mDisplay;
  OffscreenWindowHandle mWindow;
  std::array<Slot, 2> mSlots;
  std::size_t mBack = 0;
  /// Set once back_buffer() handed out the back buffer since the last present.
  bool mBackHandedOut = false;
};

} // namespace sb::detail
