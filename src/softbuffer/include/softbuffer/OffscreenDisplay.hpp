// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "softbuffer/Handles.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace sb {

namespace detail {
class OffscreenContext;
class OffscreenSurface;
class OffscreenStorage;
} // namespace detail

/**
 * @brief An in-memory window system.
 *
 * Windows are plain ids, presented frames are kept in the display's native BGRX byte order and
 * can be read back. The display counts connections, bound windows and allocated buffers so that
 * callers can check that every native resource is released, and it can be told to fail its next
 * allocation or present to exercise error paths.
 *
 * The display must outlive every Context and Surface that uses it.
 */
class OffscreenDisplay {
public:
  struct Image {
    std::uint32_t width;
    std::uint32_t height;
    std::vector<std::uint32_t> pixels;
  };

  OffscreenDisplay() = default;

  OffscreenDisplay(const OffscreenDisplay&) = delete;
  auto operator=(const OffscreenDisplay&) -> OffscreenDisplay& = delete;

  auto handle() noexcept -> OffscreenDisplayHandle { return OffscreenDisplayHandle{this}; }

  auto create_window() -> OffscreenWindowHandle;

  /// Further presents to this window fail.
  auto destroy_window(OffscreenWindowHandle window) -> void;

  auto window_exists(OffscreenWindowHandle window) const -> bool;

  /// The last frame presented to @p window, decoded to 0x00RRGGBB.
  auto contents(OffscreenWindowHandle window) const -> std::optional<Image>;

  auto presented_frames(OffscreenWindowHandle window) const -> std::size_t;

  auto connections() const -> std::size_t;
  auto bound_windows() const -> std::size_t;
  auto live_buffers() const -> std::size_t;

  /// While set, new contexts fail to connect.
  auto refuse_connections(bool refuse) -> void;

  /// The allocation after the next @p successes allocations fails with ENOMEM.
  auto fail_allocation_after(std::size_t successes) -> void;

  /// The next present fails.
  auto fail_next_present() -> void;

private:
  friend class detail::OffscreenContext;
  friend class detail::OffscreenSurface;
  friend class detail::OffscreenStorage;

  struct WindowState {
    bool mAlive = true;
    bool mBound = false;
    std::uint32_t mWidth = 0;
    std::uint32_t mHeight = 0;
    std::vector<std::uint8_t> mFrame;
    std::size_t mFrameCount = 0;
  };

  auto connect() -> void;
  auto disconnect() noexcept -> void;

  auto bind_window(OffscreenWindowHandle window) -> void;
  auto unbind_window(OffscreenWindowHandle window) noexcept -> void;

  auto allocate_buffer() -> void;
  auto release_buffer() noexcept -> void;

  auto accept_frame(OffscreenWindowHandle window, std::uint32_t width, std::uint32_t height,
                    std::span<const std::uint32_t> pixels) -> void;

  auto find_window(OffscreenWindowHandle window) -> WindowState*;
  auto find_window(OffscreenWindowHandle window) const -> const WindowState*;

  mutable std::mutex mMutex;
  std::map<std::uint32_t, WindowState> mWindows;
  std::uint32_t mNextWindowId = 1;
  std::size_t mConnections = 0;
  std::size_t mLiveBuffers = 0;
  bool mRefuseConnections = false;
  std::optional<std::size_t> mAllocationsUntilFailure;
  bool mFailNextPresent = false;
};

} // namespace sb
