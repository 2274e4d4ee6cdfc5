// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/OffscreenDisplay.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace sb {

auto OffscreenDisplay::create_window() -> OffscreenWindowHandle {
  std::lock_guard lock{mMutex};
  std::uint32_t id = mNextWindowId++;
  mWindows.emplace(id, WindowState{});
  return OffscreenWindowHandle{id};
}

auto OffscreenDisplay::destroy_window(OffscreenWindowHandle window) -> void {
  std::lock_guard lock{mMutex};
  if (WindowState* state = find_window(window)) {
    state->mAlive = false;
  }
}

auto OffscreenDisplay::window_exists(OffscreenWindowHandle window) const -> bool {
  std::lock_guard lock{mMutex};
  const WindowState* state = find_window(window);
  return state && state->mAlive;
}

auto OffscreenDisplay::contents(OffscreenWindowHandle window) const -> std::optional<Image> {
  std::lock_guard lock{mMutex};
  const WindowState* state = find_window(window);
  if (!state || state->mFrameCount == 0) {
    return std::nullopt;
  }
  Image image{state->mWidth, state->mHeight, {}};
  image.pixels.reserve(static_cast<std::size_t>(image.width) * image.height);
  for (std::size_t offset = 0; offset + 4 <= state->mFrame.size(); offset += 4) {
    // stored as B, G, R, X
    image.pixels.push_back((std::uint32_t{state->mFrame[offset + 2]} << 16) |
                           (std::uint32_t{state->mFrame[offset + 1]} << 8) |
                           std::uint32_t{state->mFrame[offset]});
  }
  return image;
}

auto OffscreenDisplay::presented_frames(OffscreenWindowHandle window) const -> std::size_t {
  std::lock_guard lock{mMutex};
  const WindowState* state = find_window(window);
  return state ? state->mFrameCount : 0;
}

auto OffscreenDisplay::connections() const -> std::size_t {
  std::lock_guard lock{mMutex};
  return mConnections;
}

auto OffscreenDisplay::bound_windows() const -> std::size_t {
  std::lock_guard lock{mMutex};
  std::size_t count = 0;
  for (const auto& [id, state] : mWindows) {
    count += state.mBound ? 1 : 0;
  }
  return count;
}

auto OffscreenDisplay::live_buffers() const -> std::size_t {
  std::lock_guard lock{mMutex};
  return mLiveBuffers;
}

auto OffscreenDisplay::refuse_connections(bool refuse) -> void {
  std::lock_guard lock{mMutex};
  mRefuseConnections = refuse;
}

auto OffscreenDisplay::fail_allocation_after(std::size_t successes) -> void {
  std::lock_guard lock{mMutex};
  mAllocationsUntilFailure = successes;
}

auto OffscreenDisplay::fail_next_present() -> void {
  std::lock_guard lock{mMutex};
  mFailNextPresent = true;
}

auto OffscreenDisplay::connect() -> void {
  std::lock_guard lock{mMutex};
  if (mRefuseConnections) {
    throw std::system_error(ECONNREFUSED, std::generic_category(),
                            "Offscreen display refused the connection");
  }
  ++mConnections;
}

auto OffscreenDisplay::disconnect() noexcept -> void {
  std::lock_guard lock{mMutex};
  --mConnections;
}

auto OffscreenDisplay::bind_window(OffscreenWindowHandle window) -> void {
  std::lock_guard lock{mMutex};
  WindowState* state = find_window(window);
  if (!state || !state->mAlive) {
    throw std::system_error(ENOENT, std::generic_category(), "No such offscreen window");
  }
  if (state->mBound) {
    throw std::system_error(EBUSY, std::generic_category(),
                            "Offscreen window is already bound to a surface");
  }
  state->mBound = true;
}

auto OffscreenDisplay::unbind_window(OffscreenWindowHandle window) noexcept -> void {
  std::lock_guard lock{mMutex};
  if (WindowState* state = find_window(window)) {
    state->mBound = false;
  }
}

auto OffscreenDisplay::allocate_buffer() -> void {
  std::lock_guard lock{mMutex};
  if (mAllocationsUntilFailure) {
    if (*mAllocationsUntilFailure == 0) {
      mAllocationsUntilFailure.reset();
      throw std::system_error(ENOMEM, std::generic_category(),
                              "Offscreen display failed to allocate a buffer");
    }
    --*mAllocationsUntilFailure;
  }
  ++mLiveBuffers;
}

auto OffscreenDisplay::release_buffer() noexcept -> void {
  std::lock_guard lock{mMutex};
  --mLiveBuffers;
}

auto OffscreenDisplay::accept_frame(OffscreenWindowHandle window, std::uint32_t width,
                                    std::uint32_t height, std::span<const std::uint32_t> pixels)
    -> void {
  std::lock_guard lock{mMutex};
  if (mFailNextPresent) {
    mFailNextPresent = false;
    throw std::system_error(EIO, std::generic_category(), "Offscreen display rejected the frame");
  }
  WindowState* state = find_window(window);
  if (!state || !state->mAlive) {
    throw std::system_error(ENOENT, std::generic_category(), "Offscreen window was destroyed");
  }
  if (pixels.size() != static_cast<std::size_t>(width) * height) {
    throw std::logic_error("Frame size does not match its dimensions");
  }
  state->mFrame.resize(pixels.size() * 4);
  std::uint8_t* out = state->mFrame.data();
  for (std::uint32_t pixel : pixels) {
    *out++ = static_cast<std::uint8_t>(pixel);
    *out++ = static_cast<std::uint8_t>(pixel >> 8);
    *out++ = static_cast<std::uint8_t>(pixel >> 16);
    *out++ = 0;
  }
  state->mWidth = width;
  state->mHeight = height;
  ++state->mFrameCount;
}

auto OffscreenDisplay::find_window(OffscreenWindowHandle window) -> WindowState* {
  auto it = mWindows.find(window.id);
  return it != mWindows.end() ? &it->second : nullptr;
}

auto OffscreenDisplay::find_window(OffscreenWindowHandle window) const -> const WindowState* {
  auto it = mWindows.find(window.id);
  return it != mWindows.end() ? &it->second : nullptr;
}

} // namespace sb
