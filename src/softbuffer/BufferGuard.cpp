// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/BufferGuard.hpp"
#include "SurfaceState.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace sb {

BufferGuard::BufferGuard(const std::shared_ptr<SurfaceState>& state,
                         std::span<std::uint32_t> pixels, std::uint32_t width,
                         std::uint32_t height, std::uint8_t age) noexcept
    : mState(state), mPixels(pixels), mWidth(width), mHeight(height), mAge(age) {}

BufferGuard::BufferGuard(BufferGuard&& other) noexcept
    : mState(std::move(other.mState)), mPixels(std::exchange(other.mPixels, {})),
      mWidth(other.mWidth), mHeight(other.mHeight), mAge(other.mAge) {}

auto BufferGuard::operator=(BufferGuard&& other) noexcept -> BufferGuard& {
  if (this != &other) {
    release();
    mState = std::move(other.mState);
    mPixels = std::exchange(other.mPixels, {});
    mWidth = other.mWidth;
    mHeight = other.mHeight;
    mAge = other.mAge;
  }
  return *this;
}

BufferGuard::~BufferGuard() { release(); }

// Empty if the guard was consumed or its surface was destroyed in the meantime.
auto BufferGuard::release() noexcept -> std::shared_ptr<SurfaceState> {
  std::shared_ptr<SurfaceState> state = std::exchange(mState, {}).lock();
  if (state) {
    state->mGuardAlive = false;
  }
  mPixels = {};
  return state;
}

auto BufferGuard::present() && -> void {
  std::shared_ptr<SurfaceState> state = release();
  if (!state) {
    throw std::logic_error("present called on a consumed or orphaned buffer guard");
  }
  state->present();
}

} // namespace sb
