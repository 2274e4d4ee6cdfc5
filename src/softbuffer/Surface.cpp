// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Surface.hpp"
#include "ContextState.hpp"
#include "SurfaceState.hpp"
#include "softbuffer/Error.hpp"

#include "Logging.hpp"

#include <exception>
#include <format>
#include <stdexcept>

namespace sb {

namespace {

auto bind_window(const ContextState& context, const WindowHandle& window)
    -> std::unique_ptr<detail::BackendSurface> {
  Platform windowPlatform = platform_of(window);
  if (windowPlatform != context.mPlatform) {
    throw Error(ErrorCode::PlatformMismatch,
                std::format("cannot bind a {} window to a {} context", to_string(windowPlatform),
                            to_string(context.mPlatform)));
  }
  if (!is_complete(window)) {
    throw Error(ErrorCode::IncompleteHandle,
                std::format("{} window handle has no window", to_string(windowPlatform)));
  }
  try {
    return context.mBackend->create_surface(window);
  } catch (const Error&) {
    throw;
  } catch (const std::exception& error) {
    Log::e("Failed to bind {} window: {}", to_string(windowPlatform), describe(error));
    std::throw_with_nested(Error(ErrorCode::SurfaceInitError,
                                 std::format("cannot bind {} window", to_string(windowPlatform))));
  }
}

} // namespace

auto SurfaceState::require_no_guard(std::string_view operation) const -> void {
  if (mGuardAlive) {
    throw Error(ErrorCode::BufferInUse,
                std::format("{} called while a buffer guard is alive", operation));
  }
}

auto SurfaceState::require_sized(std::string_view operation) const -> void {
  if (mWidth == 0 || mHeight == 0) {
    throw Error(ErrorCode::NotSized, std::format("{} called before resize", operation));
  }
}

auto SurfaceState::present() -> void {
  try {
    mBackend->present();
  } catch (const Error&) {
    throw;
  } catch (const std::exception& error) {
    Log::w("Present failed on {} surface: {}", to_string(mPlatform), describe(error));
    std::throw_with_nested(Error(ErrorCode::PresentError,
                                 std::format("cannot present {}x{} buffer", mWidth, mHeight)));
  }
}

Surface::Surface(const Context& context, const WindowHandle& window) {
  if (!context.mState) {
    throw std::logic_error("Surface created from a moved-from Context");
  }
  mState = std::make_shared<SurfaceState>(
      SurfaceState{context.mState->mPlatform, bind_window(*context.mState, window)});
}

Surface::Surface(Surface&&) noexcept = default;

auto Surface::operator=(Surface&&) noexcept -> Surface& = default;

Surface::~Surface() = default;

auto Surface::platform() const noexcept -> Platform { return mState->mPlatform; }

auto Surface::width() const noexcept -> std::uint32_t { return mState->mWidth; }

auto Surface::height() const noexcept -> std::uint32_t { return mState->mHeight; }

auto Surface::is_sized() const noexcept -> bool { return mState->mWidth != 0; }

auto Surface::resize(std::uint32_t width, std::uint32_t height) -> void {
  if (width == 0 || height == 0) {
    throw Error(ErrorCode::InvalidDimensions,
                std::format("cannot resize surface to {}x{}", width, height));
  }
  mState->require_no_guard("resize");
  if (width == mState->mWidth && height == mState->mHeight) {
    return;
  }
  try {
    mState->mBackend->resize(width, height);
  } catch (const Error&) {
    throw;
  } catch (const std::exception& error) {
    Log::w("Resize of {} surface to {}x{} failed, keeping {}x{}: {}", to_string(mState->mPlatform),
           width, height, mState->mWidth, mState->mHeight, describe(error));
    std::throw_with_nested(
        Error(ErrorCode::ResizeError, std::format("cannot resize surface to {}x{}", width, height)));
  }
  Log::d("Resized {} surface from {}x{} to {}x{}", to_string(mState->mPlatform), mState->mWidth,
         mState->mHeight, width, height);
  mState->mWidth = width;
  mState->mHeight = height;
}

auto Surface::buffer_mut() -> BufferGuard {
  mState->require_sized("buffer_mut");
  mState->require_no_guard("buffer_mut");
  PixelBuffer* buffer = nullptr;
  try {
    buffer = &mState->mBackend->back_buffer();
  } catch (const Error&) {
    throw;
  } catch (const std::exception& error) {
    Log::w("Waiting for the back buffer of {} surface failed: {}", to_string(mState->mPlatform),
           describe(error));
    std::throw_with_nested(
        Error(ErrorCode::PresentError, "window system did not release the back buffer"));
  }
  if (buffer->width() != mState->mWidth || buffer->height() != mState->mHeight) {
    throw std::logic_error(std::format("Backend buffer is {}x{} but the surface is {}x{}",
                                       buffer->width(), buffer->height(), mState->mWidth,
                                       mState->mHeight));
  }
  std::uint8_t age = mState->mBackend->buffer_age();
  mState->mGuardAlive = true;
  return BufferGuard{mState, buffer->pixels(), mState->mWidth, mState->mHeight, age};
}

auto Surface::present() -> void {
  mState->require_sized("present");
  mState->require_no_guard("present");
  mState->present();
}

auto Surface::fetch() -> std::vector<std::uint32_t> {
  mState->require_sized("fetch");
  mState->require_no_guard("fetch");
  try {
    return mState->mBackend->fetch();
  } catch (const Error&) {
    throw;
  } catch (const std::exception& error) {
    Log::w("Reading back {} surface failed: {}", to_string(mState->mPlatform), describe(error));
    std::throw_with_nested(Error(ErrorCode::PresentError, "cannot read back window contents"));
  }
}

} // namespace sb
