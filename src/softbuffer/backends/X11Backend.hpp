// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Backend.hpp"

#include <xcb/shm.h>
#include <xcb/xcb.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace sb::detail {

/**
 * @brief An xcb connection owned by the application, plus what we learned about it.
 *
 * MIT-SHM support is probed once here. Version 1.2 is required because segments are passed to
 * the server as memfd descriptors.
 */
class X11Context : public BackendContext {
public:
  X11Context(const XcbDisplayHandle& handle, const Config& config);
#if SOFTBUFFER_HAS_XLIB
  X11Context(const XlibDisplayHandle& handle, const Config& config);
#endif

  X11Context(const X11Context&) = delete;
  auto operator=(const X11Context&) -> X11Context& = delete;

  auto platform() const noexcept -> Platform override { return mPlatform; }

  auto create_surface(const WindowHandle& window) -> std::unique_ptr<BackendSurface> override;

  auto connection() const noexcept -> xcb_connection_t* { return mConnection; }

  auto shm_supported() const noexcept -> bool { return mShmSupported; }

  /// Largest request the server accepts, in bytes.
  auto max_request_bytes() const noexcept -> std::size_t { return mMaxRequestBytes; }

private:
  X11Context(xcb_connection_t* connection, Platform platform, const Config& config);

  xcb_connection_t* mConnection;
  Platform mPlatform;
  bool mShmSupported = false;
  std::size_t mMaxRequestBytes = 0;
};

/// An attached MIT-SHM segment. Detached on destruction.
class ShmSegment {
public:
  ShmSegment(xcb_connection_t* connection, xcb_shm_seg_t segment) noexcept
      : mConnection(connection), mSegment(segment) {}

  ShmSegment(ShmSegment&& other) noexcept;
  auto operator=(ShmSegment&& other) noexcept -> ShmSegment&;

  ~ShmSegment();

  auto id() const noexcept -> xcb_shm_seg_t { return mSegment; }

private:
  xcb_connection_t* mConnection;
  xcb_shm_seg_t mSegment;
};

/**
 * @brief Presents into a window with ShmPutImage, or PutImage when shared memory is not
 * available.
 *
 * Every present waits for the server to process the request, so the single buffer can be
 * handed out again without the server reading memory the application is overwriting.
 */
class X11Surface : public BackendSurface {
public:
  X11Surface(X11Context& context, xcb_window_t window);
  ~X11Surface() override;

  X11Surface(const X11Surface&) = delete;
  auto operator=(const X11Surface&) -> X11Surface& = delete;

  auto resize(std::uint32_t width, std::uint32_t height) -> void override;
  auto back_buffer() -> PixelBuffer& override;
  auto buffer_age() const noexcept -> std::uint8_t override;
  auto present() -> void override;
  auto fetch() -> std::vector<std::uint32_t> override;

private:
  auto put_image_shm() -> void;
  auto put_image_wire() -> void;

  X11Context* mContext;
  xcb_window_t mWindow;
  xcb_gcontext_t mGc;
  std::uint8_t mDepth;
  bool mSwapBytes;
  PixelBuffer mBuffer;
  std::optional<ShmSegment> mSegment;
  std::uint8_t mAge = 0;
};

} // namespace sb::detail
