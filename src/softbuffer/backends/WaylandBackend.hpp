// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Backend.hpp"

#include <wayland-client.h>

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace sb::detail {

template <auto DestroyFn> struct WaylandDeleter {
  template <class T> void operator()(T* object) const noexcept { DestroyFn(object); }
};

template <class T, auto DestroyFn> using WaylandPtr = std::unique_ptr<T, WaylandDeleter<DestroyFn>>;

/**
 * @brief Binds wl_shm on a private event queue of the application's wl_display.
 *
 * Events for objects created here (the registry, wl_shm, pools and buffers) are dispatched on
 * our own queue so that waiting for a buffer release never dispatches the application's events.
 */
class WaylandContext : public BackendContext {
public:
  explicit WaylandContext(const WaylandDisplayHandle& handle);
  ~WaylandContext() override;

  WaylandContext(const WaylandContext&) = delete;
  auto operator=(const WaylandContext&) -> WaylandContext& = delete;

  auto platform() const noexcept -> Platform override { return Platform::Wayland; }

  auto create_surface(const WindowHandle& window) -> std::unique_ptr<BackendSurface> override;

  auto shm() const noexcept -> wl_shm* { return mShm.get(); }

  /// Blocks until at least one event on our queue was dispatched.
  auto dispatch() -> void;

  /// Sends queued requests. Throws if the connection is broken.
  auto flush() -> void;

  /// Throws if the compositor raised a protocol error on the connection.
  auto check_connection(std::string_view what) const -> void;

private:
  static void handle_global(void* data, wl_registry* registry, std::uint32_t name,
                            const char* interface, std::uint32_t version);
  static void handle_global_remove(void* data, wl_registry* registry, std::uint32_t name);
  static void handle_format(void* data, wl_shm* shm, std::uint32_t format);

  auto roundtrip() -> void;

  [[noreturn]] auto throw_display_error(std::string_view what) const -> void;

  wl_display* mDisplay;
  WaylandPtr<wl_event_queue, wl_event_queue_destroy> mQueue;
  WaylandPtr<wl_display, wl_proxy_wrapper_destroy> mDisplayWrapper;
  WaylandPtr<wl_registry, wl_registry_destroy> mRegistry;
  WaylandPtr<wl_shm, wl_shm_destroy> mShm;
  std::vector<std::uint32_t> mFormats;
};

/// One wl_buffer over its own memfd mapping.
class WaylandBuffer {
public:
  WaylandBuffer(WaylandContext& context, std::uint32_t width, std::uint32_t height);

  WaylandBuffer(const WaylandBuffer&) = delete;
  auto operator=(const WaylandBuffer&) -> WaylandBuffer& = delete;

  auto pixels() noexcept -> PixelBuffer& { return mPixels; }
  auto buffer() const noexcept -> wl_buffer* { return mBuffer.get(); }

  auto is_released() const noexcept -> bool { return mReleased; }
  auto mark_busy() noexcept -> void { mReleased = false; }

  std::uint8_t mAge = 0;

private:
  static void handle_release(void* data, wl_buffer* buffer);

  PixelBuffer mPixels;
  WaylandPtr<wl_buffer, wl_buffer_destroy> mBuffer;
  bool mReleased = true;
};

/// Double-buffered. The front buffer is the one the compositor may still read from. A present
/// without a new back_buffer() call commits the front buffer again.
class WaylandSurface : public BackendSurface {
public:
  WaylandSurface(WaylandContext& context, wl_surface* surface);

  auto resize(std::uint32_t width, std::uint32_t height) -> void override;
  auto back_buffer() -> PixelBuffer& override;
  auto buffer_age() const noexcept -> std::uint8_t override;
  auto present() -> void override;
  auto fetch() -> std::vector<std::uint32_t> override;

private:
  auto commit(WaylandBuffer& buffer) -> void;

  WaylandContext* mContext;
  wl_surface* mSurface;
  std::uint32_t mSurfaceVersion;
  std::unique_ptr<WaylandBuffer> mFront;
  std::unique_ptr<WaylandBuffer> mBack;
  bool mBackHandedOut = false;
};

} // namespace sb::detail
