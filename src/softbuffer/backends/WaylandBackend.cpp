// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "WaylandBackend.hpp"
#include "SharedPixels.hpp"
#include "narrow.hpp"
#include "softbuffer/Error.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <bit>
#include <cerrno>
#include <cstring>
#include <format>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace sb::detail {

namespace {

// wl_shm formats are little-endian. 0x00RRGGBB in host order is XRGB8888 on little-endian hosts
// and has the byte layout of BGRX8888 on big-endian ones.
constexpr std::uint32_t kPixelFormat =
    std::endian::native == std::endian::little ? WL_SHM_FORMAT_XRGB8888 : WL_SHM_FORMAT_BGRX8888;

} // namespace

WaylandContext::WaylandContext(const WaylandDisplayHandle& handle)
    : mDisplay(static_cast<wl_display*>(handle.display)) {
  check_connection("display is unusable");
  mQueue.reset(wl_display_create_queue(mDisplay));
  if (!mQueue) {
    throw std::system_error(ENOMEM, std::generic_category(), "Failed to create event queue");
  }
  mDisplayWrapper.reset(static_cast<wl_display*>(wl_proxy_create_wrapper(mDisplay)));
  if (!mDisplayWrapper) {
    throw std::system_error(ENOMEM, std::generic_category(), "Failed to wrap wl_display");
  }
  wl_proxy_set_queue(reinterpret_cast<wl_proxy*>(mDisplayWrapper.get()), mQueue.get());
  mRegistry.reset(wl_display_get_registry(mDisplayWrapper.get()));
  if (!mRegistry) {
    throw std::system_error(ENOMEM, std::generic_category(), "Failed to get wl_registry");
  }
  static constexpr wl_registry_listener kRegistryListener = {
      .global = &WaylandContext::handle_global,
      .global_remove = &WaylandContext::handle_global_remove,
  };
  wl_registry_add_listener(mRegistry.get(), &kRegistryListener, this);
  roundtrip();
  if (!mShm) {
    throw std::runtime_error("Compositor does not advertise wl_shm");
  }
  // second roundtrip collects the wl_shm.format events
  roundtrip();
  if (std::ranges::find(mFormats, kPixelFormat) == mFormats.end()) {
    throw std::runtime_error(std::format("Compositor does not support wl_shm format {:#x}",
                                         kPixelFormat));
  }
  Log::i("Connected to Wayland display, wl_shm advertises {} formats", mFormats.size());
}

WaylandContext::~WaylandContext() = default;

void WaylandContext::handle_global(void* data, wl_registry* registry, std::uint32_t name,
                                   const char* interface, std::uint32_t /* version */) {
  auto* self = static_cast<WaylandContext*>(data);
  if (std::strcmp(interface, wl_shm_interface.name) == 0 && !self->mShm) {
    self->mShm.reset(static_cast<wl_shm*>(wl_registry_bind(registry, name, &wl_shm_interface, 1)));
    static constexpr wl_shm_listener kShmListener = {.format = &WaylandContext::handle_format};
    wl_shm_add_listener(self->mShm.get(), &kShmListener, self);
  }
}

void WaylandContext::handle_global_remove(void*, wl_registry*, std::uint32_t) {}

void WaylandContext::handle_format(void* data, wl_shm*, std::uint32_t format) {
  static_cast<WaylandContext*>(data)->mFormats.push_back(format);
}

auto WaylandContext::create_surface(const WindowHandle& window)
    -> std::unique_ptr<BackendSurface> {
  auto* surface = static_cast<wl_surface*>(std::get<WaylandWindowHandle>(window).surface);
  return std::make_unique<WaylandSurface>(*this, surface);
}

auto WaylandContext::roundtrip() -> void {
  if (wl_display_roundtrip_queue(mDisplay, mQueue.get()) == -1) {
    throw_display_error("Roundtrip to the compositor failed");
  }
}

auto WaylandContext::dispatch() -> void {
  if (wl_display_dispatch_queue(mDisplay, mQueue.get()) == -1) {
    throw_display_error("Dispatching compositor events failed");
  }
}

auto WaylandContext::flush() -> void {
  if (wl_display_flush(mDisplay) == -1 && errno != EAGAIN) {
    // EAGAIN leaves the requests queued in the client library
    throw_display_error("Flushing requests to the compositor failed");
  }
}

auto WaylandContext::check_connection(std::string_view what) const -> void {
  if (wl_display_get_error(mDisplay) != 0) {
    throw_display_error(what);
  }
}

auto WaylandContext::throw_display_error(std::string_view what) const -> void {
  int error = wl_display_get_error(mDisplay);
  if (error == EPROTO) {
    const wl_interface* interface = nullptr;
    std::uint32_t id = 0;
    std::uint32_t code = wl_display_get_protocol_error(mDisplay, &interface, &id);
    throw std::runtime_error(std::format("{}: protocol error {} on {}@{}", what, code,
                                         interface ? interface->name : "unknown", id));
  }
  throw std::system_error(error != 0 ? error : errno, std::generic_category(), std::string(what));
}

WaylandBuffer::WaylandBuffer(WaylandContext& context, std::uint32_t width, std::uint32_t height) {
  SharedPixelBuffer shared = allocate_shared_pixels("softbuffer-wayland", width, height);
  std::optional<std::int32_t> size = try_narrow<std::int32_t>(shared.mBuffer.size_bytes());
  if (!size) {
    throw Error(ErrorCode::SizeOutOfRange,
                std::format("{}x{} exceeds the wl_shm pool size limit", width, height));
  }
  WaylandPtr<wl_shm_pool, wl_shm_pool_destroy> pool{
      wl_shm_create_pool(context.shm(), shared.mMemory->fd().native_handle(), *size)};
  if (!pool) {
    throw std::system_error(ENOMEM, std::generic_category(), "Failed to create wl_shm_pool");
  }
  mBuffer.reset(wl_shm_pool_create_buffer(pool.get(), 0, narrow<std::int32_t>(width),
                                          narrow<std::int32_t>(height),
                                          narrow<std::int32_t>(shared.mBuffer.stride_bytes()),
                                          kPixelFormat));
  if (!mBuffer) {
    throw std::system_error(ENOMEM, std::generic_category(), "Failed to create wl_buffer");
  }
  static constexpr wl_buffer_listener kBufferListener = {.release = &WaylandBuffer::handle_release};
  wl_buffer_add_listener(mBuffer.get(), &kBufferListener, this);
  mPixels = std::move(shared.mBuffer);
}

void WaylandBuffer::handle_release(void* data, wl_buffer*) {
  static_cast<WaylandBuffer*>(data)->mReleased = true;
}

WaylandSurface::WaylandSurface(WaylandContext& context, wl_surface* surface)
    : mContext(&context), mSurface(surface),
      mSurfaceVersion(wl_proxy_get_version(reinterpret_cast<wl_proxy*>(surface))) {
  mContext->check_connection("Cannot bind wl_surface");
}

auto WaylandSurface::resize(std::uint32_t width, std::uint32_t height) -> void {
  if (try_narrow<std::int32_t>(width) == std::nullopt ||
      try_narrow<std::int32_t>(height) == std::nullopt) {
    throw Error(ErrorCode::SizeOutOfRange,
                std::format("{}x{} does not fit into wl_buffer dimensions", width, height));
  }
  auto front = std::make_unique<WaylandBuffer>(*mContext, width, height);
  auto back = std::make_unique<WaylandBuffer>(*mContext, width, height);
  mContext->flush();
  mContext->check_connection("Compositor rejected the new buffers");
  mFront = std::move(front);
  mBack = std::move(back);
  mBackHandedOut = false;
}

auto WaylandSurface::back_buffer() -> PixelBuffer& {
  while (!mBack->is_released()) {
    mContext->dispatch();
  }
  mBackHandedOut = true;
  return mBack->pixels();
}

auto WaylandSurface::buffer_age() const noexcept -> std::uint8_t { return mBack->mAge; }

auto WaylandSurface::commit(WaylandBuffer& buffer) -> void {
  PixelBuffer& pixels = buffer.pixels();
  auto width = narrow<std::int32_t>(pixels.width());
  auto height = narrow<std::int32_t>(pixels.height());
  wl_surface_attach(mSurface, buffer.buffer(), 0, 0);
  if (mSurfaceVersion >= WL_SURFACE_DAMAGE_BUFFER_SINCE_VERSION) {
    wl_surface_damage_buffer(mSurface, 0, 0, width, height);
  } else {
    wl_surface_damage(mSurface, 0, 0, width, height);
  }
  wl_surface_commit(mSurface);
  buffer.mark_busy();
  mContext->flush();
}

auto WaylandSurface::present() -> void {
  if (!mBackHandedOut && mFront->mAge != 0) {
    // Nothing was drawn since the last present. The compositor keeps the front buffer contents
    // until we release them, so attaching it again shows the same frame.
    commit(*mFront);
    return;
  }
  commit(*mBack);
  mBack->mAge = 1;
  if (mFront->mAge != 0) {
    ++mFront->mAge;
  }
  std::swap(mFront, mBack);
  mBackHandedOut = false;
}

auto WaylandSurface::fetch() -> std::vector<std::uint32_t> {
  throw Error(ErrorCode::Unimplemented, "Wayland surfaces cannot be read back");
}

} // namespace sb::detail
