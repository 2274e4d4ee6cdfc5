// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "X11Backend.hpp"
#include "PutImageRows.hpp"
#include "SharedPixels.hpp"
#include "narrow.hpp"
#include "softbuffer/Error.hpp"

#include "Logging.hpp"

#if SOFTBUFFER_HAS_XLIB
#include <X11/Xlib-xcb.h>
#endif

#include <algorithm>
#include <bit>
#include <cstdlib>
#include <cstring>
#include <format>
#include <span>
#include <stdexcept>
#include <utility>

namespace sb::detail {

namespace {

struct FreeDeleter {
  void operator()(void* pointer) const noexcept { std::free(pointer); }
};

template <class T> using XcbReply = std::unique_ptr<T, FreeDeleter>;

using XcbError = std::unique_ptr<xcb_generic_error_t, FreeDeleter>;

auto check(xcb_connection_t* connection, xcb_void_cookie_t cookie, std::string_view what)
    -> void {
  XcbError error{xcb_request_check(connection, cookie)};
  if (error) {
    throw std::runtime_error(std::format("{}: X error {} (major opcode {}, minor opcode {})", what,
                                         error->error_code, error->major_code, error->minor_code));
  }
}

auto probe_shm(xcb_connection_t* connection) -> bool {
  const xcb_query_extension_reply_t* extension = xcb_get_extension_data(connection, &xcb_shm_id);
  if (extension == nullptr || !extension->present) {
    return false;
  }
  xcb_generic_error_t* rawError = nullptr;
  XcbReply<xcb_shm_query_version_reply_t> version{
      xcb_shm_query_version_reply(connection, xcb_shm_query_version(connection), &rawError)};
  XcbError error{rawError};
  if (!version) {
    return false;
  }
  return version->major_version > 1 || (version->major_version == 1 && version->minor_version >= 2);
}

auto bits_per_pixel(xcb_connection_t* connection, std::uint8_t depth) -> std::uint8_t {
  const xcb_setup_t* setup = xcb_get_setup(connection);
  for (auto it = xcb_setup_pixmap_formats_iterator(setup); it.rem > 0;
       xcb_format_next(&it)) {
    if (it.data->depth == depth) {
      return it.data->bits_per_pixel;
    }
  }
  return 0;
}

auto connection_error_name(int code) -> std::string_view {
  switch (code) {
  case XCB_CONN_ERROR:
    return "socket, pipe or stream error";
  case XCB_CONN_CLOSED_EXT_NOTSUPPORTED:
    return "extension not supported";
  case XCB_CONN_CLOSED_MEM_INSUFFICIENT:
    return "insufficient memory";
  case XCB_CONN_CLOSED_REQ_LEN_EXCEED:
    return "request length exceeded";
  case XCB_CONN_CLOSED_PARSE_ERR:
    return "display string parse error";
  case XCB_CONN_CLOSED_INVALID_SCREEN:
    return "invalid screen";
  default:
    return "unknown error";
  }
}

} // namespace

X11Context::X11Context(const XcbDisplayHandle& handle, const Config& config)
    : X11Context(static_cast<xcb_connection_t*>(handle.connection), Platform::Xcb, config) {}

#if SOFTBUFFER_HAS_XLIB
X11Context::X11Context(const XlibDisplayHandle& handle, const Config& config)
    : X11Context(XGetXCBConnection(static_cast<Display*>(handle.display)), Platform::Xlib,
                 config) {}
#endif

X11Context::X11Context(xcb_connection_t* connection, Platform platform, const Config& config)
    : mConnection(connection), mPlatform(platform) {
  if (mConnection == nullptr) {
    throw std::runtime_error("Display has no xcb connection");
  }
  if (int code = xcb_connection_has_error(mConnection); code != 0) {
    throw std::runtime_error(
        std::format("xcb connection is broken: {}", connection_error_name(code)));
  }
  mMaxRequestBytes = static_cast<std::size_t>(xcb_get_maximum_request_length(mConnection)) * 4;
  if (config.allow_shared_memory) {
    mShmSupported = probe_shm(mConnection);
    if (!mShmSupported) {
      Log::w("MIT-SHM 1.2 is not available, falling back to PutImage");
    }
  }
  Log::i("Connected to X server via {}, shm={}, max request {} bytes", to_string(mPlatform),
         mShmSupported, mMaxRequestBytes);
}

auto X11Context::create_surface(const WindowHandle& window) -> std::unique_ptr<BackendSurface> {
  xcb_window_t id = std::visit(Overloaded{
                                   [](const XcbWindowHandle& h) { return xcb_window_t{h.window}; },
                                   [](const XlibWindowHandle& h) {
                                     return narrow<xcb_window_t>(h.window);
                                   },
                                   [](const auto&) -> xcb_window_t {
                                     throw std::logic_error("Not an X11 window handle");
                                   },
                               },
                               window);
  return std::make_unique<X11Surface>(*this, id);
}

ShmSegment::ShmSegment(ShmSegment&& other) noexcept
    : mConnection(std::exchange(other.mConnection, nullptr)), mSegment(other.mSegment) {}

auto ShmSegment::operator=(ShmSegment&& other) noexcept -> ShmSegment& {
  if (this != &other) {
    if (mConnection) {
      xcb_shm_detach(mConnection, mSegment);
    }
    mConnection = std::exchange(other.mConnection, nullptr);
    mSegment = other.mSegment;
  }
  return *this;
}

ShmSegment::~ShmSegment() {
  if (mConnection) {
    xcb_shm_detach(mConnection, mSegment);
  }
}

X11Surface::X11Surface(X11Context& context, xcb_window_t window)
    : mContext(&context), mWindow(window), mGc(0), mDepth(0), mSwapBytes(false) {
  xcb_connection_t* connection = mContext->connection();
  xcb_generic_error_t* rawError = nullptr;
  XcbReply<xcb_get_geometry_reply_t> geometry{
      xcb_get_geometry_reply(connection, xcb_get_geometry(connection, mWindow), &rawError)};
  XcbError error{rawError};
  if (!geometry) {
    throw std::runtime_error(std::format("Window {:#x} does not exist (X error {})", mWindow,
                                         error ? error->error_code : 0));
  }
  mDepth = geometry->depth;
  if (bits_per_pixel(connection, mDepth) != 32) {
    throw std::runtime_error(
        std::format("Window depth {} is not stored as 32 bits per pixel", mDepth));
  }
  const xcb_setup_t* setup = xcb_get_setup(connection);
  bool serverLittleEndian = setup->image_byte_order == XCB_IMAGE_ORDER_LSB_FIRST;
  mSwapBytes = serverLittleEndian != (std::endian::native == std::endian::little);

  mGc = xcb_generate_id(connection);
  check(connection, xcb_create_gc_checked(connection, mGc, mWindow, 0, nullptr),
        "Failed to create graphics context");
}

X11Surface::~X11Surface() {
  mSegment.reset();
  xcb_free_gc(mContext->connection(), mGc);
  xcb_flush(mContext->connection());
}

auto X11Surface::resize(std::uint32_t width, std::uint32_t height) -> void {
  if (!try_narrow<std::uint16_t>(width) || !try_narrow<std::uint16_t>(height)) {
    throw Error(ErrorCode::SizeOutOfRange,
                std::format("{}x{} exceeds the X11 maximum of 65535x65535", width, height));
  }
  xcb_connection_t* connection = mContext->connection();
  // Byte-swapped servers need a converted copy, which shared memory cannot give them.
  if (mContext->shm_supported() && !mSwapBytes) {
    SharedPixelBuffer shared = allocate_shared_pixels("softbuffer-x11", width, height);
    xcb_shm_seg_t segment = xcb_generate_id(connection);
    // xcb closes the descriptor once it was sent
    FileDescriptor fd = shared.mMemory->duplicate_fd();
    check(connection, xcb_shm_attach_fd_checked(connection, segment, fd.release(), 0),
          "Failed to attach shared memory segment");
    ShmSegment attached{connection, segment};
    mBuffer = std::move(shared.mBuffer);
    mSegment = std::move(attached);
  } else {
    if (put_image_rows_per_request(mContext->max_request_bytes(),
                                   std::size_t{width} * sizeof(std::uint32_t)) == 0) {
      throw Error(ErrorCode::SizeOutOfRange,
                  std::format("a row of {} pixels does not fit into one PutImage request of at "
                              "most {} bytes",
                              width, mContext->max_request_bytes()));
    }
    PixelBuffer buffer = PixelBuffer::allocate(width, height);
    mSegment.reset();
    mBuffer = std::move(buffer);
  }
  mAge = 0;
}

auto X11Surface::back_buffer() -> PixelBuffer& { return mBuffer; }

auto X11Surface::buffer_age() const noexcept -> std::uint8_t { return mAge; }

auto X11Surface::present() -> void {
  if (mSegment) {
    put_image_shm();
  } else {
    put_image_wire();
  }
  mAge = 1;
}

auto X11Surface::put_image_shm() -> void {
  xcb_connection_t* connection = mContext->connection();
  auto width = narrow<std::uint16_t>(mBuffer.width());
  auto height = narrow<std::uint16_t>(mBuffer.height());
  xcb_void_cookie_t cookie = xcb_shm_put_image_checked(
      connection, mWindow, mGc, width, height, 0, 0, width, height, 0, 0, mDepth,
      XCB_IMAGE_FORMAT_Z_PIXMAP, 0, mSegment->id(), 0);
  check(connection, cookie, "ShmPutImage failed");
}

auto X11Surface::put_image_wire() -> void {
  xcb_connection_t* connection = mContext->connection();
  // resize() refused widths of which not even one row fits
  const std::size_t maxRows =
      put_image_rows_per_request(mContext->max_request_bytes(), mBuffer.stride_bytes());
  auto width = narrow<std::uint16_t>(mBuffer.width());
  std::span<const std::uint32_t> pixels = std::as_const(mBuffer).pixels();
  std::vector<std::uint32_t> swapped;

  std::vector<xcb_void_cookie_t> cookies;
  for (std::size_t row = 0; row < mBuffer.height(); row += maxRows) {
    std::size_t rows = std::min<std::size_t>(maxRows, mBuffer.height() - row);
    std::span<const std::uint32_t> chunk = pixels.subspan(row * mBuffer.width(), rows * mBuffer.width());
    if (mSwapBytes) {
      swapped.resize(chunk.size());
      std::ranges::transform(chunk, swapped.begin(),
                             [](std::uint32_t pixel) { return std::byteswap(pixel); });
      chunk = swapped;
    }
    cookies.push_back(xcb_put_image_checked(
        connection, XCB_IMAGE_FORMAT_Z_PIXMAP, mWindow, mGc, width, narrow<std::uint16_t>(rows), 0,
        narrow<std::int16_t>(row), 0, mDepth, narrow<std::uint32_t>(chunk.size_bytes()),
        reinterpret_cast<const std::uint8_t*>(chunk.data())));
  }
  for (xcb_void_cookie_t cookie : cookies) {
    check(connection, cookie, "PutImage failed");
  }
}

auto X11Surface::fetch() -> std::vector<std::uint32_t> {
  xcb_connection_t* connection = mContext->connection();
  auto width = narrow<std::uint16_t>(mBuffer.width());
  auto height = narrow<std::uint16_t>(mBuffer.height());
  xcb_generic_error_t* rawError = nullptr;
  XcbReply<xcb_get_image_reply_t> image{xcb_get_image_reply(
      connection,
      xcb_get_image(connection, XCB_IMAGE_FORMAT_Z_PIXMAP, mWindow, 0, 0, width, height,
                    ~std::uint32_t{0}),
      &rawError)};
  XcbError error{rawError};
  if (!image) {
    throw std::runtime_error(
        std::format("GetImage failed (X error {})", error ? error->error_code : 0));
  }
  std::size_t length = static_cast<std::size_t>(xcb_get_image_data_length(image.get()));
  if (length < mBuffer.size_bytes()) {
    throw std::runtime_error(std::format("GetImage returned {} bytes, expected {}", length,
                                         mBuffer.size_bytes()));
  }
  std::vector<std::uint32_t> pixels(mBuffer.size());
  std::memcpy(pixels.data(), xcb_get_image_data(image.get()), mBuffer.size_bytes());
  for (std::uint32_t& pixel : pixels) {
    if (mSwapBytes) {
      pixel = std::byteswap(pixel);
    }
    pixel &= 0x00ffffff;
  }
  return pixels;
}

} // namespace sb::detail
