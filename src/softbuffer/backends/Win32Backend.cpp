// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Win32Backend.hpp"
#include "narrow.hpp"
#include "softbuffer/Error.hpp"

#include <cstring>
#include <format>
#include <system_error>

namespace sb::detail {

namespace {

/// BITMAPINFO with room for the three BI_BITFIELDS channel masks.
struct BitmapInfo {
  BITMAPINFOHEADER mHeader;
  DWORD mMasks[3];
};

/// Describes a top-down 32-bit bitmap whose pixels are 0x00RRGGBB.
auto make_bitmap_info(std::int32_t width, std::int32_t height) noexcept -> BitmapInfo {
  BitmapInfo info{};
  info.mHeader.biSize = sizeof(BITMAPINFOHEADER);
  info.mHeader.biWidth = width;
  info.mHeader.biHeight = -height;
  info.mHeader.biPlanes = 1;
  info.mHeader.biBitCount = 32;
  info.mHeader.biCompression = BI_BITFIELDS;
  info.mMasks[0] = 0x00ff0000;
  info.mMasks[1] = 0x0000ff00;
  info.mMasks[2] = 0x000000ff;
  return info;
}

[[noreturn]] void throw_last_error(const char* what) {
  throw std::system_error(static_cast<int>(::GetLastError()), std::system_category(), what);
}

struct MemoryDc {
  HDC mDc;
  explicit MemoryDc(HDC compatible) : mDc(::CreateCompatibleDC(compatible)) {
    if (!mDc) {
      throw_last_error("CreateCompatibleDC failed");
    }
  }
  ~MemoryDc() { ::DeleteDC(mDc); }
  MemoryDc(const MemoryDc&) = delete;
  auto operator=(const MemoryDc&) -> MemoryDc& = delete;
};

struct GdiBitmap {
  HBITMAP mBitmap;
  ~GdiBitmap() {
    if (mBitmap) {
      ::DeleteObject(mBitmap);
    }
  }
};

} // namespace

auto Win32Context::create_surface(const WindowHandle& window) -> std::unique_ptr<BackendSurface> {
  return std::make_unique<Win32Surface>(static_cast<HWND>(std::get<Win32WindowHandle>(window).hwnd));
}

Win32Surface::Win32Surface(HWND window) : mWindow(window), mDc(::GetDC(window)) {
  if (!mDc) {
    throw_last_error("GetDC returned no device context");
  }
}

Win32Surface::~Win32Surface() { ::ReleaseDC(mWindow, mDc); }

auto Win32Surface::resize(std::uint32_t width, std::uint32_t height) -> void {
  if (!try_narrow<std::int32_t>(width) || !try_narrow<std::int32_t>(height)) {
    throw Error(ErrorCode::SizeOutOfRange,
                std::format("{}x{} does not fit into a GDI bitmap", width, height));
  }
  mBuffer = PixelBuffer::allocate(width, height);
  mPresented = false;
}

auto Win32Surface::present() -> void {
  auto width = narrow<std::int32_t>(mBuffer.width());
  auto height = narrow<std::int32_t>(mBuffer.height());
  BitmapInfo info = make_bitmap_info(width, height);
  int lines = ::SetDIBitsToDevice(mDc, 0, 0, static_cast<DWORD>(width), static_cast<DWORD>(height),
                                  0, 0, 0, static_cast<UINT>(height), mBuffer.pixels().data(),
                                  reinterpret_cast<const BITMAPINFO*>(&info), DIB_RGB_COLORS);
  if (lines == 0) {
    throw_last_error("SetDIBitsToDevice failed");
  }
  ::ValidateRect(mWindow, nullptr);
  mPresented = true;
}

auto Win32Surface::fetch() -> std::vector<std::uint32_t> {
  auto width = narrow<std::int32_t>(mBuffer.width());
  auto height = narrow<std::int32_t>(mBuffer.height());
  BitmapInfo info = make_bitmap_info(width, height);
  MemoryDc memoryDc{mDc};
  void* bits = nullptr;
  GdiBitmap bitmap{::CreateDIBSection(memoryDc.mDc, reinterpret_cast<const BITMAPINFO*>(&info),
                                      DIB_RGB_COLORS, &bits, nullptr, 0)};
  if (!bitmap.mBitmap || !bits) {
    throw_last_error("CreateDIBSection failed");
  }
  HGDIOBJ previous = ::SelectObject(memoryDc.mDc, bitmap.mBitmap);
  BOOL copied = ::BitBlt(memoryDc.mDc, 0, 0, width, height, mDc, 0, 0, SRCCOPY);
  ::GdiFlush();
  ::SelectObject(memoryDc.mDc, previous);
  if (!copied) {
    throw_last_error("BitBlt from the window failed");
  }
  std::vector<std::uint32_t> pixels(mBuffer.size());
  std::memcpy(pixels.data(), bits, mBuffer.size_bytes());
  for (std::uint32_t& pixel : pixels) {
    pixel &= 0x00ffffff;
  }
  return pixels;
}

} // namespace sb::detail
