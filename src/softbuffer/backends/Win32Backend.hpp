// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Backend.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN 1
#endif
#ifndef NOMINMAX
#define NOMINMAX 1
#endif
#include <windows.h>

namespace sb::detail {

/// GDI needs no connection-scoped state.
class Win32Context : public BackendContext {
public:
  auto platform() const noexcept -> Platform override { return Platform::Win32; }

  auto create_surface(const WindowHandle& window) -> std::unique_ptr<BackendSurface> override;
};

/// Keeps the window's device context for its lifetime and copies the heap buffer into it with
/// SetDIBitsToDevice.
class Win32Surface : public BackendSurface {
public:
  explicit Win32Surface(HWND window);
  ~Win32Surface() override;

  Win32Surface(const Win32Surface&) = delete;
  auto operator=(const Win32Surface&) -> Win32Surface& = delete;

  auto resize(std::uint32_t width, std::uint32_t height) -> void override;
  auto back_buffer() -> PixelBuffer& override { return mBuffer; }
  auto buffer_age() const noexcept -> std::uint8_t override { return mPresented ? 1 : 0; }
  auto present() -> void override;
  auto fetch() -> std::vector<std::uint32_t> override;

private:
  HWND mWindow;
  HDC mDc;
  PixelBuffer mBuffer;
  bool mPresented = false;
};

} // namespace sb::detail
