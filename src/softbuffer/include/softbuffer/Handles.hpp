// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

namespace sb {

class OffscreenDisplay;

/// Identifies which window system a handle, context or surface belongs to.
enum class Platform { Xlib, Xcb, Wayland, Win32, AppKit, Web, Offscreen };

auto to_string(Platform platform) noexcept -> std::string_view;

// Raw display handles. These are handed to us by the windowing library and are never owned or
// destroyed here: the display must outlive every Context built from it.

struct XlibDisplayHandle {
  void* display;
  int screen;
};

struct XcbDisplayHandle {
  void* connection;
  int screen;
};

struct WaylandDisplayHandle {
  void* display;
};

struct Win32DisplayHandle {};

struct AppKitDisplayHandle {};

struct WebDisplayHandle {};

struct OffscreenDisplayHandle {
  OffscreenDisplay* display;
};

using DisplayHandle =
    std::variant<XlibDisplayHandle, XcbDisplayHandle, WaylandDisplayHandle, Win32DisplayHandle,
                 AppKitDisplayHandle, WebDisplayHandle, OffscreenDisplayHandle>;

// Raw window handles. The window must outlive every Surface built from it.

struct XlibWindowHandle {
  unsigned long window;
  unsigned long visual_id;
};

struct XcbWindowHandle {
  std::uint32_t window;
  std::uint32_t visual_id;
};

struct WaylandWindowHandle {
  void* surface;
};

struct Win32WindowHandle {
  void* hwnd;
};

struct AppKitWindowHandle {
  void* ns_view;
};

struct WebWindowHandle {
  std::uint32_t id;
};

struct OffscreenWindowHandle {
  std::uint32_t id;
};

using WindowHandle =
    std::variant<XlibWindowHandle, XcbWindowHandle, WaylandWindowHandle, Win32WindowHandle,
                 AppKitWindowHandle, WebWindowHandle, OffscreenWindowHandle>;

auto platform_of(const DisplayHandle& handle) noexcept -> Platform;

auto platform_of(const WindowHandle& handle) noexcept -> Platform;

/// False if a field that the backend needs to talk to the window system is null or zero.
auto is_complete(const DisplayHandle& handle) noexcept -> bool;

auto is_complete(const WindowHandle& handle) noexcept -> bool;

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};

} // namespace sb
