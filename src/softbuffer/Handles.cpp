// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Handles.hpp"

namespace sb {

auto to_string(Platform platform) noexcept -> std::string_view {
  switch (platform) {
  case Platform::Xlib:
    return "xlib";
  case Platform::Xcb:
    return "xcb";
  case Platform::Wayland:
    return "wayland";
  case Platform::Win32:
    return "win32";
  case Platform::AppKit:
    return "appkit";
  case Platform::Web:
    return "web";
  case Platform::Offscreen:
    return "offscreen";
  }
  return "unknown";
}

auto platform_of(const DisplayHandle& handle) noexcept -> Platform {
  return std::visit(Overloaded{
                        [](const XlibDisplayHandle&) { return Platform::Xlib; },
                        [](const XcbDisplayHandle&) { return Platform::Xcb; },
                        [](const WaylandDisplayHandle&) { return Platform::Wayland; },
                        [](const Win32DisplayHandle&) { return Platform::Win32; },
                        [](const AppKitDisplayHandle&) { return Platform::AppKit; },
                        [](const WebDisplayHandle&) { return Platform::Web; },
                        [](const OffscreenDisplayHandle&) { return Platform::Offscreen; },
                    },
                    handle);
}

auto platform_of(const WindowHandle& handle) noexcept -> Platform {
  return std::visit(Overloaded{
                        [](const XlibWindowHandle&) { return Platform::Xlib; },
                        [](const XcbWindowHandle&) { return Platform::Xcb; },
                        [](const WaylandWindowHandle&) { return Platform::Wayland; },
                        [](const Win32WindowHandle&) { return Platform::Win32; },
                        [](const AppKitWindowHandle&) { return Platform::AppKit; },
                        [](const WebWindowHandle&) { return Platform::Web; },
                        [](const OffscreenWindowHandle&) { return Platform::Offscreen; },
                    },
                    handle);
}

auto is_complete(const DisplayHandle& handle) noexcept -> bool {
  return std::visit(Overloaded{
                        [](const XlibDisplayHandle& h) { return h.display != nullptr; },
                        [](const XcbDisplayHandle& h) { return h.connection != nullptr; },
                        [](const WaylandDisplayHandle& h) { return h.display != nullptr; },
                        [](const Win32DisplayHandle&) { return true; },
                        [](const AppKitDisplayHandle&) { return true; },
                        [](const WebDisplayHandle&) { return true; },
                        [](const OffscreenDisplayHandle& h) { return h.display != nullptr; },
                    },
                    handle);
}

auto is_complete(const WindowHandle& handle) noexcept -> bool {
  return std::visit(Overloaded{
                        [](const XlibWindowHandle& h) { return h.window != 0; },
                        [](const XcbWindowHandle& h) { return h.window != 0; },
                        [](const WaylandWindowHandle& h) { return h.surface != nullptr; },
                        [](const Win32WindowHandle& h) { return h.hwnd != nullptr; },
                        [](const AppKitWindowHandle& h) { return h.ns_view != nullptr; },
                        [](const WebWindowHandle& h) { return h.id != 0; },
                        [](const OffscreenWindowHandle& h) { return h.id != 0; },
                    },
                    handle);
}

} // namespace sb
