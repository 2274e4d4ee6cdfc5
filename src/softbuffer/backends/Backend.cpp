// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Backend.hpp"
#include "OffscreenBackend.hpp"
#include "softbuffer/Error.hpp"

#if SOFTBUFFER_HAS_WAYLAND
#include "WaylandBackend.hpp"
#endif
#if SOFTBUFFER_HAS_X11
#include "X11Backend.hpp"
#endif
#if SOFTBUFFER_HAS_WIN32
#include "Win32Backend.hpp"
#endif

#include <format>

namespace sb::detail {

namespace {

auto unsupported(Platform platform) -> std::unique_ptr<BackendContext> {
  throw Error(ErrorCode::UnsupportedPlatform,
              std::format("softbuffer was built without the {} backend", to_string(platform)));
}

} // namespace

auto make_backend_context(const DisplayHandle& display, [[maybe_unused]] const Config& config)
    -> std::unique_ptr<BackendContext> {
  return std::visit(
      Overloaded{
          [&](const OffscreenDisplayHandle& handle) -> std::unique_ptr<BackendContext> {
            return std::make_unique<OffscreenContext>(*handle.display);
          },
#if SOFTBUFFER_HAS_WAYLAND
          [&](const WaylandDisplayHandle& handle) -> std::unique_ptr<BackendContext> {
            return std::make_unique<WaylandContext>(handle);
          },
#endif
#if SOFTBUFFER_HAS_X11
          [&](const XcbDisplayHandle& handle) -> std::unique_ptr<BackendContext> {
            return std::make_unique<X11Context>(handle, config);
          },
#endif
#if SOFTBUFFER_HAS_XLIB
          [&](const XlibDisplayHandle& handle) -> std::unique_ptr<BackendContext> {
            return std::make_unique<X11Context>(handle, config);
          },
#endif
#if SOFTBUFFER_HAS_WIN32
          [&](const Win32DisplayHandle&) -> std::unique_ptr<BackendContext> {
            return std::make_unique<Win32Context>();
          },
#endif
          [&](const auto& handle) -> std::unique_ptr<BackendContext> {
            return unsupported(platform_of(DisplayHandle{handle}));
          },
      },
      display);
}

} // namespace sb::detail
