// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "softbuffer/Config.hpp"
#include "softbuffer/Handles.hpp"
#include "softbuffer/PixelBuffer.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace sb::detail {

/**
 * @brief The window-scoped half of a backend.
 *
 * Errors are reported by throwing. Native failures may escape as std::system_error or any other
 * std::exception; the Surface facade attaches them to an sb::Error of the matching code.
 */
class BackendSurface {
public:
  virtual ~BackendSurface() = default;

  /// Reallocates native resources for the new size. Only called with non-zero dimensions that
  /// differ from the current ones. Must either succeed completely or leave the previous buffer
  /// and resources in place and release everything acquired for the new size.
  virtual auto resize(std::uint32_t width, std::uint32_t height) -> void = 0;

  /// The buffer the next frame is drawn into. Blocks until the window system no longer reads
  /// from it. Only called after a successful resize.
  virtual auto back_buffer() -> PixelBuffer& = 0;

  /// 0 if the back buffer contents are undefined, otherwise how many presents ago they were
  /// presented.
  virtual auto buffer_age() const noexcept -> std::uint8_t = 0;

  /// Hands the back buffer to the window system.
  virtual auto present() -> void = 0;

  /// Reads the window contents back as 0x00RRGGBB pixels.
  virtual auto fetch() -> std::vector<std::uint32_t> = 0;
};

/// The display-scoped half of a backend. Lives as long as the Context that owns it and must
/// outlive every surface created from it.
class BackendContext {
public:
  virtual ~BackendContext() = default;

  virtual auto platform() const noexcept -> Platform = 0;

  /// @p window is complete and belongs to platform().
  virtual auto create_surface(const WindowHandle& window) -> std::unique_ptr<BackendSurface> = 0;
};

/// Selects and constructs the backend for the handle's platform. Throws Error(UnsupportedPlatform)
/// if none is compiled in.
auto make_backend_context(const DisplayHandle& display, const Config& config)
    -> std::unique_ptr<BackendContext>;

} // namespace sb::detail
