// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "softbuffer/BufferGuard.hpp"
#include "softbuffer/Context.hpp"
#include "softbuffer/Handles.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace sb {

/**
 * @brief A window bound to a Context, owning the pixel buffer presented to it.
 *
 * A new surface is unsized. resize() must succeed once before buffer_mut(), present() or
 * fetch() may be called. Every operation is a bounded synchronous call into the window system
 * client library. A Surface must only be used from one thread at a time.
 *
 * The window behind the handle is not owned and must outlive the Surface; the Context must
 * outlive it as well.
 */
class Surface {
public:
  /// Throws Error with PlatformMismatch, IncompleteHandle or SurfaceInitError. Nothing is
  /// allocated on the window system when the platforms differ.
  Surface(const Context& context, const WindowHandle& window);

  Surface(Surface&&) noexcept;
  auto operator=(Surface&&) noexcept -> Surface&;

  ~Surface();

  auto platform() const noexcept -> Platform;

  auto width() const noexcept -> std::uint32_t;
  auto height() const noexcept -> std::uint32_t;

  auto is_sized() const noexcept -> bool;

  /**
   * @brief Sets the size of the buffer, replacing it if the size changed.
   *
   * Calling resize() with the current size does nothing. Otherwise the previous buffer is
   * discarded and native resources for the new size are allocated. If that fails the surface
   * keeps its previous size and buffer and Error(ResizeError) is thrown with the native cause
   * nested. Zero width or height throws Error(InvalidDimensions) and leaves the surface as it was.
   */
  auto resize(std::uint32_t width, std::uint32_t height) -> void;

  /// Throws Error(NotSized) before the first resize, Error(BufferInUse) while another guard
  /// lives.
  [[nodiscard]] auto buffer_mut() -> BufferGuard;

  /// Presents the current buffer contents without taking a guard. If no guard was taken since
  /// the last present, the last presented frame is shown again.
  auto present() -> void;

  /// Reads back the window contents as width() * height() pixels packed as 0x00RRGGBB.
  /// Throws Error(Unimplemented) if the window system has no read-back.
  auto fetch() -> std::vector<std::uint32_t>;

private:
  std::shared_ptr<SurfaceState> mState;
};

} // namespace sb
