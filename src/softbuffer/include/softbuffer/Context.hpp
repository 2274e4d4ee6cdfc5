// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "softbuffer/Config.hpp"
#include "softbuffer/Handles.hpp"

#include <memory>

namespace sb {

struct ContextState;

/**
 * @brief A connection to one display, shared by every Surface presenting to that display.
 *
 * The backend is chosen from the display handle's platform once, at construction. Capability
 * probing (required protocol globals, shared-memory support) happens here as well, so a
 * Context that was constructed successfully can create surfaces.
 *
 * Throws Error with
 *  - UnsupportedPlatform if no backend for the handle's platform is compiled in,
 *  - IncompleteHandle if the handle lacks its display pointer,
 *  - PlatformInitError if the connection cannot be set up; the native cause is nested.
 *
 * The display behind @p display is not owned and must outlive the Context. The Context must
 * outlive every Surface created from it.
 */
class Context {
public:
  explicit Context(const DisplayHandle& display, const Config& config = Config::from_environment());

  Context(Context&&) noexcept;
  auto operator=(Context&&) noexcept -> Context&;

  ~Context();

  auto platform() const noexcept -> Platform;

  auto config() const noexcept -> const Config&;

private:
  friend class Surface;
  std::unique_ptr<ContextState> mState;
};

} // namespace sb
