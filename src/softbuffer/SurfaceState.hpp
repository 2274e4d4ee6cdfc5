// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "backends/Backend.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace sb {

/// Shared between a Surface and its BufferGuard. The guard only observes it, so it survives a
/// move of the Surface and notices when the Surface is gone.
struct SurfaceState {
  Platform mPlatform;
  std::unique_ptr<detail::BackendSurface> mBackend;
  std::uint32_t mWidth = 0;
  std::uint32_t mHeight = 0;
  bool mGuardAlive = false;

  auto require_no_guard(std::string_view operation) const -> void;
  auto require_sized(std::string_view operation) const -> void;

  auto present() -> void;
};

} // namespace sb
