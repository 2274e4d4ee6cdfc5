// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "backends/Backend.hpp"

#include <memory>

namespace sb {

struct ContextState {
  Platform mPlatform;
  Config mConfig;
  std::unique_ptr<detail::BackendContext> mBackend;
};

} // namespace sb
