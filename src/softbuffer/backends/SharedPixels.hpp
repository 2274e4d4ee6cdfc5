// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "SharedMemory.hpp"
#include "softbuffer/PixelBuffer.hpp"

#include <cstdint>
#include <string>

namespace sb::detail {

struct SharedPixelBuffer {
  PixelBuffer mBuffer;
  /// Owned by mBuffer's storage and valid as long as mBuffer is.
  const SharedMemory* mMemory;
};

/// A width * height pixel buffer in a memfd mapping that can be passed to a window system
/// server. Throws Error(SizeOutOfRange) or std::system_error.
auto allocate_shared_pixels(const std::string& name, std::uint32_t width, std::uint32_t height)
    -> SharedPixelBuffer;

} // namespace sb::detail
