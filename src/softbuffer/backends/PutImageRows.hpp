// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstddef>

namespace sb::detail {

/// Bytes of a core PutImage request in front of the image data.
inline constexpr std::size_t kPutImageHeaderBytes = 24;

/// Number of image rows of @p strideBytes that fit into one PutImage request when the server
/// accepts requests of at most @p maxRequestBytes. Zero if not even a single row fits.
constexpr auto put_image_rows_per_request(std::size_t maxRequestBytes,
                                          std::size_t strideBytes) noexcept -> std::size_t {
  if (strideBytes == 0 || maxRequestBytes <= kPutImageHeaderBytes) {
    return 0;
  }
  return (maxRequestBytes - kPutImageHeaderBytes) / strideBytes;
}

} // namespace sb::detail
