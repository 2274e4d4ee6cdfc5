// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "backends/PutImageRows.hpp"

#include <cassert>
#include <cstddef>

namespace {

// 65535 four-byte units, the core protocol limit without BIG-REQUESTS
constexpr std::size_t kCoreMaxRequestBytes = 262140;

constexpr auto stride_of(std::size_t width) -> std::size_t { return width * 4; }

} // namespace

static_assert(sb::detail::put_image_rows_per_request(kCoreMaxRequestBytes, stride_of(640)) == 102);
static_assert(sb::detail::put_image_rows_per_request(0, stride_of(1)) == 0);

void test_rows_are_limited_by_the_request_size() {
  using sb::detail::put_image_rows_per_request;
  assert(put_image_rows_per_request(kCoreMaxRequestBytes, stride_of(1)) == 65529);
  assert(put_image_rows_per_request(kCoreMaxRequestBytes, stride_of(1920)) == 34);
  assert(put_image_rows_per_request(64 + 24, 16) == 4);
  assert(put_image_rows_per_request(64 + 23, 16) == 3);
}

void test_row_wider_than_a_request_does_not_fit() {
  using sb::detail::put_image_rows_per_request;
  assert(put_image_rows_per_request(kCoreMaxRequestBytes, stride_of(65529)) == 1);
  assert(put_image_rows_per_request(kCoreMaxRequestBytes, stride_of(65530)) == 0);
  assert(put_image_rows_per_request(kCoreMaxRequestBytes, stride_of(65535)) == 0);
  assert(put_image_rows_per_request(24, stride_of(1)) == 0);
  assert(put_image_rows_per_request(kCoreMaxRequestBytes, 0) == 0);
}

int main() {
  test_rows_are_limited_by_the_request_size();
  test_row_wider_than_a_request_does_not_fit();
}
