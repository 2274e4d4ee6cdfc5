// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Error.hpp"
#include "softbuffer/PixelBuffer.hpp"

#include <cassert>
#include <cerrno>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

class SmallStorage : public sb::PixelStorage {
public:
  explicit SmallStorage(std::size_t capacity) : mPixels(capacity) {}

  auto data() noexcept -> std::uint32_t* override { return mPixels.data(); }
  auto capacity() const noexcept -> std::size_t override { return mPixels.size(); }

private:
  std::vector<std::uint32_t> mPixels;
};

} // namespace

void test_allocate_has_exactly_width_times_height_pixels() {
  for (auto [width, height] : {std::pair{1u, 1u}, std::pair{100u, 50u}, std::pair{3u, 7u}}) {
    sb::PixelBuffer buffer = sb::PixelBuffer::allocate(width, height);
    assert(!buffer.empty());
    assert(buffer.width() == width);
    assert(buffer.height() == height);
    assert(buffer.size() == std::size_t{width} * height);
    assert(buffer.pixels().size() == buffer.size());
    assert(buffer.size_bytes() == buffer.size() * 4);
    assert(buffer.stride_bytes() == width * 4);
    sb::PixelsView view = buffer.view();
    assert(view.data() == buffer.pixels().data());
    assert(view.width() == width);
  }
}

void test_default_buffer_is_empty() {
  sb::PixelBuffer buffer;
  assert(buffer.empty());
  assert(buffer.size() == 0);
  assert(buffer.pixels().empty());
}

void test_storage_too_small_is_rejected() {
  bool thrown = false;
  try {
    sb::PixelBuffer buffer{std::make_unique<SmallStorage>(5), 2, 3};
  } catch (const std::logic_error&) {
    thrown = true;
  }
  assert(thrown);
  sb::PixelBuffer fits{std::make_unique<SmallStorage>(6), 2, 3};
  assert(fits.size() == 6);
}

void test_byte_size_overflow_is_size_out_of_range() {
  constexpr std::uint32_t kMax = std::numeric_limits<std::uint32_t>::max();
  bool thrown = false;
  try {
    (void)sb::PixelBuffer::checked_size_bytes(kMax, kMax);
  } catch (const sb::Error& error) {
    thrown = error.error_code() == sb::ErrorCode::SizeOutOfRange;
  }
  assert(thrown);
  assert(sb::PixelBuffer::checked_size_bytes(640, 480) == 640u * 480u * 4u);
}

void test_error_codes() {
  sb::Error error{sb::ErrorCode::NotSized, "buffer_mut called before resize"};
  assert(error.code() == sb::ErrorCode::NotSized);
  assert(error.code().category() == sb::error_category());
  assert(std::string_view{error.code().category().name()} == "softbuffer");
  assert(error.error_code() == sb::ErrorCode::NotSized);

  std::error_code code = sb::ErrorCode::BufferInUse;
  assert(code.value() == static_cast<int>(sb::ErrorCode::BufferInUse));
  assert(code != std::error_code{});
}

void test_describe_walks_nested_causes() {
  try {
    try {
      throw std::system_error(ENOMEM, std::generic_category(), "mmap");
    } catch (const std::exception&) {
      std::throw_with_nested(sb::Error(sb::ErrorCode::ResizeError, "cannot resize"));
    }
  } catch (const sb::Error& error) {
    std::string text = sb::describe(error);
    assert(text.find("cannot resize") == 0);
    assert(text.find("mmap") != std::string::npos);
  }
}

void test_describe_reports_foreign_causes() {
  bool caught = false;
  try {
    try {
      throw 42;
    } catch (...) {
      std::throw_with_nested(sb::Error(sb::ErrorCode::PresentError, "cannot present"));
    }
  } catch (const sb::Error& error) {
    caught = true;
    std::string text = sb::describe(error);
    assert(text.find("cannot present") == 0);
    assert(text.ends_with(": unknown cause"));
  }
  assert(caught);
}

int main() {
  test_allocate_has_exactly_width_times_height_pixels();
  test_default_buffer_is_empty();
  test_storage_too_small_is_rejected();
  test_byte_size_overflow_is_size_out_of_range();
  test_error_codes();
  test_describe_walks_nested_causes();
  test_describe_reports_foreign_causes();
}
