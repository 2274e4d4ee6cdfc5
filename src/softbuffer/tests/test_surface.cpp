// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Context.hpp"
#include "softbuffer/Error.hpp"
#include "softbuffer/OffscreenDisplay.hpp"
#include "softbuffer/Surface.hpp"

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstdint>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace {

template <class Fn> auto error_of(Fn&& fn) -> std::optional<sb::ErrorCode> {
  try {
    fn();
  } catch (const sb::Error& error) {
    return error.error_code();
  }
  return std::nullopt;
}

auto nested_errno(const sb::Error& error) -> int {
  try {
    std::rethrow_if_nested(error);
  } catch (const std::system_error& cause) {
    return cause.code().value();
  }
  return 0;
}

} // namespace

void test_new_surface_is_unsized() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle()};
  sb::Surface surface{context, display.create_window()};
  assert(surface.platform() == sb::Platform::Offscreen);
  assert(!surface.is_sized());
  assert(surface.width() == 0);
  assert(surface.height() == 0);
  assert(display.bound_windows() == 1);
  assert(display.live_buffers() == 0);

  assert(error_of([&] { (void)surface.buffer_mut(); }) == sb::ErrorCode::NotSized);
  assert(error_of([&] { surface.present(); }) == sb::ErrorCode::NotSized);
  assert(error_of([&] { (void)surface.fetch(); }) == sb::ErrorCode::NotSized);
}

void test_platform_mismatch_allocates_nothing() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle()};
  assert(error_of([&] { sb::Surface surface{context, sb::XcbWindowHandle{42, 0}}; }) ==
         sb::ErrorCode::PlatformMismatch);
  assert(error_of([&] { sb::Surface surface{context, sb::WaylandWindowHandle{nullptr}}; }) ==
         sb::ErrorCode::PlatformMismatch);
  assert(display.bound_windows() == 0);
  assert(display.live_buffers() == 0);
}

void test_window_binding_errors() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle()};
  assert(error_of([&] { sb::Surface surface{context, sb::OffscreenWindowHandle{0}}; }) ==
         sb::ErrorCode::IncompleteHandle);

  sb::OffscreenWindowHandle gone = display.create_window();
  display.destroy_window(gone);
  try {
    sb::Surface surface{context, gone};
    assert(false);
  } catch (const sb::Error& error) {
    assert(error.error_code() == sb::ErrorCode::SurfaceInitError);
    assert(nested_errno(error) == ENOENT);
  }

  sb::OffscreenWindowHandle window = display.create_window();
  sb::Surface first{context, window};
  assert(error_of([&] { sb::Surface second{context, window}; }) ==
         sb::ErrorCode::SurfaceInitError);
  assert(display.bound_windows() == 1);
}

void test_resize_gives_exactly_width_times_height_pixels() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle()};
  sb::Surface surface{context, display.create_window()};
  for (auto [width, height] : {std::pair{1u, 1u}, std::pair{640u, 480u}, std::pair{3u, 1000u}}) {
    surface.resize(width, height);
    assert(surface.is_sized());
    assert(surface.width() == width);
    assert(surface.height() == height);
    sb::BufferGuard guard = surface.buffer_mut();
    assert(guard.size() == std::size_t{width} * height);
    assert(guard.width() == width);
    assert(guard.height() == height);
  }
  assert(display.live_buffers() == 2);
}

void test_zero_dimensions_leave_size_unchanged() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle()};
  sb::Surface surface{context, display.create_window()};
  assert(error_of([&] { surface.resize(0, 10); }) == sb::ErrorCode::InvalidDimensions);
  assert(error_of([&] { surface.resize(10, 0); }) == sb::ErrorCode::InvalidDimensions);
  assert(!surface.is_sized());

  surface.resize(8, 4);
  assert(error_of([&] { surface.resize(0, 4); }) == sb::ErrorCode::InvalidDimensions);
  assert(error_of([&] { surface.resize(8, 0); }) == sb::ErrorCode::InvalidDimensions);
  assert(surface.width() == 8);
  assert(surface.height() == 4);
  sb::BufferGuard guard = surface.buffer_mut();
  assert(guard.size() == 32);
}

void test_same_size_resize_keeps_the_buffer() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle()};
  sb::Surface surface{context, display.create_window()};
  surface.resize(16, 16);
  std::uint32_t* data = nullptr;
  {
    sb::BufferGuard guard = surface.buffer_mut();
    std::ranges::fill(guard.pixels(), 0x00abcdef);
    data = guard.pixels().data();
  }
  surface.resize(16, 16);
  {
    sb::BufferGuard guard = surface.buffer_mut();
    assert(guard.pixels().data() == data);
    assert(std::ranges::all_of(guard.pixels(), [](std::uint32_t p) { return p == 0x00abcdef; }));
  }
  surface.resize(16, 8);
  sb::BufferGuard guard = surface.buffer_mut();
  assert(guard.size() == 128);
  assert(guard.age() == 0);
}

void test_failed_resize_keeps_the_previous_buffer() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle()};
  sb::Surface surface{context, display.create_window()};
  surface.resize(10, 10);
  {
    sb::BufferGuard guard = surface.buffer_mut();
    std::ranges::fill(guard.pixels(), 0x00112233);
    std::move(guard).present();
  }
  assert(display.live_buffers() == 2);

  display.fail_allocation_after(1);
  try {
    surface.resize(20, 20);
    assert(false);
  } catch (const sb::Error& error) {
    assert(error.error_code() == sb::ErrorCode::ResizeError);
    assert(nested_errno(error) == ENOMEM);
  }
  assert(surface.width() == 10);
  assert(surface.height() == 10);
  assert(display.live_buffers() == 2);
  {
    sb::BufferGuard guard = surface.buffer_mut();
    assert(guard.size() == 100);
    std::move(guard).present();
  }
  surface.resize(20, 20);
  assert(surface.width() == 20);
  assert(display.live_buffers() == 2);
}

void test_present_failure_leaves_surface_usable() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle()};
  sb::OffscreenWindowHandle window = display.create_window();
  sb::Surface surface{context, window};
  surface.resize(4, 4);

  display.fail_next_present();
  {
    sb::BufferGuard guard = surface.buffer_mut();
    guard.view().fill(0x00ff00ff);
    try {
      std::move(guard).present();
      assert(false);
    } catch (const sb::Error& error) {
      assert(error.error_code() == sb::ErrorCode::PresentError);
      assert(nested_errno(error) == EIO);
    }
  }
  assert(surface.is_sized());
  assert(display.presented_frames(window) == 0);

  surface.present();
  assert(display.presented_frames(window) == 1);

  display.destroy_window(window);
  assert(error_of([&] { surface.present(); }) == sb::ErrorCode::PresentError);
}

void test_present_without_guard_repeats_the_last_frame() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle()};
  sb::OffscreenWindowHandle window = display.create_window();
  sb::Surface surface{context, window};
  surface.resize(4, 4);
  {
    sb::BufferGuard guard = surface.buffer_mut();
    guard.view().fill(0x00ff0000);
    std::move(guard).present();
  }
  assert(display.contents(window)->pixels[0] == 0x00ff0000);

  for (std::size_t frame = 2; frame <= 3; ++frame) {
    surface.present();
    assert(display.presented_frames(window) == frame);
    std::optional<sb::OffscreenDisplay::Image> image = display.contents(window);
    assert(image);
    assert(std::ranges::all_of(image->pixels, [](std::uint32_t p) { return p == 0x00ff0000; }));
    std::vector<std::uint32_t> fetched = surface.fetch();
    assert(fetched.size() == 16);
    assert(std::ranges::all_of(fetched, [](std::uint32_t p) { return p == 0x00ff0000; }));
  }

  // Repeated frames do not age the buffers.
  sb::BufferGuard guard = surface.buffer_mut();
  assert(guard.age() == 0);
  guard.view().fill(0x000000ff);
  std::move(guard).present();
  assert(display.presented_frames(window) == 4);
  assert(display.contents(window)->pixels[0] == 0x000000ff);
}

void test_surface_releases_window_resources() {
  sb::OffscreenDisplay display;
  {
    sb::Context context{display.handle()};
    sb::Surface surface{context, display.create_window()};
    surface.resize(32, 32);
    sb::Surface moved = std::move(surface);
    assert(moved.width() == 32);
    assert(display.live_buffers() == 2);
    assert(display.bound_windows() == 1);
  }
  assert(display.live_buffers() == 0);
  assert(display.bound_windows() == 0);
  assert(display.connections() == 0);
}

int main() {
  test_new_surface_is_unsized();
  test_platform_mismatch_allocates_nothing();
  test_window_binding_errors();
  test_resize_gives_exactly_width_times_height_pixels();
  test_zero_dimensions_leave_size_unchanged();
  test_same_size_resize_keeps_the_buffer();
  test_failed_resize_keeps_the_previous_buffer();
  test_present_failure_leaves_surface_usable();
  test_present_without_guard_repeats_the_last_frame();
  test_surface_releases_window_resources();
}
