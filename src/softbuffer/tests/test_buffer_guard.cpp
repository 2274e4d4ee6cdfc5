// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/BufferGuard.hpp"
#include "softbuffer/Context.hpp"
#include "softbuffer/Error.hpp"
#include "softbuffer/OffscreenDisplay.hpp"
#include "softbuffer/Surface.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

static_assert(!std::is_copy_constructible_v<sb::BufferGuard>);
static_assert(!std::is_copy_assignable_v<sb::BufferGuard>);
static_assert(std::is_nothrow_move_constructible_v<sb::BufferGuard>);
static_assert(!std::is_default_constructible_v<sb::BufferGuard>);

namespace {

template <class Fn> auto error_of(Fn&& fn) -> std::optional<sb::ErrorCode> {
  try {
    fn();
  } catch (const sb::Error& error) {
    return error.error_code();
  }
  return std::nullopt;
}

struct Fixture {
  sb::OffscreenDisplay display;
  sb::OffscreenWindowHandle window = display.create_window();
  sb::Context context{display.handle()};
  sb::Surface surface{context, window};
};

} // namespace

void test_second_guard_is_refused() {
  Fixture f;
  f.surface.resize(4, 4);
  {
    sb::BufferGuard guard = f.surface.buffer_mut();
    assert(error_of([&] { (void)f.surface.buffer_mut(); }) == sb::ErrorCode::BufferInUse);
    assert(error_of([&] { f.surface.resize(8, 8); }) == sb::ErrorCode::BufferInUse);
    assert(error_of([&] { f.surface.present(); }) == sb::ErrorCode::BufferInUse);
    assert(error_of([&] { (void)f.surface.fetch(); }) == sb::ErrorCode::BufferInUse);
    assert(f.surface.width() == 4);
  }
  sb::BufferGuard again = f.surface.buffer_mut();
  assert(again.size() == 16);
}

void test_dropping_a_guard_discards_the_frame() {
  Fixture f;
  f.surface.resize(2, 2);
  {
    sb::BufferGuard guard = f.surface.buffer_mut();
    guard.view().fill(0x00ffffff);
  }
  assert(f.display.presented_frames(f.window) == 0);
  assert(!f.display.contents(f.window));
}

void test_moved_guard_keeps_exclusivity() {
  Fixture f;
  f.surface.resize(3, 2);
  sb::BufferGuard first = f.surface.buffer_mut();
  sb::BufferGuard second = std::move(first);
  assert(first.pixels().empty());
  assert(second.size() == 6);
  assert(error_of([&] { (void)f.surface.buffer_mut(); }) == sb::ErrorCode::BufferInUse);

  bool thrown = false;
  try {
    std::move(first).present();
  } catch (const std::logic_error&) {
    thrown = true;
  }
  assert(thrown);

  second[2, 1] = sb::rgb(1, 2, 3);
  assert(second[5] == 0x00010203);
  std::move(second).present();
  assert(f.display.presented_frames(f.window) == 1);
  sb::BufferGuard next = f.surface.buffer_mut();
  assert(next.size() == 6);
}

void test_guard_survives_surface_move() {
  Fixture f;
  f.surface.resize(2, 2);
  sb::BufferGuard guard = f.surface.buffer_mut();
  sb::Surface moved = std::move(f.surface);
  guard.view().fill(0x00123456);
  std::move(guard).present();
  assert(f.display.contents(f.window)->pixels[3] == 0x00123456);
  sb::BufferGuard next = moved.buffer_mut();
  assert(next.size() == 4);
}

void test_guard_outliving_its_surface() {
  Fixture f;
  std::optional<sb::BufferGuard> guard;
  {
    sb::Surface other{f.context, f.display.create_window()};
    other.resize(2, 2);
    guard.emplace(other.buffer_mut());
    assert(f.display.live_buffers() == 2);
  }
  assert(f.display.live_buffers() == 0);
  assert(f.display.bound_windows() == 1);

  bool thrown = false;
  try {
    std::move(*guard).present();
  } catch (const std::logic_error&) {
    thrown = true;
  }
  assert(thrown);
  assert(guard->pixels().empty());
  guard.reset();

  guard.emplace([&] {
    sb::Surface other{f.context, f.display.create_window()};
    other.resize(1, 1);
    return other.buffer_mut();
  }());
  guard.reset();
  assert(f.display.bound_windows() == 1);
}

void test_assigning_over_a_surface_with_a_live_guard() {
  Fixture f;
  f.surface.resize(2, 2);
  sb::BufferGuard guard = f.surface.buffer_mut();
  f.surface = sb::Surface{f.context, f.display.create_window()};
  assert(!f.surface.is_sized());
  assert(f.display.live_buffers() == 0);

  f.surface.resize(3, 3);
  sb::BufferGuard fresh = f.surface.buffer_mut();
  assert(fresh.size() == 9);
  assert(error_of([&] { (void)f.surface.buffer_mut(); }) == sb::ErrorCode::BufferInUse);

  sb::BufferGuard stale = std::move(guard);
  stale = std::move(fresh);
  assert(error_of([&] { (void)f.surface.buffer_mut(); }) == sb::ErrorCode::BufferInUse);
  std::move(stale).present();
  assert(f.display.presented_frames(f.window) == 0);
  assert(f.surface.buffer_mut().size() == 9);
}

void test_age_tracks_presented_frames() {
  Fixture f;
  f.surface.resize(2, 1);
  std::uint32_t colors[] = {0x00000011, 0x00000022, 0x00000033, 0x00000044};
  std::uint8_t expectedAges[] = {0, 0, 2, 2};
  for (int frame = 0; frame < 4; ++frame) {
    sb::BufferGuard guard = f.surface.buffer_mut();
    assert(guard.age() == expectedAges[frame]);
    if (guard.age() == 2) {
      assert(guard[0] == colors[frame - 2]);
    }
    std::ranges::fill(guard.pixels(), colors[frame]);
    std::move(guard).present();
  }
  f.surface.resize(3, 1);
  sb::BufferGuard guard = f.surface.buffer_mut();
  assert(guard.age() == 0);
}

int main() {
  test_second_guard_is_refused();
  test_dropping_a_guard_discards_the_frame();
  test_moved_guard_keeps_exclusivity();
  test_guard_survives_surface_move();
  test_guard_outliving_its_surface();
  test_assigning_over_a_surface_with_a_live_guard();
  test_age_tracks_presented_frames();
}
