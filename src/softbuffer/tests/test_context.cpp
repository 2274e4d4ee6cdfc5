// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Context.hpp"
#include "softbuffer/Error.hpp"
#include "softbuffer/OffscreenDisplay.hpp"

#include <cassert>
#include <cerrno>
#include <optional>
#include <system_error>
#include <utility>

namespace {

template <class Fn> auto error_of(Fn&& fn) -> std::optional<sb::ErrorCode> {
  try {
    fn();
  } catch (const sb::Error& error) {
    return error.error_code();
  }
  return std::nullopt;
}

} // namespace

void test_offscreen_context_connects_once() {
  sb::OffscreenDisplay display;
  {
    sb::Context context{display.handle()};
    assert(context.platform() == sb::Platform::Offscreen);
    assert(display.connections() == 1);
    sb::Context moved = std::move(context);
    assert(moved.platform() == sb::Platform::Offscreen);
    assert(display.connections() == 1);
  }
  assert(display.connections() == 0);
}

void test_context_keeps_its_config() {
  sb::OffscreenDisplay display;
  sb::Context context{display.handle(), sb::Config{.allow_shared_memory = false}};
  assert(!context.config().allow_shared_memory);
}

void test_platforms_without_backend_are_unsupported() {
  assert(error_of([] { sb::Context context{sb::AppKitDisplayHandle{}}; }) ==
         sb::ErrorCode::UnsupportedPlatform);
  assert(error_of([] { sb::Context context{sb::WebDisplayHandle{}}; }) ==
         sb::ErrorCode::UnsupportedPlatform);
#ifndef SOFTBUFFER_HAS_WIN32
  assert(error_of([] { sb::Context context{sb::Win32DisplayHandle{}}; }) ==
         sb::ErrorCode::UnsupportedPlatform);
#endif
}

void test_incomplete_display_handles() {
  assert(error_of([] { sb::Context context{sb::OffscreenDisplayHandle{nullptr}}; }) ==
         sb::ErrorCode::IncompleteHandle);
  assert(error_of([] { sb::Context context{sb::XcbDisplayHandle{nullptr, 0}}; }) ==
         sb::ErrorCode::IncompleteHandle);
  assert(error_of([] { sb::Context context{sb::WaylandDisplayHandle{nullptr}}; }) ==
         sb::ErrorCode::IncompleteHandle);
}

void test_refused_connection_is_platform_init_error() {
  sb::OffscreenDisplay display;
  display.refuse_connections(true);
  bool thrown = false;
  try {
    sb::Context context{display.handle()};
  } catch (const sb::Error& error) {
    assert(error.error_code() == sb::ErrorCode::PlatformInitError);
    try {
      std::rethrow_if_nested(error);
    } catch (const std::system_error& cause) {
      assert(cause.code() == std::errc::connection_refused);
      thrown = true;
    }
  }
  assert(thrown);
  assert(display.connections() == 0);

  display.refuse_connections(false);
  sb::Context context{display.handle()};
  assert(display.connections() == 1);
}

int main() {
  test_offscreen_context_connects_once();
  test_context_keeps_its_config();
  test_platforms_without_backend_are_unsupported();
  test_incomplete_display_handles();
  test_refused_connection_is_platform_init_error();
}
