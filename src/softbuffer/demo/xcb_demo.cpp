// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Context.hpp"
#include "softbuffer/Error.hpp"
#include "softbuffer/Surface.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

#include <xcb/xcb.h>

namespace sb {

struct ConnectionDeleter {
  auto operator()(xcb_connection_t* connection) const noexcept -> void {
    ::xcb_disconnect(connection);
  }
};

using Connection = std::unique_ptr<xcb_connection_t, ConnectionDeleter>;

auto paint(Surface& surface) -> void {
  BufferGuard buffer = surface.buffer_mut();
  for (std::uint32_t y = 0; y < buffer.height(); ++y) {
    for (std::uint32_t x = 0; x < buffer.width(); ++x) {
      buffer[x, y] = rgb(static_cast<std::uint8_t>(x % 255), static_cast<std::uint8_t>(y % 255),
                         static_cast<std::uint8_t>((x * y) % 255));
    }
  }
  std::move(buffer).present();
}

auto run() -> void {
  int screenNumber = 0;
  Connection connection{::xcb_connect(nullptr, &screenNumber)};
  if (::xcb_connection_has_error(connection.get())) {
    throw std::runtime_error("cannot connect to the X server");
  }
  xcb_screen_iterator_t screens = ::xcb_setup_roots_iterator(::xcb_get_setup(connection.get()));
  for (int i = 0; i < screenNumber; ++i) {
    ::xcb_screen_next(&screens);
  }
  const xcb_screen_t* screen = screens.data;

  xcb_window_t window = ::xcb_generate_id(connection.get());
  std::uint32_t values[] = {screen->black_pixel, XCB_EVENT_MASK_EXPOSURE |
                                                     XCB_EVENT_MASK_STRUCTURE_NOTIFY |
                                                     XCB_EVENT_MASK_KEY_PRESS};
  ::xcb_create_window(connection.get(), XCB_COPY_FROM_PARENT, window, screen->root, 0, 0, 640,
                      480, 0, XCB_WINDOW_CLASS_INPUT_OUTPUT, screen->root_visual,
                      XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK, values);
  ::xcb_map_window(connection.get(), window);
  ::xcb_flush(connection.get());

  Context context{XcbDisplayHandle{connection.get(), screenNumber}};
  Surface surface{context, XcbWindowHandle{window, screen->root_visual}};
  surface.resize(640, 480);

  bool running = true;
  while (running) {
    std::unique_ptr<xcb_generic_event_t, decltype(&std::free)> event{
        ::xcb_wait_for_event(connection.get()), &std::free};
    if (!event) {
      throw std::runtime_error("X server connection lost");
    }
    switch (event->response_type & ~0x80) {
    case XCB_CONFIGURE_NOTIFY: {
      auto* configure = reinterpret_cast<xcb_configure_notify_event_t*>(event.get());
      if (configure->width != 0 && configure->height != 0) {
        surface.resize(configure->width, configure->height);
      }
      break;
    }
    case XCB_EXPOSE:
      if (reinterpret_cast<xcb_expose_event_t*>(event.get())->count == 0) {
        paint(surface);
      }
      break;
    case XCB_KEY_PRESS:
      running = false;
      break;
    default:
      break;
    }
  }
}

} // namespace sb

int main() {
  try {
    sb::run();
  } catch (const std::exception& error) {
    std::cerr << "Error: " << sb::describe(error) << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
