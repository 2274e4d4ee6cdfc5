// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Context.hpp"
#include "softbuffer/Error.hpp"
#include "softbuffer/OffscreenDisplay.hpp"
#include "softbuffer/Surface.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <getopt.h>

namespace sb {

struct ProgramOptions {
  std::uint32_t width = 320;
  std::uint32_t height = 240;
  int frames = 3;
  std::string output = "offscreen_demo.ppm";
};

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions;

auto write_ppm(const std::string& filename, std::uint32_t width, std::uint32_t height,
               const std::vector<std::uint32_t>& pixels) -> void;

/// Draws a bar moving down over a gradient. A buffer with a known age only gets the stale bar
/// erased.
auto draw_frame(BufferGuard& buffer, int frame) -> void;

} // namespace sb

int main(int argc, char** argv) {
  const sb::ProgramOptions options = sb::parse_command_line_args(argc, argv);
  try {
    sb::OffscreenDisplay display;
    sb::OffscreenWindowHandle window = display.create_window();
    sb::Context context{display.handle()};
    sb::Surface surface{context, window};
    surface.resize(options.width, options.height);
    for (int frame = 0; frame < options.frames; ++frame) {
      sb::BufferGuard buffer = surface.buffer_mut();
      sb::draw_frame(buffer, frame);
      std::move(buffer).present();
    }
    sb::write_ppm(options.output, surface.width(), surface.height(), surface.fetch());
  } catch (const std::exception& error) {
    std::cerr << "Error: " << sb::describe(error) << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

namespace sb {

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions {
  ProgramOptions result{};
  static ::option long_options[] = {::option{"width", required_argument, nullptr, 'w'},
                                    ::option{"height", required_argument, nullptr, 'h'},
                                    ::option{"frames", required_argument, nullptr, 'f'},
                                    ::option{"out", required_argument, nullptr, 'o'}, ::option{}};
  const char* short_options = "w:h:f:o:";
  int option_index = 0;
  int parsedShortOpt = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  while (parsedShortOpt != -1) {
    switch (parsedShortOpt) {
    case 'w':
      result.width = static_cast<std::uint32_t>(std::strtoul(optarg, nullptr, 10));
      break;
    case 'h':
      result.height = static_cast<std::uint32_t>(std::strtoul(optarg, nullptr, 10));
      break;
    case 'f':
      result.frames = std::atoi(optarg);
      break;
    case 'o':
      result.output = optarg;
      break;
    default:
      std::cerr << "Unknown option '" << static_cast<char>(parsedShortOpt) << "'\n";
      break;
    }
    parsedShortOpt = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  }
  return result;
}

auto write_ppm(const std::string& filename, std::uint32_t width, std::uint32_t height,
               const std::vector<std::uint32_t>& pixels) -> void {
  std::ofstream file(filename, std::ios::binary);
  if (!file) {
    Log::e("Failed to open {} for writing", filename);
    return;
  }
  file << "P6\n" << width << " " << height << "\n255\n";
  for (std::uint32_t pixel : pixels) {
    file.put(static_cast<char>(red(pixel)));
    file.put(static_cast<char>(green(pixel)));
    file.put(static_cast<char>(blue(pixel)));
  }
  std::cout << "Saved image to " << filename << "\n";
}

namespace {

constexpr std::uint32_t kBarHeight = 16;
constexpr std::uint32_t kBarColor = rgb(0xff, 0xff, 0xff);

auto background(std::size_t x, std::size_t y) -> std::uint32_t {
  return rgb(static_cast<std::uint8_t>(x), static_cast<std::uint8_t>(y), 0x40);
}

auto bar_rows(PixelsView view, int frame) -> PixelsView {
  std::size_t top = (static_cast<std::size_t>(frame) * kBarHeight) % view.height();
  std::size_t height = std::min<std::size_t>(kBarHeight, view.height() - top);
  return view.subview(Position{0, top}, Extents{view.width(), height});
}

auto paint_background(PixelsView view, std::size_t top) -> void {
  for (std::size_t y = 0; y < view.height(); ++y) {
    auto row = view.row(y);
    for (std::size_t x = 0; x < view.width(); ++x) {
      row[x] = background(x, top + y);
    }
  }
}

} // namespace

auto draw_frame(BufferGuard& buffer, int frame) -> void {
  PixelsView view = buffer.view();
  if (buffer.age() == 0 || frame < buffer.age()) {
    paint_background(view, 0);
  } else {
    // The buffer still shows the bar of frame - age.
    PixelsView stale = bar_rows(view, frame - buffer.age());
    paint_background(stale, static_cast<std::size_t>(stale.data() - view.data()) / view.width());
  }
  bar_rows(view, frame).fill(kBarColor);
}

} // namespace sb
