// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Logging.hpp"

#include <cassert>
#include <string>
#include <utility>
#include <vector>

void test_parse_log_level() {
  assert(sb::parse_log_level("debug") == sb::Log::Level::Debug);
  assert(sb::parse_log_level("INFO") == sb::Log::Level::Info);
  assert(sb::parse_log_level("warn") == sb::Log::Level::Warning);
  assert(sb::parse_log_level("Warning") == sb::Log::Level::Warning);
  assert(sb::parse_log_level("error") == sb::Log::Level::Error);
  assert(sb::parse_log_level("off") == sb::Log::Level::Off);
  assert(!sb::parse_log_level("verbose"));
  assert(!sb::parse_log_level(""));
}

void test_messages_below_level_are_dropped() {
  std::vector<std::pair<sb::Log::Level, std::string>> messages;
  sb::Log::set_sink([&](sb::Log::Level level, std::string_view message) {
    messages.emplace_back(level, std::string(message));
  });

  sb::Log::set_level(sb::Log::Level::Info);
  sb::Log::d("hidden {}", 1);
  sb::Log::i("resized to {}x{}", 640, 480);
  sb::Log::e("failed: {}", "broken pipe");
  assert(messages.size() == 2);
  assert(messages[0].first == sb::Log::Level::Info);
  assert(messages[0].second == "resized to 640x480");
  assert(messages[1].first == sb::Log::Level::Error);
  assert(messages[1].second == "failed: broken pipe");

  sb::Log::set_level(sb::Log::Level::Off);
  sb::Log::e("dropped");
  assert(messages.size() == 2);

  sb::Log::set_sink({});
  sb::Log::set_level(sb::Log::Level::Warning);
}

void test_sink_may_log_and_replace_itself() {
  std::vector<std::string> messages;
  sb::Log::set_level(sb::Log::Level::Info);
  sb::Log::set_sink([&](sb::Log::Level, std::string_view message) {
    messages.emplace_back(message);
    if (message == "outer") {
      sb::Log::i("inner {}", messages.size());
    }
  });
  sb::Log::i("outer");
  assert(messages.size() == 2);
  assert(messages[1] == "inner 1");

  sb::Log::set_sink([&](sb::Log::Level, std::string_view message) {
    messages.emplace_back(message);
    sb::Log::set_sink([&](sb::Log::Level, std::string_view) { messages.emplace_back("replaced"); });
  });
  sb::Log::w("first");
  sb::Log::w("second");
  assert(messages.size() == 4);
  assert(messages[2] == "first");
  assert(messages[3] == "replaced");

  sb::Log::set_sink({});
  sb::Log::set_level(sb::Log::Level::Warning);
}

int main() {
  test_parse_log_level();
  test_messages_below_level_are_dropped();
  test_sink_may_log_and_replace_itself();
}
