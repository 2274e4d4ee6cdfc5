// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Config.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace sb {

auto parse_bool_flag(std::string_view text) -> std::optional<bool> {
  std::string lower(text);
  std::ranges::transform(lower, lower.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

auto Config::from_environment() -> Config {
  Config config{};
  if (const char* noShm = std::getenv("SOFTBUFFER_NO_SHM")) {
    std::optional<bool> flag = parse_bool_flag(noShm);
    if (flag) {
      config.allow_shared_memory = !*flag;
    } else {
      Log::w("Ignoring SOFTBUFFER_NO_SHM={}: expected a boolean", noShm);
    }
  }
  return config;
}

} // namespace sb
