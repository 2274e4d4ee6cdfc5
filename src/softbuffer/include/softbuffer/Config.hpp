// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <optional>
#include <string_view>

namespace sb {

/// Per-context options. A Context copies its Config at construction.
struct Config {
  /// When false, backends that can fall back to a copy over the wire (X11 PutImage) do so
  /// instead of sharing memory with the server.
  bool allow_shared_memory = true;

  /// Defaults overridden by the environment: SOFTBUFFER_NO_SHM disables shared memory.
  static auto from_environment() -> Config;
};

/// Accepts 1/0, true/false, yes/no and on/off, case-insensitively.
auto parse_bool_flag(std::string_view text) -> std::optional<bool>;

} // namespace sb
