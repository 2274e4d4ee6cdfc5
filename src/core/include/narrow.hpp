// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <concepts>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace sb {

struct NarrowError : public std::runtime_error {
  NarrowError() : std::runtime_error("narrowing error") {}
};

/**
 * @brief Converts an integer to another integer type if the value is representable.
 *
 * Returns std::nullopt if the value changes under the conversion, including a sign flip
 * between signed and unsigned types.
 */
template <class T, class U>
  requires std::integral<T> && std::integral<U>
constexpr auto try_narrow(U u) noexcept -> std::optional<T> {
  constexpr bool isDifferentSignedness = std::is_signed_v<T> != std::is_signed_v<U>;
  T t = static_cast<T>(u);
  if (static_cast<U>(t) != u || (isDifferentSignedness && ((t < T{}) != (u < U{})))) {
    return std::nullopt;
  }
  return t;
}

/// Like try_narrow but throws NarrowError if the value is not representable.
template <class T, class U>
  requires std::integral<T> && std::integral<U>
constexpr auto narrow(U u) -> T {
  std::optional<T> t = try_narrow<T>(u);
  if (!t) {
    throw NarrowError();
  }
  return *t;
}

} // namespace sb
