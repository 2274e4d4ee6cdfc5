// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace sb {

enum class ErrorCode {
  UnsupportedPlatform = 1,
  PlatformMismatch,
  IncompleteHandle,
  PlatformInitError,
  SurfaceInitError,
  InvalidDimensions,
  SizeOutOfRange,
  ResizeError,
  NotSized,
  BufferInUse,
  PresentError,
  Unimplemented,
};

auto error_category() noexcept -> const std::error_category&;

auto make_error_code(ErrorCode code) noexcept -> std::error_code;

/**
 * @brief The exception thrown by Context, Surface and BufferGuard operations.
 *
 * When the failure originates in the window system, the native cause (usually a
 * std::system_error) is attached as the nested exception.
 */
class Error : public std::system_error {
public:
  Error(ErrorCode code, const std::string& what);

  auto error_code() const noexcept -> ErrorCode;
};

/// Writes what() of @p error and of every nested cause, separated by ": ".
auto describe(const std::exception& error) -> std::string;

} // namespace sb

template <> struct std::is_error_code_enum<sb::ErrorCode> : std::true_type {};
