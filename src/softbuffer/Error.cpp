// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Error.hpp"

#include <exception>

namespace sb {

namespace {

class SoftbufferCategory : public std::error_category {
public:
  auto name() const noexcept -> const char* override { return "softbuffer"; }

  auto message(int code) const -> std::string override {
    switch (static_cast<ErrorCode>(code)) {
    case ErrorCode::UnsupportedPlatform:
      return "no backend available for this platform";
    case ErrorCode::PlatformMismatch:
      return "window handle belongs to a different platform than the context";
    case ErrorCode::IncompleteHandle:
      return "display or window handle is missing required fields";
    case ErrorCode::PlatformInitError:
      return "failed to initialize the display connection";
    case ErrorCode::SurfaceInitError:
      return "failed to bind the window";
    case ErrorCode::InvalidDimensions:
      return "surface dimensions must be non-zero";
    case ErrorCode::SizeOutOfRange:
      return "surface dimensions exceed what the platform supports";
    case ErrorCode::ResizeError:
      return "failed to allocate window resources for the new size";
    case ErrorCode::NotSized:
      return "surface has not been resized yet";
    case ErrorCode::BufferInUse:
      return "a buffer guard for this surface is still alive";
    case ErrorCode::PresentError:
      return "failed to present the buffer";
    case ErrorCode::Unimplemented:
      return "operation is not supported by this backend";
    }
    return "unknown softbuffer error";
  }
};

void append_nested(const std::exception& error, std::string& out) {
  try {
    std::rethrow_if_nested(error);
  } catch (const std::exception& cause) {
    out += ": ";
    out += cause.what();
    append_nested(cause, out);
  } catch (...) {
    out += ": unknown cause";
  }
}

} // namespace

auto error_category() noexcept -> const std::error_category& {
  static const SoftbufferCategory category;
  return category;
}

auto make_error_code(ErrorCode code) noexcept -> std::error_code {
  return {static_cast<int>(code), error_category()};
}

Error::Error(ErrorCode code, const std::string& what) : std::system_error(code, what) {}

auto Error::error_code() const noexcept -> ErrorCode {
  return static_cast<ErrorCode>(code().value());
}

auto describe(const std::exception& error) -> std::string {
  std::string out = error.what();
  append_nested(error, out);
  return out;
}

} // namespace sb
