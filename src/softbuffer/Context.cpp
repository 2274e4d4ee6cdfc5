// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Context.hpp"
#include "ContextState.hpp"
#include "softbuffer/Error.hpp"

#include "Logging.hpp"

#include <exception>
#include <format>

namespace sb {

namespace {

auto connect_backend(const DisplayHandle& display, const Config& config)
    -> std::unique_ptr<detail::BackendContext> {
  Platform platform = platform_of(display);
  if (!is_complete(display)) {
    throw Error(ErrorCode::IncompleteHandle,
                std::format("{} display handle has no display", to_string(platform)));
  }
  try {
    return detail::make_backend_context(display, config);
  } catch (const Error& error) {
    Log::e("Failed to create {} context: {}", to_string(platform), describe(error));
    throw;
  } catch (const std::exception& error) {
    Log::e("Failed to create {} context: {}", to_string(platform), describe(error));
    std::throw_with_nested(Error(ErrorCode::PlatformInitError,
                                 std::format("cannot connect to {} display", to_string(platform))));
  }
}

} // namespace

Context::Context(const DisplayHandle& display, const Config& config)
    : mState(std::make_unique<ContextState>(
          ContextState{platform_of(display), config, connect_backend(display, config)})) {}

Context::Context(Context&&) noexcept = default;

auto Context::operator=(Context&&) noexcept -> Context& = default;

Context::~Context() = default;

auto Context::platform() const noexcept -> Platform { return mState->mPlatform; }

auto Context::config() const noexcept -> const Config& { return mState->mConfig; }

} // namespace sb
