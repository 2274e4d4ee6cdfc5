// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN 1
#endif
#ifndef NOMINMAX
#define NOMINMAX 1
#endif
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace sb {

namespace {

char levelToChar(Log::Level level) {
  switch (level) {
  case Log::Level::Debug:
    return 'D';
  case Log::Level::Error:
    return 'E';
  case Log::Level::Info:
    return 'I';
  case Log::Level::Warning:
    return 'W';
  case Log::Level::Off:
    break;
  }
  return 'U';
}

auto initialLevel() -> Log::Level {
  const char* env = std::getenv("SOFTBUFFER_LOG");
  if (env == nullptr) {
    return Log::Level::Warning;
  }
  return parse_log_level(env).value_or(Log::Level::Warning);
}

auto processAndThreadId() noexcept -> std::pair<long, long> {
#ifdef _WIN32
  return {static_cast<long>(::GetCurrentProcessId()), static_cast<long>(::GetCurrentThreadId())};
#else
  return {static_cast<long>(::getpid()), static_cast<long>(::gettid())};
#endif
}

auto levelStorage() -> std::atomic<Log::Level>& {
  static std::atomic<Log::Level> level{initialLevel()};
  return level;
}

struct SinkState {
  std::mutex mMutex;
  Log::Sink mSink;
};

auto sinkState() -> SinkState& {
  static SinkState state;
  return state;
}

} // namespace

auto Log::level() noexcept -> Level { return levelStorage().load(std::memory_order_relaxed); }

void Log::set_level(Level level) noexcept {
  levelStorage().store(level, std::memory_order_relaxed);
}

void Log::set_sink(Sink sink) {
  SinkState& state = sinkState();
  std::lock_guard lock{state.mMutex};
  state.mSink = std::move(sink);
}

void Log::vlog(Level level, const std::source_location& location, std::string_view fmt,
               std::format_args args) {
  std::string message = std::vformat(fmt, args);
  SinkState& state = sinkState();
  std::unique_lock lock{state.mMutex};
  if (state.mSink) {
    // the sink runs unlocked so that it may log itself
    Sink sink = state.mSink;
    lock.unlock();
    sink(level, message);
    return;
  }
  std::filesystem::path file = location.file_name();
  std::string file_name = file.filename().string();
  auto [pid, tid] = processAndThreadId();
  std::fprintf(stderr, "[%s:%u] %c %ld-%ld %s\n", file_name.c_str(), location.line(),
               levelToChar(level), pid, tid, message.c_str());
}

auto parse_log_level(std::string_view text) -> std::optional<Log::Level> {
  std::string lower(text);
  std::ranges::transform(lower, lower.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug") {
    return Log::Level::Debug;
  } else if (lower == "info") {
    return Log::Level::Info;
  } else if (lower == "warning" || lower == "warn") {
    return Log::Level::Warning;
  } else if (lower == "error") {
    return Log::Level::Error;
  } else if (lower == "off") {
    return Log::Level::Off;
  }
  return std::nullopt;
}

} // namespace sb
