#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <source_location>
#include <string>
#include <string_view>

namespace jrpc::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  }
  // clang-format on
  return "?";
}

inline level global_level = level::info;  // NOLINT

// Clamps out-of-range levels from the command line.
inline void set_level(int level) {
  if (level < 0) level = 0;
  if (level > static_cast<int>(level::trace))
    level = static_cast<int>(level::trace);
  global_level = static_cast<logger::level>(level);
}

inline std::string get_current_timestamp() {
  using namespace std::chrono;

  auto now = floor<milliseconds>(system_clock::now());
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", now);
}

// Core logging function.  Output goes to stderr: stdout belongs to
// whatever the binary prints as its result.
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    fmt::format_string<Args...> fmt, Args&&... args) {
  if (level > global_level) return;

  fmt::println(
      stderr, "{} {}:{} {}: {}", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().string(),
      location.line(), level_to_string(level),
      fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace jrpc::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                             \
  jrpc::logger::log(                                               \
      jrpc::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                             \
  jrpc::logger::log(                                               \
      jrpc::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...) \
  jrpc::logger::log(  \
      jrpc::logger::level::info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...)                                                \
  jrpc::logger::log(                                                 \
      jrpc::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                             \
  jrpc::logger::log(                                               \
      jrpc::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                             \
  jrpc::logger::log(                                               \
      jrpc::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
