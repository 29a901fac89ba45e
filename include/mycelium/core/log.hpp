/* Minimal leveled logger.

   Messages go to a process-wide sink (stderr with a timestamp by default).
   Tests and embedding applications can install their own sink. */
#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace mycelium::core {

enum class LogLevel : int {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  Off = 4
};

using LogSink = std::function<void(LogLevel, std::string_view component, std::string_view message)>;

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

// Replace the active sink. Passing an empty function restores the stderr sink.
void set_log_sink(LogSink sink);

[[nodiscard]] bool log_enabled(LogLevel level) noexcept;
void log_message(LogLevel level, std::string_view component, std::string_view message);

[[nodiscard]] const char* to_string(LogLevel level) noexcept;

// Stream-style convenience: builds the message only when the level is enabled.
template <typename... Args>
void log(LogLevel level, std::string_view component, const Args&... args) {
  if (!log_enabled(level)) return;
  std::ostringstream os;
  (os << ... << args);
  log_message(level, component, os.str());
}

} // namespace mycelium::core
