/*
  Logger: process-wide level threshold and replaceable sink.

  The default sink writes "[HH:MM:SS.mmm][LEVEL][component] message" to stderr.
*/
#include "mycelium/core/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <utility>

namespace mycelium::core {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Warning)};
std::mutex g_sink_mutex;
LogSink g_sink;

void stderr_sink(LogLevel level, std::string_view component, std::string_view message) {
  auto now = std::chrono::system_clock::now();
  auto now_time_t = std::chrono::system_clock::to_time_t(now);
  auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  std::tm tm_buf{};
  localtime_r(&now_time_t, &tm_buf);
  char time_buf[32];
  std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);
  std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
            << "][" << to_string(level) << "][" << component << "] " << message << "\n";
}

} // namespace

void set_log_level(LogLevel level) noexcept {
  g_level.store(static_cast<int>(level));
}

LogLevel log_level() noexcept {
  return static_cast<LogLevel>(g_level.load());
}

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(sink);
}

bool log_enabled(LogLevel level) noexcept {
  return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

void log_message(LogLevel level, std::string_view component, std::string_view message) {
  if (!log_enabled(level)) return;
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if (g_sink) {
    g_sink(level, component, message);
  } else {
    stderr_sink(level, component, message);
  }
}

const char* to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off: break;
  }
  return "OFF";
}

} // namespace mycelium::core
