#include "Log.hpp"
#include <atomic>
#include <iostream>
#include <stdexcept>

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   break;
  }
  return "";
}
}  // namespace

void set_log_level(LogLevel level) {
  g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load());
}

void log_message(LogLevel level, const char* tag, const std::string& text) {
  if (level == LogLevel::Off || static_cast<int>(level) < g_level.load()) return;
  std::cerr << "[" << level_name(level) << "] " << tag << ": " << text << "\n";
}

LogLevel parse_log_level(const std::string& name) {
  if (name == "debug") return LogLevel::Debug;
  if (name == "info")  return LogLevel::Info;
  if (name == "warn")  return LogLevel::Warn;
  if (name == "error") return LogLevel::Error;
  if (name == "off")   return LogLevel::Off;
  throw std::runtime_error("Unknown log level: " + name);
}
