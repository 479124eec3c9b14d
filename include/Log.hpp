#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

// Process-wide threshold; messages below it are dropped.
void set_log_level(LogLevel level);
LogLevel log_level();

// Writes "[LEVEL] tag: text" to std::cerr.
void log_message(LogLevel level, const char* tag, const std::string& text);

// Throws std::runtime_error on unknown names.
LogLevel parse_log_level(const std::string& name);
