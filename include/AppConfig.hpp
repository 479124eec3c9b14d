#pragma once
#include "KickDetector.hpp"
#include "Log.hpp"
#include <string>

struct SerialConfig {
  std::string device = "/dev/ttyUSB0";
  unsigned baud = 115200;
};

struct ReplayConfig {
  std::string path = "data/sample_capture.json";
  bool realtime = true;   // sleep between records according to t_ms
  bool loop = false;
};

struct AppConfig {
  LogLevel log_level = LogLevel::Info;
  ThresholdConfig thresholds;
  SerialConfig serial;
  ReplayConfig replay;
};

constexpr const char* kDefaultConfigPath = "config/kicksense.json";

// Missing keys keep their defaults. Throws std::runtime_error if the file
// cannot be read or is not a JSON object.
AppConfig load_config(const std::string& path);

// argv[1] if given (must exist), else kDefaultConfigPath if it exists,
// else built-in defaults.
AppConfig load_config_from_args(int argc, char** argv);
