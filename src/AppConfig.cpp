#include "AppConfig.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

AppConfig load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open config file " + path);

  json j;
  try {
    f >> j;
  } catch (const json::exception& e) {
    throw std::runtime_error("Malformed config " + path + ": " + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("Config must be a JSON object");

  AppConfig cfg;
  try {
    cfg.log_level = parse_log_level(j.value("log_level", std::string("info")));

    if (j.contains("thresholds")) {
      const auto& t = j["thresholds"];
      cfg.thresholds.upper_threshold = t.value("upper_g", cfg.thresholds.upper_threshold);
      cfg.thresholds.lower_threshold = t.value("lower_g", cfg.thresholds.lower_threshold);
    }

    if (j.contains("serial")) {
      const auto& s = j["serial"];
      cfg.serial.device = s.value("device", cfg.serial.device);
      cfg.serial.baud   = s.value("baud", cfg.serial.baud);
    }

    if (j.contains("replay")) {
      const auto& r = j["replay"];
      cfg.replay.path     = r.value("path", cfg.replay.path);
      cfg.replay.realtime = r.value("realtime", cfg.replay.realtime);
      cfg.replay.loop     = r.value("loop", cfg.replay.loop);
    }
  } catch (const json::exception& e) {
    throw std::runtime_error("Bad value in config " + path + ": " + e.what());
  }

  return cfg;
}

AppConfig load_config_from_args(int argc, char** argv) {
  if (argc > 1) return load_config(argv[1]);

  std::ifstream probe(kDefaultConfigPath);
  if (probe.is_open()) return load_config(kDefaultConfigPath);

  return AppConfig{};
}
