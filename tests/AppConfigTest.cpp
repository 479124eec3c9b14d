#include "AppConfig.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string write_temp(const std::string& name, const std::string& body) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream f(path);
  f << body;
  return path;
}

}  // namespace

TEST(AppConfig, ReadsAllSections) {
  auto path = write_temp("kicksense_full.json", R"({
    "log_level": "debug",
    "thresholds": { "upper_g": 2.25, "lower_g": 0.3 },
    "serial": { "device": "/dev/ttyACM1", "baud": 9600 },
    "replay": { "path": "x.json", "realtime": false, "loop": true }
  })");

  AppConfig cfg = load_config(path);
  EXPECT_EQ(cfg.log_level, LogLevel::Debug);
  EXPECT_FLOAT_EQ(cfg.thresholds.upper_threshold, 2.25f);
  EXPECT_FLOAT_EQ(cfg.thresholds.lower_threshold, 0.3f);
  EXPECT_EQ(cfg.serial.device, "/dev/ttyACM1");
  EXPECT_EQ(cfg.serial.baud, 9600u);
  EXPECT_EQ(cfg.replay.path, "x.json");
  EXPECT_FALSE(cfg.replay.realtime);
  EXPECT_TRUE(cfg.replay.loop);
}

TEST(AppConfig, MissingKeysKeepDefaults) {
  auto path = write_temp("kicksense_partial.json", R"({ "thresholds": { "lower_g": 0.2 } })");

  AppConfig cfg = load_config(path);
  EXPECT_EQ(cfg.log_level, LogLevel::Info);
  EXPECT_FLOAT_EQ(cfg.thresholds.upper_threshold, 1.5f);
  EXPECT_FLOAT_EQ(cfg.thresholds.lower_threshold, 0.2f);
  EXPECT_EQ(cfg.serial.device, "/dev/ttyUSB0");
  EXPECT_EQ(cfg.serial.baud, 115200u);
  EXPECT_TRUE(cfg.replay.realtime);
}

TEST(AppConfig, RejectsBadInput) {
  EXPECT_THROW(load_config(::testing::TempDir() + "does_not_exist.json"), std::runtime_error);
  EXPECT_THROW(load_config(write_temp("kicksense_array.json", "[1, 2]")), std::runtime_error);
  EXPECT_THROW(load_config(write_temp("kicksense_broken.json", "{ \"log_level\": ")),
               std::runtime_error);
  EXPECT_THROW(load_config(write_temp("kicksense_level.json", R"({ "log_level": "loud" })")),
               std::runtime_error);
  EXPECT_THROW(load_config(write_temp("kicksense_type.json",
                                      R"({ "thresholds": { "upper_g": "high" } })")),
               std::runtime_error);
}

TEST(AppConfig, ExplicitPathArgumentWins) {
  auto path = write_temp("kicksense_args.json", R"({ "serial": { "baud": 230400 } })");
  std::string prog = "kicksense";
  char* argv[] = {&prog[0], &path[0]};
  AppConfig cfg = load_config_from_args(2, argv);
  EXPECT_EQ(cfg.serial.baud, 230400u);
}

TEST(LogLevel, ParsesNames) {
  EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
  EXPECT_THROW(parse_log_level("WARN"), std::runtime_error);
}
