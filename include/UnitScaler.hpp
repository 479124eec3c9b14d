#pragma once
#include <cstdint>

// Full-scale ranges of the sensor: +-16 g, +-2000 deg/s, +-180 deg.
constexpr float kAccelScale = 16.0f / 32768.0f;
constexpr float kGyroScale  = 2000.0f / 32768.0f;
constexpr float kAngleScale = 180.0f / 32768.0f;

float scale_accel(int16_t raw);
float scale_gyro(int16_t raw);
float scale_angle(int16_t raw);
