#include "UnitScaler.hpp"

float scale_accel(int16_t raw) {
  return static_cast<float>(raw) * kAccelScale;
}

float scale_gyro(int16_t raw) {
  return static_cast<float>(raw) * kGyroScale;
}

float scale_angle(int16_t raw) {
  return static_cast<float>(raw) * kAngleScale;
}
