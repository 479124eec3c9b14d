#include "UnitScaler.hpp"
#include <gtest/gtest.h>
#include <limits>

TEST(UnitScaler, MatchesFormulaForEveryRawValue) {
  for (int r = std::numeric_limits<int16_t>::min(); r <= std::numeric_limits<int16_t>::max(); ++r) {
    const int16_t raw = static_cast<int16_t>(r);
    const float f = static_cast<float>(raw);
    ASSERT_EQ(scale_accel(raw), f * (16.0f / 32768.0f)) << r;
    ASSERT_EQ(scale_gyro(raw),  f * (2000.0f / 32768.0f)) << r;
    ASSERT_EQ(scale_angle(raw), f * (180.0f / 32768.0f)) << r;
  }
}

TEST(UnitScaler, FullScaleRanges) {
  EXPECT_FLOAT_EQ(scale_accel(-32768), -16.0f);
  EXPECT_FLOAT_EQ(scale_gyro(-32768), -2000.0f);
  EXPECT_FLOAT_EQ(scale_angle(-32768), -180.0f);
  EXPECT_LT(scale_accel(32767), 16.0f);
  EXPECT_EQ(scale_accel(0), 0.0f);
  EXPECT_FLOAT_EQ(scale_accel(2048), 1.0f);
}
