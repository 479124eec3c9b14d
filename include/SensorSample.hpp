#pragma once

struct Axis3 {
  float x = 0, y = 0, z = 0;
};

struct Orientation {
  float roll = 0, pitch = 0, yaw = 0;   // degrees
};

// One decoded telemetry frame in physical units.
struct SensorSample {
  Axis3 accel;                  // g
  Axis3 gyro;                   // deg/s
  Orientation orientation;
  float accel_magnitude = 0;        // |accel| in g
  float compensated_magnitude = 0;  // max(0, |accel| - baseline)
};
