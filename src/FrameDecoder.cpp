#include "FrameDecoder.hpp"
#include "UnitScaler.hpp"
#include <algorithm>
#include <cmath>

namespace {

int16_t read_le16(const uint8_t* p) {
  return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                              static_cast<uint16_t>(p[1] << 8));
}

}  // namespace

FrameDecoder::FrameDecoder(const uint8_t* data, std::size_t len)
  : data_(data), len_(len) {}

FrameDecoder::FrameDecoder(const std::vector<uint8_t>& bytes)
  : data_(bytes.data()), len_(bytes.size()) {}

bool FrameDecoder::next(SensorSample& out) {
  while (pos_ + kFrameLength <= len_) {
    const uint8_t* p = data_ + pos_;
    if (p[0] != kSync0 || p[1] != kSync1) {
      // not a header here, slide one byte and look again
      ++pos_;
      continue;
    }
    out = decode_frame(p);
    pos_ += kFrameLength;
    return true;
  }
  return false;
}

SensorSample FrameDecoder::decode_frame(const uint8_t* frame) {
  const uint8_t* f = frame + 2;

  SensorSample s;
  s.accel.x = scale_accel(read_le16(f + 0));
  s.accel.y = scale_accel(read_le16(f + 2));
  s.accel.z = scale_accel(read_le16(f + 4));

  s.gyro.x = scale_gyro(read_le16(f + 6));
  s.gyro.y = scale_gyro(read_le16(f + 8));
  s.gyro.z = scale_gyro(read_le16(f + 10));

  s.orientation.roll  = scale_angle(read_le16(f + 12));
  s.orientation.pitch = scale_angle(read_le16(f + 14));
  s.orientation.yaw   = scale_angle(read_le16(f + 16));

  s.accel_magnitude = std::sqrt(s.accel.x * s.accel.x +
                                s.accel.y * s.accel.y +
                                s.accel.z * s.accel.z);
  s.compensated_magnitude = std::max(0.0f, s.accel_magnitude - kBaselineOffset);
  return s;
}

std::vector<SensorSample> FrameDecoder::decode_all(const std::vector<uint8_t>& bytes) {
  std::vector<SensorSample> samples;
  samples.reserve(bytes.size() / kFrameLength);

  FrameDecoder decoder(bytes);
  SensorSample s;
  while (decoder.next(s)) {
    samples.push_back(s);
  }
  return samples;
}
