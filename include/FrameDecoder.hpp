#pragma once
#include "SensorSample.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

// Pulls SensorSamples out of one notification payload.
//
// Frame layout (20 bytes): 0x55 0x61, then nine little-endian int16 fields
// ax ay az wx wy wz roll pitch yaw. The scan resynchronises byte by byte, so
// stray or dropped bytes only cost the frames they touch. Bytes of a trailing
// partial frame are never turned into a sample.
//
// The decoder does not copy the buffer: it must outlive the decoder.
class FrameDecoder {
public:
  static constexpr std::size_t kFrameLength = 20;
  static constexpr uint8_t kSync0 = 0x55;
  static constexpr uint8_t kSync1 = 0x61;
  static constexpr float kBaselineOffset = 2.09f;   // g, subtracted from |accel|

  FrameDecoder(const uint8_t* data, std::size_t len);
  explicit FrameDecoder(const std::vector<uint8_t>& bytes);

  // Returns false once fewer than kFrameLength bytes remain.
  bool next(SensorSample& out);

  std::size_t position() const { return pos_; }

  // `frame` must point at kFrameLength bytes starting with the sync header.
  static SensorSample decode_frame(const uint8_t* frame);

  static std::vector<SensorSample> decode_all(const std::vector<uint8_t>& bytes);

private:
  const uint8_t* data_;
  std::size_t len_;
  std::size_t pos_ = 0;
};
