#include "KickDetector.hpp"
#include "Log.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace {
const char* TAG = "KickDetector";
}

const char* to_string(DetectorState state) {
  return state == DetectorState::Armed ? "Armed" : "Disarmed";
}

KickDetector::KickDetector() : KickDetector(ThresholdConfig{}) {}

KickDetector::KickDetector(const ThresholdConfig& cfg)
  : thresholds_(clamped(cfg)) {}

void KickDetector::set_kick_handler(KickHandler handler) {
  on_kick_ = std::move(handler);
}

KickEvent KickDetector::process(float v) {
  KickEvent ev;
  if (!std::isfinite(v)) return ev;

  // one snapshot per call so a concurrent setter can't hand us a mixed pair
  const ThresholdConfig cfg = thresholds_.load();
  ev.thresholds = cfg;

  if (state_ == DetectorState::Armed && v > cfg.upper_threshold) {
    ev.fired = true;
    ev.intensity = std::min(v / cfg.upper_threshold, kMaxIntensity);
    state_ = DetectorState::Disarmed;

    if (log_level() <= LogLevel::Debug) {
      std::ostringstream os;
      os << "Kick detected, intensity " << ev.intensity << " at " << v << " g";
      log_message(LogLevel::Debug, TAG, os.str());
    }
    if (on_kick_) on_kick_(ev.intensity);
  } else if (state_ == DetectorState::Disarmed && v < cfg.lower_threshold) {
    state_ = DetectorState::Armed;
    log_message(LogLevel::Debug, TAG, "Re-armed");
  }

  return ev;
}

void KickDetector::reset() {
  state_ = DetectorState::Armed;
  log_message(LogLevel::Debug, TAG, "Detector reset");
}

template <typename Fn>
void KickDetector::update_thresholds(Fn fn) {
  ThresholdConfig current = thresholds_.load();
  ThresholdConfig next;
  do {
    next = current;
    fn(next);
    next = clamped(next);
  } while (!thresholds_.compare_exchange_weak(current, next));

  if (log_level() <= LogLevel::Debug) {
    std::ostringstream os;
    os << "Thresholds set to upper " << next.upper_threshold
       << " g, lower " << next.lower_threshold << " g";
    log_message(LogLevel::Debug, TAG, os.str());
  }

  if (next.lower_threshold >= next.upper_threshold) {
    log_message(LogLevel::Warn, TAG,
                "Lower threshold is not below upper threshold, one impact may fire repeatedly");
  }
}

void KickDetector::set_upper_threshold(float value) {
  update_thresholds([value](ThresholdConfig& c) { c.upper_threshold = value; });
}

void KickDetector::set_lower_threshold(float value) {
  update_thresholds([value](ThresholdConfig& c) { c.lower_threshold = value; });
}

void KickDetector::set_thresholds(float upper, float lower) {
  update_thresholds([upper, lower](ThresholdConfig& c) {
    c.upper_threshold = upper;
    c.lower_threshold = lower;
  });
}

ThresholdConfig KickDetector::clamped(ThresholdConfig cfg) {
  // NaN or infinite thresholds fall back to the floor
  if (!std::isfinite(cfg.upper_threshold)) cfg.upper_threshold = kUpperFloor;
  if (!std::isfinite(cfg.lower_threshold)) cfg.lower_threshold = kLowerFloor;
  cfg.upper_threshold = std::max(kUpperFloor, cfg.upper_threshold);
  cfg.lower_threshold = std::max(kLowerFloor, cfg.lower_threshold);
  return cfg;
}
