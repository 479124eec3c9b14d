#pragma once
#include <atomic>
#include <functional>

struct ThresholdConfig {
  float upper_threshold = 1.5f;   // g, trigger edge
  float lower_threshold = 0.1f;   // g, re-arm edge
};

struct KickEvent {
  bool fired = false;
  float intensity = 0.0f;   // compensated / upper, capped at kMaxIntensity
  ThresholdConfig thresholds;   // the snapshot this sample was judged against
};

enum class DetectorState { Armed, Disarmed };

const char* to_string(DetectorState state);

// Deadband hysteresis over the compensated acceleration magnitude.
// A kick fires when an armed detector sees a value above the upper threshold;
// it will not fire again until the signal has dropped below the lower one.
class KickDetector {
public:
  static constexpr float kUpperFloor = 0.1f;
  static constexpr float kLowerFloor = 0.01f;
  static constexpr float kMaxIntensity = 2.0f;

  using KickHandler = std::function<void(float intensity)>;

  KickDetector();
  explicit KickDetector(const ThresholdConfig& cfg);

  void set_kick_handler(KickHandler handler);

  // Not thread-safe against itself; see set_* for what may run concurrently.
  // Non-finite input is ignored.
  KickEvent process(float compensated);

  void reset();

  // Safe to call from another thread while process() runs. Values are
  // clamped to their floors, non-finite ones replaced by them; no ordering
  // between the two is enforced.
  void set_upper_threshold(float value);
  void set_lower_threshold(float value);
  void set_thresholds(float upper, float lower);

  ThresholdConfig thresholds() const { return thresholds_.load(); }
  DetectorState state() const { return state_; }
  bool armed() const { return state_ == DetectorState::Armed; }

private:
  static ThresholdConfig clamped(ThresholdConfig cfg);
  template <typename Fn> void update_thresholds(Fn fn);

  std::atomic<ThresholdConfig> thresholds_;
  DetectorState state_ = DetectorState::Armed;
  KickHandler on_kick_;
};
