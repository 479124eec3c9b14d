#pragma once
#include "KickDetector.hpp"
#include "SensorSample.hpp"
#include "Transport.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

enum class SessionState {
  Disconnected,
  Discovering,
  Unlocking,
  SettingRate,
  SavingConfig,
  EnablingNotifications,
  Streaming
};

enum class SessionErrorKind {
  DiscoveryFailed,           // device not reachable / discovery rejected
  CharacteristicsNotFound,   // device answered, but not with the sensor's protocol
  StepFailed,                // a configuration write was rejected
  ConnectionLost
};

struct SessionError {
  SessionErrorKind kind = SessionErrorKind::ConnectionLost;
  SessionState state = SessionState::Disconnected;   // state the failure happened in
  int status = 0;
  std::string message;
};

const char* to_string(SessionState state);
const char* to_string(SessionErrorKind kind);

// Arms the sensor for streaming, then feeds its notifications through the
// frame decoder into the kick detector.
//
//   Disconnected -> Discovering -> Unlocking -> SettingRate -> SavingConfig
//                -> EnablingNotifications -> Streaming
//
// Each step advances only on a successful acknowledgment of the operation it
// started. Any failure drops back to Disconnected and is reported once through
// the error handler; the caller restarts the whole sequence with begin().
//
// The session installs itself as the transport's event handler, so it must
// outlive the transport's use of it and cannot be copied.
class DeviceSession {
public:
  static constexpr std::array<uint8_t, 5> kUnlockCommand  {{0xFF, 0xAA, 0x69, 0x88, 0xB5}};
  static constexpr std::array<uint8_t, 5> kRate100HzCommand{{0xFF, 0xAA, 0x03, 0x09, 0x00}};
  static constexpr std::array<uint8_t, 5> kSaveCommand    {{0xFF, 0xAA, 0x00, 0x00, 0x00}};

  using SampleHandler = std::function<void(const SensorSample&)>;
  using ErrorHandler  = std::function<void(const SessionError&)>;
  using StateHandler  = std::function<void(SessionState)>;

  DeviceSession(ITransport& transport, KickDetector& detector);
  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  void set_sample_handler(SampleHandler handler) { on_sample_ = std::move(handler); }
  void set_error_handler(ErrorHandler handler)   { on_error_  = std::move(handler); }
  void set_state_handler(StateHandler handler)   { on_state_  = std::move(handler); }

  // Starts discovery. Only valid from Disconnected; returns false otherwise
  // or if discovery could not be started.
  bool begin();

  // Caller-side cancellation. Never reported as an error.
  void disconnect();

  // Single entry point for everything the transport reports.
  void on_event(const TransportEvent& ev);

  SessionState state() const { return state_; }
  bool streaming() const { return state_ == SessionState::Streaming; }
  uint64_t samples_decoded() const { return samples_decoded_; }
  const std::string& service_uuid() const { return service_uuid_; }

private:
  void on_services(const TransportEvent& ev);
  void on_ack(const TransportEvent& ev);
  void on_notification(const TransportEvent& ev);
  void on_link_lost(const TransportEvent& ev);

  bool locate_characteristics(const ServiceSet& services);
  void enter(SessionState next);
  void start_step();
  void fail(SessionErrorKind kind, int status, const std::string& message);

  ITransport& transport_;
  KickDetector& detector_;

  SessionState state_ = SessionState::Disconnected;
  std::string service_uuid_;
  uint64_t samples_decoded_ = 0;

  SampleHandler on_sample_;
  ErrorHandler on_error_;
  StateHandler on_state_;
};
