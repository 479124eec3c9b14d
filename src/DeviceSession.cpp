#include "DeviceSession.hpp"
#include "FrameDecoder.hpp"
#include "Log.hpp"

namespace {
const char* TAG = "DeviceSession";

template <std::size_t N>
Bytes to_bytes(const std::array<uint8_t, N>& cmd) {
  return Bytes(cmd.begin(), cmd.end());
}
}  // namespace

const char* to_string(SessionState state) {
  switch (state) {
    case SessionState::Disconnected:          return "Disconnected";
    case SessionState::Discovering:           return "Discovering";
    case SessionState::Unlocking:             return "Unlocking";
    case SessionState::SettingRate:           return "SettingRate";
    case SessionState::SavingConfig:          return "SavingConfig";
    case SessionState::EnablingNotifications: return "EnablingNotifications";
    case SessionState::Streaming:             return "Streaming";
  }
  return "Unknown";
}

const char* to_string(SessionErrorKind kind) {
  switch (kind) {
    case SessionErrorKind::DiscoveryFailed:         return "DiscoveryFailed";
    case SessionErrorKind::CharacteristicsNotFound: return "CharacteristicsNotFound";
    case SessionErrorKind::StepFailed:              return "StepFailed";
    case SessionErrorKind::ConnectionLost:          return "ConnectionLost";
  }
  return "Unknown";
}

DeviceSession::DeviceSession(ITransport& transport, KickDetector& detector)
  : transport_(transport), detector_(detector) {
  transport_.set_event_handler([this](const TransportEvent& ev) { on_event(ev); });
}

bool DeviceSession::begin() {
  if (state_ != SessionState::Disconnected) {
    log_message(LogLevel::Warn, TAG,
                std::string("begin() ignored while ") + to_string(state_));
    return false;
  }

  samples_decoded_ = 0;
  service_uuid_.clear();
  enter(SessionState::Discovering);

  if (!transport_.discover_services()) {
    fail(SessionErrorKind::DiscoveryFailed, -1, "Could not start service discovery");
    return false;
  }
  return true;
}

void DeviceSession::disconnect() {
  if (state_ == SessionState::Disconnected) return;
  log_message(LogLevel::Info, TAG, "Disconnect requested");
  enter(SessionState::Disconnected);
}

void DeviceSession::on_event(const TransportEvent& ev) {
  switch (ev.kind) {
    case TransportEvent::Kind::Connected:
      if (state_ == SessionState::Disconnected) {
        log_message(LogLevel::Info, TAG, "Connected, discovering services");
        begin();
      } else {
        log_message(LogLevel::Warn, TAG,
                    std::string("Connected event while ") + to_string(state_));
      }
      break;
    case TransportEvent::Kind::Disconnected:
      on_link_lost(ev);
      break;
    case TransportEvent::Kind::ServicesDiscovered:
      on_services(ev);
      break;
    case TransportEvent::Kind::WriteComplete:
    case TransportEvent::Kind::NotificationsEnabled:
      on_ack(ev);
      break;
    case TransportEvent::Kind::Notification:
      on_notification(ev);
      break;
  }
}

void DeviceSession::on_services(const TransportEvent& ev) {
  if (state_ != SessionState::Discovering) {
    log_message(LogLevel::Warn, TAG,
                std::string("Unexpected service discovery result while ") + to_string(state_));
    return;
  }
  if (!ev.ok) {
    fail(SessionErrorKind::DiscoveryFailed, ev.status,
         "Service discovery failed with status " + std::to_string(ev.status));
    return;
  }

  for (const auto& s : ev.services) {
    log_message(LogLevel::Debug, TAG, "  service " + s.uuid);
    for (const auto& c : s.characteristics) {
      log_message(LogLevel::Debug, TAG, "    characteristic " + c);
    }
  }

  if (!locate_characteristics(ev.services)) {
    fail(SessionErrorKind::CharacteristicsNotFound, 0,
         "Sensor characteristics not found on device");
    return;
  }

  enter(SessionState::Unlocking);
  start_step();
}

bool DeviceSession::locate_characteristics(const ServiceSet& services) {
  auto usable = [](const GattService& s) {
    return s.has_characteristic(kNotifyCharUuid) && s.has_characteristic(kWriteCharUuid);
  };

  for (const auto& s : services) {
    if (same_uuid(s.uuid, kSensorServiceUuid) && usable(s)) {
      service_uuid_ = s.uuid;
      return true;
    }
  }

  // Firmware variants advertise the pair under a different service; take the
  // first one that carries both.
  log_message(LogLevel::Warn, TAG,
              std::string("Service ") + kSensorServiceUuid + " not usable, probing all services");
  for (const auto& s : services) {
    if (usable(s)) {
      log_message(LogLevel::Info, TAG, "Found characteristics in service " + s.uuid);
      service_uuid_ = s.uuid;
      return true;
    }
  }
  return false;
}

void DeviceSession::start_step() {
  bool started = false;
  switch (state_) {
    case SessionState::Unlocking:
      log_message(LogLevel::Info, TAG, "Unlocking sensor");
      started = transport_.write_characteristic(kWriteCharUuid, to_bytes(kUnlockCommand));
      break;
    case SessionState::SettingRate:
      log_message(LogLevel::Info, TAG, "Setting 100Hz rate");
      started = transport_.write_characteristic(kWriteCharUuid, to_bytes(kRate100HzCommand));
      break;
    case SessionState::SavingConfig:
      log_message(LogLevel::Info, TAG, "Saving config");
      started = transport_.write_characteristic(kWriteCharUuid, to_bytes(kSaveCommand));
      break;
    case SessionState::EnablingNotifications:
      log_message(LogLevel::Info, TAG, "Enabling notifications");
      started = transport_.enable_notifications(kNotifyCharUuid);
      break;
    default:
      return;
  }

  if (!started) {
    fail(SessionErrorKind::StepFailed, -1,
         std::string("Could not start step ") + to_string(state_));
  }
}

void DeviceSession::on_ack(const TransportEvent& ev) {
  const bool writing = state_ == SessionState::Unlocking ||
                       state_ == SessionState::SettingRate ||
                       state_ == SessionState::SavingConfig;
  const bool expected =
      (writing && ev.kind == TransportEvent::Kind::WriteComplete) ||
      (state_ == SessionState::EnablingNotifications &&
       ev.kind == TransportEvent::Kind::NotificationsEnabled);

  if (!expected) {
    log_message(LogLevel::Warn, TAG,
                std::string("Ignoring ") + to_string(ev.kind) + " while " + to_string(state_));
    return;
  }

  if (!ev.ok) {
    fail(SessionErrorKind::StepFailed, ev.status,
         std::string("Step ") + to_string(state_) + " failed with status " +
         std::to_string(ev.status));
    return;
  }

  switch (state_) {
    case SessionState::Unlocking:    enter(SessionState::SettingRate); break;
    case SessionState::SettingRate:  enter(SessionState::SavingConfig); break;
    case SessionState::SavingConfig: enter(SessionState::EnablingNotifications); break;
    default:
      // a reconnect must not start out disarmed by a reading from before it
      detector_.reset();
      enter(SessionState::Streaming);
      log_message(LogLevel::Info, TAG, "Sensor configured and ready");
      return;
  }
  start_step();
}

void DeviceSession::on_notification(const TransportEvent& ev) {
  if (state_ != SessionState::Streaming) {
    log_message(LogLevel::Debug, TAG,
                std::string("Dropping notification while ") + to_string(state_));
    return;
  }
  if (!same_uuid(ev.characteristic, kNotifyCharUuid)) return;

  FrameDecoder decoder(ev.payload);
  SensorSample s;
  // handlers may disconnect us mid-payload
  while (state_ == SessionState::Streaming && decoder.next(s)) {
    ++samples_decoded_;
    if (on_sample_) on_sample_(s);
    detector_.process(s.compensated_magnitude);
  }
}

void DeviceSession::on_link_lost(const TransportEvent& ev) {
  if (state_ == SessionState::Disconnected) return;
  fail(SessionErrorKind::ConnectionLost, ev.status,
       std::string("Connection lost while ") + to_string(state_));
}

void DeviceSession::enter(SessionState next) {
  if (next == state_) return;
  log_message(LogLevel::Debug, TAG,
              std::string(to_string(state_)) + " -> " + to_string(next));
  state_ = next;
  if (on_state_) on_state_(state_);
}

void DeviceSession::fail(SessionErrorKind kind, int status, const std::string& message) {
  SessionError err;
  err.kind = kind;
  err.state = state_;
  err.status = status;
  err.message = message;

  log_message(LogLevel::Error, TAG, std::string(to_string(kind)) + ": " + message);
  enter(SessionState::Disconnected);
  if (on_error_) on_error_(err);
}
