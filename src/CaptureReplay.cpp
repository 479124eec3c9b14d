#include "CaptureReplay.hpp"
#include "Log.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace {

const char* TAG = "Replay";

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

Bytes parse_hex(const std::string& text) {
  Bytes out;
  out.reserve(text.size() / 2);

  int high = -1;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    int v = hex_value(c);
    if (v < 0) throw std::runtime_error(std::string("Invalid hex digit '") + c + "'");
    if (high < 0) {
      high = v;
    } else {
      out.push_back(static_cast<uint8_t>((high << 4) | v));
      high = -1;
    }
  }
  if (high >= 0) throw std::runtime_error("Odd number of hex digits");
  return out;
}

JsonCaptureSource::JsonCaptureSource(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open capture file " + path);

  json j;
  try {
    f >> j;
  } catch (const json::exception& e) {
    throw std::runtime_error("Malformed capture " + path + ": " + e.what());
  }
  if (!j.is_array()) throw std::runtime_error("Capture JSON must be an array");

  records_.reserve(j.size());
  for (const auto& item : j) {
    CaptureRecord rec;
    try {
      rec.t_ms = item.value("t_ms", int64_t{0});
      rec.data = parse_hex(item.value("data", std::string()));
    } catch (const json::exception& e) {
      throw std::runtime_error("Bad record in capture " + path + ": " + e.what());
    }
    records_.push_back(std::move(rec));
  }
}

bool JsonCaptureSource::next(CaptureRecord& out) {
  if (idx_ >= records_.size()) return false;
  out = records_[idx_++];
  return true;
}

ReplayTransport::ReplayTransport() {
  GattService sensor;
  sensor.uuid = kSensorServiceUuid;
  sensor.characteristics = {kNotifyCharUuid, kWriteCharUuid};
  services_.push_back(sensor);
}

bool ReplayTransport::discover_services() {
  if (discovery_status_ != 0) {
    push(TransportEvent::discovery_failed(discovery_status_));
  } else {
    push(TransportEvent::services_discovered(services_));
  }
  return true;
}

bool ReplayTransport::write_characteristic(const std::string& id, const Bytes& bytes) {
  (void)id;
  const int index = static_cast<int>(writes_.size());
  writes_.push_back(bytes);

  if (index == fail_write_index_) {
    push(TransportEvent::write_complete(false, fail_write_status_));
  } else {
    push(TransportEvent::write_complete(true));
  }
  return true;
}

bool ReplayTransport::enable_notifications(const std::string& id) {
  (void)id;
  if (notify_status_ != 0) {
    push(TransportEvent::notifications_enabled(false, notify_status_));
  } else {
    notifying_ = true;
    push(TransportEvent::notifications_enabled(true));
  }
  return true;
}

void ReplayTransport::connect() {
  push(TransportEvent::connected());
}

void ReplayTransport::drop() {
  notifying_ = false;
  push(TransportEvent::disconnected());
}

void ReplayTransport::deliver(const Bytes& payload) {
  if (!notifying_) {
    log_message(LogLevel::Debug, TAG, "Notifications off, payload dropped");
    return;
  }
  push(TransportEvent::notification(kNotifyCharUuid, payload));
}

std::size_t ReplayTransport::pump() {
  std::size_t delivered = 0;
  while (!pending_.empty()) {
    TransportEvent ev = std::move(pending_.front());
    pending_.pop_front();
    if (handler_) handler_(ev);
    ++delivered;
  }
  return delivered;
}
