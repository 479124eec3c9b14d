#include "Transport.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

bool same_uuid(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

bool GattService::has_characteristic(const std::string& id) const {
  return std::any_of(characteristics.begin(), characteristics.end(),
                     [&id](const std::string& c) { return same_uuid(c, id); });
}

TransportEvent TransportEvent::connected() {
  TransportEvent ev;
  ev.kind = Kind::Connected;
  return ev;
}

TransportEvent TransportEvent::disconnected(int status) {
  TransportEvent ev;
  ev.kind = Kind::Disconnected;
  ev.status = status;
  return ev;
}

TransportEvent TransportEvent::services_discovered(ServiceSet services) {
  TransportEvent ev;
  ev.kind = Kind::ServicesDiscovered;
  ev.services = std::move(services);
  return ev;
}

TransportEvent TransportEvent::discovery_failed(int status) {
  TransportEvent ev;
  ev.kind = Kind::ServicesDiscovered;
  ev.ok = false;
  ev.status = status;
  return ev;
}

TransportEvent TransportEvent::write_complete(bool ok, int status) {
  TransportEvent ev;
  ev.kind = Kind::WriteComplete;
  ev.ok = ok;
  ev.status = status;
  return ev;
}

TransportEvent TransportEvent::notifications_enabled(bool ok, int status) {
  TransportEvent ev;
  ev.kind = Kind::NotificationsEnabled;
  ev.ok = ok;
  ev.status = status;
  return ev;
}

TransportEvent TransportEvent::notification(std::string characteristic, Bytes payload) {
  TransportEvent ev;
  ev.kind = Kind::Notification;
  ev.characteristic = std::move(characteristic);
  ev.payload = std::move(payload);
  return ev;
}

const char* to_string(TransportEvent::Kind kind) {
  switch (kind) {
    case TransportEvent::Kind::Connected:            return "Connected";
    case TransportEvent::Kind::Disconnected:         return "Disconnected";
    case TransportEvent::Kind::ServicesDiscovered:   return "ServicesDiscovered";
    case TransportEvent::Kind::WriteComplete:        return "WriteComplete";
    case TransportEvent::Kind::NotificationsEnabled: return "NotificationsEnabled";
    case TransportEvent::Kind::Notification:         return "Notification";
  }
  return "Unknown";
}
