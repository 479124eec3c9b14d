#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

// GATT identifiers of the WT901 family motion sensor.
constexpr const char* kSensorServiceUuid = "0000ffe0-0000-1000-8000-00805f9a34fb";
constexpr const char* kNotifyCharUuid    = "0000ffe4-0000-1000-8000-00805f9a34fb";
constexpr const char* kWriteCharUuid     = "0000ffe9-0000-1000-8000-00805f9a34fb";

// Case-insensitive uuid comparison.
bool same_uuid(const std::string& a, const std::string& b);

struct GattService {
  std::string uuid;
  std::vector<std::string> characteristics;

  bool has_characteristic(const std::string& id) const;
};

using ServiceSet = std::vector<GattService>;

struct TransportEvent {
  enum class Kind {
    Connected,
    Disconnected,
    ServicesDiscovered,
    WriteComplete,
    NotificationsEnabled,
    Notification
  };

  Kind kind = Kind::Disconnected;
  bool ok = true;
  int status = 0;               // transport specific, 0 on success
  std::string characteristic;   // Notification only
  ServiceSet services;          // ServicesDiscovered only
  Bytes payload;                // Notification only

  static TransportEvent connected();
  static TransportEvent disconnected(int status = 0);
  static TransportEvent services_discovered(ServiceSet services);
  static TransportEvent discovery_failed(int status);
  static TransportEvent write_complete(bool ok, int status = 0);
  static TransportEvent notifications_enabled(bool ok, int status = 0);
  static TransportEvent notification(std::string characteristic, Bytes payload);
};

const char* to_string(TransportEvent::Kind kind);

// Byte channel to the sensor. Each call only starts an operation and returns
// false if it could not be started; its completion arrives later as an event.
// Events must be delivered one at a time, in order.
class ITransport {
public:
  using EventHandler = std::function<void(const TransportEvent&)>;

  virtual ~ITransport() = default;

  virtual void set_event_handler(EventHandler handler) = 0;
  virtual bool discover_services() = 0;
  virtual bool write_characteristic(const std::string& id, const Bytes& bytes) = 0;
  virtual bool enable_notifications(const std::string& id) = 0;
};
