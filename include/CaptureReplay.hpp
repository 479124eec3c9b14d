#pragma once
#include "Transport.hpp"
#include <cstdint>
#include <deque>
#include <string>
#include <utility>
#include <vector>

// One recorded notification payload.
struct CaptureRecord {
  int64_t t_ms = 0;
  Bytes data;
};

// "55 61 0a ff" / "55610aff" -> bytes. Throws std::runtime_error on an odd
// number of digits or a non-hex character.
Bytes parse_hex(const std::string& text);

// Reads a capture file: a JSON array of {"t_ms": 0, "data": "55 61 ..."}.
class JsonCaptureSource {
public:
  explicit JsonCaptureSource(const std::string& path);
  bool next(CaptureRecord& out);
  std::size_t size() const { return records_.size(); }

private:
  std::vector<CaptureRecord> records_;
  size_t idx_ = 0;
};

// In-process transport for replaying captures and for tests. Every operation
// is acknowledged; events are queued and only delivered by pump(), never from
// inside a transport call.
class ReplayTransport : public ITransport {
public:
  ReplayTransport();

  void set_event_handler(EventHandler handler) override { handler_ = std::move(handler); }
  bool discover_services() override;
  bool write_characteristic(const std::string& id, const Bytes& bytes) override;
  bool enable_notifications(const std::string& id) override;

  void connect();
  void drop();
  void deliver(const Bytes& payload);

  // Delivers queued events, including any queued while delivering.
  // Returns how many were delivered.
  std::size_t pump();

  // What discover_services() reports. Defaults to the sensor service.
  void set_services(ServiceSet services) { services_ = std::move(services); }
  void fail_discovery(int status) { discovery_status_ = status; }
  // Reject the nth (0-based) characteristic write with `status`.
  void fail_write(int index, int status) { fail_write_index_ = index; fail_write_status_ = status; }
  void fail_notifications(int status) { notify_status_ = status; }

  const std::vector<Bytes>& writes() const { return writes_; }
  bool notifying() const { return notifying_; }

private:
  void push(TransportEvent ev) { pending_.push_back(std::move(ev)); }

  EventHandler handler_;
  std::deque<TransportEvent> pending_;
  ServiceSet services_;
  std::vector<Bytes> writes_;
  bool notifying_ = false;

  int discovery_status_ = 0;
  int fail_write_index_ = -1;
  int fail_write_status_ = 0;
  int notify_status_ = 0;
};
