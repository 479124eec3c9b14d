#pragma once
#include "Transport.hpp"
#include <boost/asio.hpp>
#include <boost/asio/serial_port.hpp>
#include <array>
#include <memory>
#include <string>

// ITransport over a UART link (USB adapter or BLE-serial bridge). The sensor
// streams the same 20-byte frames there, and accepts the same 5-byte commands.
// A serial link has no GATT table, so discovery reports the sensor service
// with both characteristics.
//
// All events are posted to the io_context, so they arrive one at a time on
// whichever thread runs it.
class SerialTransport : public ITransport {
public:
  SerialTransport(boost::asio::io_context& io, std::string device, unsigned baud);

  void set_event_handler(EventHandler handler) override { handler_ = std::move(handler); }
  bool discover_services() override;
  bool write_characteristic(const std::string& id, const Bytes& bytes) override;
  bool enable_notifications(const std::string& id) override;

  // Throws std::runtime_error if the port cannot be opened or configured.
  void open();
  void close();
  bool is_open() const { return port_.is_open(); }

private:
  void post(TransportEvent ev);
  void start_read();
  void deliver_frames();

  boost::asio::io_context& io_;
  boost::asio::serial_port port_;
  std::string device_;
  unsigned baud_;

  EventHandler handler_;
  std::array<uint8_t, 256> read_buf_{};
  Bytes carry_;
  bool reading_ = false;
  bool writing_ = false;
  bool closing_ = false;
};
