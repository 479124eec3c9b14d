#include "SerialTransport.hpp"
#include "FrameDecoder.hpp"
#include "Log.hpp"
#include <stdexcept>
#include <utility>

namespace asio = boost::asio;

namespace {
const char* TAG = "SerialTransport";
}

SerialTransport::SerialTransport(asio::io_context& io, std::string device, unsigned baud)
  : io_(io), port_(io), device_(std::move(device)), baud_(baud) {}

void SerialTransport::open() {
  boost::system::error_code ec;
  port_.open(device_, ec);
  if (ec) {
    throw std::runtime_error("Could not open serial port " + device_ + ": " + ec.message());
  }

  try {
    port_.set_option(asio::serial_port_base::baud_rate(baud_));
    port_.set_option(asio::serial_port_base::character_size(8));
    port_.set_option(
      asio::serial_port_base::flow_control(
        asio::serial_port_base::flow_control::none
      )
    );
    port_.set_option(
      asio::serial_port_base::parity(
        asio::serial_port_base::parity::none
      )
    );
    port_.set_option(
      asio::serial_port_base::stop_bits(
        asio::serial_port_base::stop_bits::one
      )
    );
  } catch (const boost::system::system_error& e) {
    port_.close(ec);
    throw std::runtime_error("Could not configure serial port " + device_ + ": " + e.what());
  }

  closing_ = false;
  log_message(LogLevel::Info, TAG,
              "Opened serial port " + device_ + " @ " + std::to_string(baud_));
  post(TransportEvent::connected());
}

void SerialTransport::close() {
  if (!port_.is_open()) return;
  closing_ = true;

  boost::system::error_code ec;
  port_.cancel(ec);
  port_.close(ec);
  if (ec) log_message(LogLevel::Warn, TAG, "Close: " + ec.message());

  reading_ = false;
  carry_.clear();
  post(TransportEvent::disconnected());
}

bool SerialTransport::discover_services() {
  if (!port_.is_open()) return false;

  GattService sensor;
  sensor.uuid = kSensorServiceUuid;
  sensor.characteristics = {kNotifyCharUuid, kWriteCharUuid};
  post(TransportEvent::services_discovered(ServiceSet{sensor}));
  return true;
}

bool SerialTransport::write_characteristic(const std::string& id, const Bytes& bytes) {
  if (!port_.is_open() || writing_ || !same_uuid(id, kWriteCharUuid)) return false;

  // the buffer has to live until the handler runs
  auto buf = std::make_shared<Bytes>(bytes);
  writing_ = true;
  asio::async_write(port_, asio::buffer(*buf),
    [this, buf](const boost::system::error_code& ec, std::size_t) {
      writing_ = false;
      if (ec == asio::error::operation_aborted) return;
      if (ec) log_message(LogLevel::Error, TAG, "Write failed: " + ec.message());
      if (handler_) handler_(TransportEvent::write_complete(!ec, ec.value()));
    });
  return true;
}

bool SerialTransport::enable_notifications(const std::string& id) {
  if (!port_.is_open() || !same_uuid(id, kNotifyCharUuid)) return false;

  if (!reading_) {
    reading_ = true;
    start_read();
  }
  post(TransportEvent::notifications_enabled(true));
  return true;
}

void SerialTransport::start_read() {
  port_.async_read_some(asio::buffer(read_buf_),
    [this](const boost::system::error_code& ec, std::size_t n) {
      if (ec) {
        reading_ = false;
        carry_.clear();
        if (ec == asio::error::operation_aborted || closing_) return;
        log_message(LogLevel::Error, TAG, "Read failed: " + ec.message());
        boost::system::error_code ignored;
        port_.close(ignored);
        if (handler_) handler_(TransportEvent::disconnected(ec.value()));
        return;
      }

      if (n > 0) {
        carry_.insert(carry_.end(), read_buf_.begin(), read_buf_.begin() + n);
        deliver_frames();
      }
      if (reading_ && port_.is_open()) start_read();
    });
}

void SerialTransport::deliver_frames() {
  // A read can end mid-frame. Hand over everything the decoder would scan
  // and keep the unscanned tail (< one frame) for the next read.
  FrameDecoder scan(carry_);
  SensorSample ignored;
  while (scan.next(ignored)) {}
  const std::size_t used = scan.position();
  if (used == 0) return;

  Bytes payload(carry_.begin(), carry_.begin() + used);
  carry_.erase(carry_.begin(), carry_.begin() + used);
  if (handler_) handler_(TransportEvent::notification(kNotifyCharUuid, std::move(payload)));
}

void SerialTransport::post(TransportEvent ev) {
  asio::post(io_, [this, ev = std::move(ev)]() {
    if (handler_) handler_(ev);
  });
}
