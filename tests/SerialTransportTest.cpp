#include "DeviceSession.hpp"
#include "SerialTransport.hpp"
#include "TestFrames.hpp"
#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <unistd.h>
#include <vector>

namespace asio = boost::asio;

namespace {

// Master side of a pseudo-terminal; the transport opens the slave as its port.
class PtyPair {
public:
  PtyPair() {
    master_ = posix_openpt(O_RDWR | O_NOCTTY);
    if (master_ < 0) return;
    if (grantpt(master_) != 0 || unlockpt(master_) != 0) {
      ::close(master_);
      master_ = -1;
      return;
    }
    const char* name = ptsname(master_);
    if (name) slave_name_ = name;
  }
  ~PtyPair() {
    if (master_ >= 0) ::close(master_);
  }

  bool ok() const { return master_ >= 0 && !slave_name_.empty(); }
  const std::string& slave_name() const { return slave_name_; }

  void write(const Bytes& bytes) {
    ASSERT_EQ(::write(master_, bytes.data(), bytes.size()),
              static_cast<ssize_t>(bytes.size()));
  }

  Bytes read_available() {
    Bytes out;
    pollfd p{master_, POLLIN, 0};
    while (::poll(&p, 1, 50) > 0 && (p.revents & POLLIN)) {
      uint8_t buf[64];
      ssize_t n = ::read(master_, buf, sizeof(buf));
      if (n <= 0) break;
      out.insert(out.end(), buf, buf + n);
    }
    return out;
  }

private:
  int master_ = -1;
  std::string slave_name_;
};

template <typename Pred>
bool run_until(asio::io_context& io, Pred done) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!done() && std::chrono::steady_clock::now() < deadline) {
    io.restart();
    io.run_for(std::chrono::milliseconds(10));
  }
  return done();
}

}  // namespace

TEST(SerialTransport, OpenFailureThrows) {
  asio::io_context io;
  SerialTransport serial(io, "/dev/kicksense-no-such-port", 115200);
  EXPECT_THROW(serial.open(), std::runtime_error);
  EXPECT_FALSE(serial.discover_services());
}

TEST(SerialTransport, ConfiguresSensorAndStreamsKicks) {
  PtyPair pty;
  if (!pty.ok()) GTEST_SKIP() << "no pseudo-terminal available";

  asio::io_context io;
  SerialTransport serial(io, pty.slave_name(), 115200);
  KickDetector detector;
  DeviceSession session(serial, detector);

  std::vector<float> kicks;
  detector.set_kick_handler([&kicks](float i) { kicks.push_back(i); });

  serial.open();
  ASSERT_TRUE(run_until(io, [&] { return session.streaming(); }));

  Bytes expected;
  for (const auto& c : {DeviceSession::kUnlockCommand, DeviceSession::kRate100HzCommand,
                        DeviceSession::kSaveCommand}) {
    expected.insert(expected.end(), c.begin(), c.end());
  }
  EXPECT_EQ(pty.read_available(), expected);

  // second frame arrives in two pieces
  Bytes kick = make_frame(0, 0, 8192);
  Bytes first(kick.begin(), kick.begin() + 7);
  Bytes rest(kick.begin() + 7, kick.end());

  pty.write(make_frame(0, 0, 2048));
  ASSERT_TRUE(run_until(io, [&] { return session.samples_decoded() == 1; }));
  pty.write(first);
  io.restart();
  io.run_for(std::chrono::milliseconds(20));
  pty.write(rest);
  ASSERT_TRUE(run_until(io, [&] { return kicks.size() == 1; }));

  EXPECT_EQ(session.samples_decoded(), 2u);
  EXPECT_FLOAT_EQ(kicks[0], (4.0f - 2.09f) / 1.5f);

  session.disconnect();
  serial.close();
  EXPECT_FALSE(serial.is_open());
}
