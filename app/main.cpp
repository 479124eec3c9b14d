#include "AppConfig.hpp"
#include "CaptureReplay.hpp"
#include "DeviceSession.hpp"
#include "KickDetector.hpp"
#include "Log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>
#include <iostream>

static float kick_volume(float intensity) {
  return std::min(std::max(intensity / 2.0f, 0.3f), 1.0f);
}

int main(int argc, char** argv) {
  try {
    AppConfig cfg = load_config_from_args(argc, argv);
    set_log_level(cfg.log_level);

    ReplayTransport transport;
    KickDetector detector(cfg.thresholds);
    DeviceSession session(transport, detector);

    int64_t now_ms = 0;
    int kicks = 0;
    detector.set_kick_handler([&](float intensity) {
      ++kicks;
      std::cout
        << "{"
        << "\"t_ms\":"      << now_ms                << ","
        << "\"kick\":"      << kicks                 << ","
        << "\"intensity\":" << intensity             << ","
        << "\"volume\":"    << kick_volume(intensity)
        << "}"
        << std::endl;
    });

    uint64_t samples = 0;
    session.set_sample_handler([&samples](const SensorSample&) { ++samples; });

    bool failed = false;
    session.set_error_handler([&failed](const SessionError& err) {
      std::cerr << "Sensor error (" << to_string(err.kind) << " in "
                << to_string(err.state) << "): " << err.message << "\n";
      failed = true;
    });

    do {
      // New source for this pass
      JsonCaptureSource source(cfg.replay.path);

      transport.connect();
      transport.pump();
      if (failed || !session.streaming()) {
        std::cerr << "Error: session did not reach Streaming\n";
        return 1;
      }

      CaptureRecord rec;
      int64_t last_t = -1;

      while (source.next(rec)) {
        // simulate real-time spacing based on t_ms in the capture
        if (cfg.replay.realtime && last_t >= 0) {
          int64_t dt = rec.t_ms - last_t;
          if (dt > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(dt));
          }
        }
        last_t = rec.t_ms;
        now_ms = rec.t_ms;

        transport.deliver(rec.data);
        transport.pump();
      }

      // drop the link between passes; the next connect re-arms the detector
      session.disconnect();
      transport.drop();
      transport.pump();
    } while (cfg.replay.loop);

    std::cerr << "Replayed " << samples << " samples, "
              << kicks << " kicks\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
