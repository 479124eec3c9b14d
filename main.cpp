#include "AppConfig.hpp"
#include "DeviceSession.hpp"
#include "KickDetector.hpp"
#include "Log.hpp"
#include "SerialTransport.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <csignal>
#include <iostream>
#include <string>

namespace asio = boost::asio;

// Audio trigger volume for a kick of the given intensity.
static float kick_volume(float intensity) {
    return std::min(std::max(intensity / 2.0f, 0.3f), 1.0f);
}

int main(int argc, char** argv) {
    try {
        AppConfig cfg = load_config_from_args(argc, argv);
        set_log_level(cfg.log_level);

        asio::io_context io;

        SerialTransport serial(io, cfg.serial.device, cfg.serial.baud);
        KickDetector detector(cfg.thresholds);
        DeviceSession session(serial, detector);

        int kicks = 0;
        detector.set_kick_handler([&kicks](float intensity) {
            ++kicks;
            // one JSON object per line for whatever plays the sound
            std::cout
                << "{"
                << "\"kick\":"      << kicks                 << ","
                << "\"intensity\":" << intensity             << ","
                << "\"volume\":"    << kick_volume(intensity)
                << "}"
                << std::endl;
        });

        session.set_error_handler([&io](const SessionError& err) {
            std::cerr << "Sensor error (" << to_string(err.kind) << " in "
                                << to_string(err.state) << "): " << err.message << "\n";
            // nothing to retry against on a serial link; let main exit
            io.stop();
        });

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            std::cerr << "Stopping\n";
            session.disconnect();
            serial.close();
            io.stop();
        });

        serial.open();
        io.run();

        std::cerr << "Decoded " << session.samples_decoded() << " samples, "
                            << kicks << " kicks\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << "\n";
        return 1;
    }
}
