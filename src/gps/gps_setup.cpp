// src/gps/gps_setup.cpp
#include "gps_setup.h"
#include "common/log.h"

namespace kermit {

GpsSetupHooks GpsSetupHooks::system(const api::SurveyConfig& config) {
    GpsSetupHooks hooks;
    hooks.enumerate = enumerate_serial_ports;
    hooks.choose = prompt_for_port;
    int baud = config.gps_baud;
    hooks.open = [baud](const std::string& device)
        -> api::Result<std::unique_ptr<LineSource>> {
        auto port = SerialLineSource::open(device, baud, SERIAL_LINE_TIMEOUT_MS);
        if (!port.ok()) return port.error();
        return std::unique_ptr<LineSource>(std::move(port.value()));
    };
    hooks.sleep = real_sleeper();
    hooks.now = real_clock();
    return hooks;
}

GpsSetup setup_gps(const api::SurveyConfig& config, const GpsSetupHooks& hooks) {
    auto interrupted = [&hooks]() { return hooks.keep_going && !hooks.keep_going(); };

    std::optional<std::string> device;
    if (!config.gps_device.empty()) {
        device = config.gps_device;
    } else {
        device = select_gps_port(hooks.enumerate(), hooks.choose);
    }
    if (interrupted()) {
        log::warn("GPS", "Interrupted during GPS setup. Not logging location source");
        return GpsSetup();
    }

    if (!device) {
        log::warn("GPS", "Could not find GPS. Not logging location source");
        return GpsSetup();
    }
    log::debug("GPS", "Found GPS source device " + *device);

    auto lines = hooks.open(*device);
    if (!lines.ok()) {
        log::error("GPS", lines.error().message + ". No location services available");
        return GpsSetup();
    }

    auto receiver = std::make_unique<GpsReceiver>(std::move(lines.value()));
    auto first = receiver->wait_for_valid_fix(config.gps_poll_seconds, hooks.sleep,
                                              hooks.now ? hooks.now : real_clock(),
                                              hooks.keep_going);
    if (!first.ok()) {
        log::error("GPS", first.error().message + ". No location services available");
        return GpsSetup();
    }

    GpsSetup setup;
    setup.receiver = std::move(receiver);
    setup.first_fix = first.value();
    return setup;
}

} // namespace kermit
