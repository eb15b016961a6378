// src/gps/gps_receiver.cpp
#include "gps_receiver.h"
#include "common/log.h"

#include <algorithm>

namespace kermit {

using api::Error;
using api::ErrorCode;

std::optional<PositionFix> GpsReceiver::next_fix() {
    if (!lines_) return std::nullopt;

    for (int i = 0; i < max_lines_; i++) {
        auto line = lines_->read_line();
        if (!line.ok()) {
            log::debug("GPS", line.error().message);
            return std::nullopt;
        }

        auto decoded = decode_gga(line.value());
        if (!decoded.ok()) {
            if (decoded.error() != ErrorCode::NMEA_NOT_GGA) {
                log::debug("GPS", "Skipping line: " + decoded.error().message);
            }
            lines_skipped_++;
            continue;
        }

        if (!decoded.value()) {
            log::debug("GPS", "Receiver reports no fix");
            return std::nullopt;
        }

        log::debug("GPS", "Read GGA signal " + describe_fix(*decoded.value()) + " successfully");
        return decoded.value();
    }

    log::debug("GPS", "No GGA sentence in " + std::to_string(max_lines_) + " lines");
    return std::nullopt;
}

api::Result<PositionFix> GpsReceiver::wait_for_valid_fix(int timeout_s,
                                                        const Sleeper& sleep,
                                                        const MonotonicClock& now,
                                                        const KeepGoing& keep_going) {
    const std::chrono::milliseconds deadline = now() + std::chrono::seconds(timeout_s);

    while (now() < deadline) {
        if (keep_going && !keep_going()) {
            return Error(ErrorCode::GPS_TIMEOUT, "Interrupted while waiting for a GPS fix");
        }
        auto fix = next_fix();
        if (fix && is_valid_fix(*fix)) {
            log::info("GPS", "Found properly functioning GPS device at " + describe());
            return *fix;
        }
        std::chrono::milliseconds remaining = deadline - now();
        if (remaining > std::chrono::milliseconds::zero()) {
            sleep(std::min<std::chrono::milliseconds>(std::chrono::seconds(1), remaining));
        }
    }

    return Error(ErrorCode::GPS_TIMEOUT,
                 "Polled for " + std::to_string(timeout_s) +
                 " seconds but could not get valid signal from GPS");
}

} // namespace kermit
