/**
 * @file gps_setup.h
 * @brief Find, open and warm up the GPS receiver
 *
 * Positioning is disabled for the whole run (null receiver) when no port
 * is found, the port cannot be opened, no valid fix shows up within the
 * poll timeout, or the wait is interrupted. It is not retried.
 */

#ifndef KERMIT_GPS_SETUP_H
#define KERMIT_GPS_SETUP_H

#include "gps_receiver.h"
#include "serial_port.h"
#include "api/survey_config.h"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace kermit {

using LineSourceOpener =
    std::function<api::Result<std::unique_ptr<LineSource>>(const std::string& device)>;

struct GpsSetupHooks {
    std::function<std::vector<SerialPortInfo>()> enumerate;
    PortChooser choose;
    LineSourceOpener open;
    Sleeper sleep;
    MonotonicClock now;
    KeepGoing keep_going;   // empty: never interrupted

    /// Real serial ports, stdin prompt, termios, wall-clock sleep
    static GpsSetupHooks system(const api::SurveyConfig& config);
};

/**
 * A warmed-up receiver and the fix that ended the warm-up.
 * receiver is null when positioning is disabled for the run.
 */
struct GpsSetup {
    std::unique_ptr<GpsReceiver> receiver;
    std::optional<PositionFix> first_fix;
};

GpsSetup setup_gps(const api::SurveyConfig& config, const GpsSetupHooks& hooks);

} // namespace kermit

#endif
