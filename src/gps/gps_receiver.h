/**
 * @file gps_receiver.h
 * @brief Pull decoded GGA fixes out of a line-oriented receiver feed
 */

#ifndef KERMIT_GPS_RECEIVER_H
#define KERMIT_GPS_RECEIVER_H

#include "line_source.h"
#include "nmea_gga.h"
#include "common/sleeper.h"

#include <memory>
#include <optional>

namespace kermit {

/**
 * Source of position fixes for the acquisition loop.
 */
class PositionSource {
public:
    virtual ~PositionSource() = default;

    /**
     * Next decoded fix from the feed, validated or not.
     * nullopt when the feed yields no GGA fix this time.
     */
    virtual std::optional<PositionFix> next_fix() = 0;
};

class GpsReceiver : public PositionSource {
public:
    explicit GpsReceiver(std::unique_ptr<LineSource> lines,
                         int max_lines = GPS_MAX_LINES_PER_FIX)
        : lines_(std::move(lines)), max_lines_(max_lines) {}

    /**
     * Read lines until one GGA sentence decodes. Non-GGA and malformed
     * lines are skipped; a "no fix" GGA ends the search with nullopt.
     */
    std::optional<PositionFix> next_fix() override;

    /**
     * Poll about once per second until a fix passes is_valid_fix().
     * The wait ends timeout_s seconds after it starts by the given clock,
     * however long each read blocks. GPS_TIMEOUT when no fix passes or
     * when keep_going turns false.
     */
    api::Result<PositionFix> wait_for_valid_fix(int timeout_s,
                                                const Sleeper& sleep,
                                                const MonotonicClock& now,
                                                const KeepGoing& keep_going = KeepGoing());

    size_t lines_skipped() const { return lines_skipped_; }
    std::string describe() const { return lines_ ? lines_->describe() : std::string("none"); }

private:
    std::unique_ptr<LineSource> lines_;
    int max_lines_;
    size_t lines_skipped_ = 0;
};

} // namespace kermit

#endif
