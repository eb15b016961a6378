/**
 * @file position_fix.h
 * @brief One GGA position report and the acceptance rule for it
 */

#ifndef KERMIT_POSITION_FIX_H
#define KERMIT_POSITION_FIX_H

#include "common/constants.h"
#include "api/kermit_types.h"

#include <string>

namespace kermit {

/**
 * GGA fix quality indicator (field 6)
 */
enum class FixQuality {
    INVALID = 0,
    GPS_SPS = 1,
    DGPS = 2,
    PPS = 3,
    RTK_FIXED = 4,
    RTK_FLOAT = 5,
    ESTIMATED = 6,
    MANUAL_INPUT = 7,
    SIMULATED = 8,
};

inline const char* fix_quality_name(FixQuality q) {
    switch (q) {
        case FixQuality::INVALID: return "INVALID";
        case FixQuality::GPS_SPS: return "GPS_SPS";
        case FixQuality::DGPS: return "DGPS";
        case FixQuality::PPS: return "PPS";
        case FixQuality::RTK_FIXED: return "RTK_FIXED";
        case FixQuality::RTK_FLOAT: return "RTK_FLOAT";
        case FixQuality::ESTIMATED: return "ESTIMATED";
        case FixQuality::MANUAL_INPUT: return "MANUAL_INPUT";
        case FixQuality::SIMULATED: return "SIMULATED";
        default: return "UNKNOWN";
    }
}

struct PositionFix {
    std::string timestamp;      // receiver UTC token, e.g. "123519"
    double latitude = 0.0;      // decimal degrees, south negative
    double longitude = 0.0;     // decimal degrees, west negative
    FixQuality quality = FixQuality::INVALID;
    int satellites = 0;
    double hdop = 0.0;          // horizontal dilution of precision
    double altitude = 0.0;      // meters above mean sea level

    api::GeoPosition position() const {
        api::GeoPosition p;
        p.latitude = latitude;
        p.longitude = longitude;
        p.elevation = altitude;
        return p;
    }
};

/**
 * A fix is trustworthy iff quality != INVALID, HDOP < 20 and at least
 * three satellites are in use.
 */
inline bool is_valid_fix(const PositionFix& fix) {
    return fix.quality != FixQuality::INVALID &&
           fix.hdop < MAX_FIX_HDOP &&
           fix.satellites >= MIN_FIX_SATELLITES;
}

std::string describe_fix(const PositionFix& fix);

} // namespace kermit

#endif
