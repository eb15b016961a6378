/**
 * @file nmea_gga.h
 * @brief GGA sentence decoder
 *
 *   $GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*47
 *          time   lat      NS lon       EW q sats hdop alt
 *
 * The decoder checks the sentence identifier itself ($GPGGA or $GNGGA)
 * and returns NMEA_NOT_GGA for anything else, so callers can hand it
 * every line from the receiver and skip the rejects. A trailing *hh
 * checksum is verified when present.
 *
 * A quality of 0 decodes successfully to "no fix" (empty optional)
 * without looking at the coordinate fields, which receivers leave blank.
 */

#ifndef KERMIT_NMEA_GGA_H
#define KERMIT_NMEA_GGA_H

#include "position_fix.h"

#include <optional>
#include <string>
#include <vector>

namespace kermit {

/// Success with nullopt means the receiver reported no fix
using GgaDecode = std::optional<PositionFix>;

api::Result<GgaDecode> decode_gga(const std::string& line);

/// True if the line carries a GGA sentence identifier
bool is_gga_sentence(const std::string& line);

/**
 * Convert ddmm.mmmm / dddmm.mmmm to decimal degrees.
 *
 * @param field        Numeric field text
 * @param degree_digits 2 for latitude, 3 for longitude
 * @param hemisphere   N/S/E/W; S and W negate
 */
api::Result<double> nmea_to_decimal(const std::string& field,
                                    int degree_digits,
                                    const std::string& hemisphere);

/// XOR of the characters between '$' and '*'
unsigned nmea_checksum(const std::string& body);

std::vector<std::string> split_fields(const std::string& line, char sep = ',');

} // namespace kermit

#endif
