#ifndef KERMIT_CONSTANTS_H
#define KERMIT_CONSTANTS_H

#include <cmath>

namespace kermit {

constexpr double PI = 3.14159265358979323846;

// Spectrum floor applied to zero-magnitude bins before the logarithm
constexpr double SPECTRUM_FLOOR_DB = -200.0;

// dB reference for the magnitude spectrum (full scale = 1.0)
constexpr double SPECTRUM_REFERENCE = 1.0;

// Fix acceptance (HDOP above this is untrustworthy)
constexpr double MAX_FIX_HDOP = 20.0;
constexpr int MIN_FIX_SATELLITES = 3;

// GGA sentences carry at least this many comma-separated fields
constexpr int GGA_MIN_FIELDS = 10;

// Lines read per fix request before giving up for this tick
constexpr int GPS_MAX_LINES_PER_FIX = 64;

// Serial read_line gives up after this much silence
constexpr int SERIAL_LINE_TIMEOUT_MS = 2000;

// Heatmap rendering
constexpr int HEATMAP_RADIUS = 8;
constexpr int HEATMAP_ZOOM = 10;

} // namespace kermit

#endif
