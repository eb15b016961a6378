// src/gps/nmea_gga.cpp
#include "nmea_gga.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace kermit {

using api::Error;
using api::ErrorCode;
using api::Result;

namespace {

// Field positions in a GGA sentence
constexpr int F_TIME = 1;
constexpr int F_LAT = 2;
constexpr int F_LAT_HEMI = 3;
constexpr int F_LON = 4;
constexpr int F_LON_HEMI = 5;
constexpr int F_QUALITY = 6;
constexpr int F_SATS = 7;
constexpr int F_HDOP = 8;
constexpr int F_ALT = 9;

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end != begin + text.size() || errno == ERANGE) return false;
    // strtod also takes "nan" and "inf"
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parse_int(const std::string& text, int& out) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(begin, &end, 10);
    if (end != begin + text.size() || errno == ERANGE) return false;
    if (v < 0 || v > 1000000) return false;
    out = static_cast<int>(v);
    return true;
}

Error field_error(int index, const std::string& name, const std::string& text) {
    return Error(ErrorCode::NMEA_PARSE_ERROR,
                 "GGA field " + std::to_string(index) + " (" + name +
                 ") is not numeric: '" + text + "'");
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

std::vector<std::string> split_fields(const std::string& line, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : line) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

unsigned nmea_checksum(const std::string& body) {
    unsigned sum = 0;
    for (char c : body) {
        sum ^= static_cast<unsigned char>(c);
    }
    return sum;
}

bool is_gga_sentence(const std::string& line) {
    size_t start = line.find('$');
    if (start == std::string::npos) return false;
    return line.compare(start, 7, "$GPGGA,") == 0 ||
           line.compare(start, 7, "$GNGGA,") == 0;
}

Result<double> nmea_to_decimal(const std::string& field,
                               int degree_digits,
                               const std::string& hemisphere) {
    if (field.size() <= static_cast<size_t>(degree_digits)) {
        return Error(ErrorCode::NMEA_PARSE_ERROR,
                     "Coordinate '" + field + "' is too short");
    }

    // Degree prefix must be plain digits; the rest is decimal minutes
    for (int i = 0; i < degree_digits; i++) {
        if (field[i] < '0' || field[i] > '9') {
            return Error(ErrorCode::NMEA_PARSE_ERROR,
                         "Coordinate '" + field + "' has a malformed degree prefix");
        }
    }

    double degrees = 0.0;
    double minutes = 0.0;
    if (!parse_double(field.substr(0, degree_digits), degrees) ||
        !parse_double(field.substr(degree_digits), minutes)) {
        return Error(ErrorCode::NMEA_PARSE_ERROR,
                     "Coordinate '" + field + "' is not numeric");
    }
    if (minutes < 0.0 || minutes >= 60.0) {
        return Error(ErrorCode::NMEA_PARSE_ERROR,
                     "Coordinate '" + field + "' has minutes out of range");
    }

    double decimal = degrees + minutes / 60.0;

    if (hemisphere == "S" || hemisphere == "W") {
        decimal = -decimal;
    } else if (hemisphere != "N" && hemisphere != "E") {
        return Error(ErrorCode::NMEA_PARSE_ERROR,
                     "Unknown hemisphere '" + hemisphere + "'");
    }
    return decimal;
}

Result<GgaDecode> decode_gga(const std::string& raw) {
    // Strip line terminators
    std::string line = raw;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' ')) {
        line.pop_back();
    }

    if (!is_gga_sentence(line)) {
        return Error(ErrorCode::NMEA_NOT_GGA);
    }
    line = line.substr(line.find('$'));

    // Verify and strip "*hh" when present
    size_t star = line.find('*');
    if (star != std::string::npos) {
        std::string hex = line.substr(star + 1);
        if (hex.size() != 2 || hex_value(hex[0]) < 0 || hex_value(hex[1]) < 0) {
            return Error(ErrorCode::NMEA_CHECKSUM, "Malformed checksum '" + hex + "'");
        }
        unsigned expected = static_cast<unsigned>(hex_value(hex[0]) * 16 + hex_value(hex[1]));
        unsigned actual = nmea_checksum(line.substr(1, star - 1));
        if (expected != actual) {
            std::ostringstream msg;
            msg << "Checksum " << hex << " does not match computed "
                << std::hex << std::uppercase << actual;
            return Error(ErrorCode::NMEA_CHECKSUM, msg.str());
        }
        line = line.substr(0, star);
    }

    auto f = split_fields(line);
    if (static_cast<int>(f.size()) < GGA_MIN_FIELDS) {
        return Error(ErrorCode::NMEA_FIELD_COUNT,
                     "GGA sentence has " + std::to_string(f.size()) + " fields, need " +
                     std::to_string(GGA_MIN_FIELDS));
    }

    int quality = 0;
    if (!parse_int(f[F_QUALITY], quality)) {
        return field_error(F_QUALITY, "quality", f[F_QUALITY]);
    }
    if (quality > static_cast<int>(FixQuality::SIMULATED)) {
        return Error(ErrorCode::NMEA_PARSE_ERROR,
                     "GGA fix quality " + std::to_string(quality) + " is out of range");
    }
    if (quality == 0) {
        return GgaDecode();
    }

    PositionFix fix;
    fix.timestamp = f[F_TIME];
    fix.quality = static_cast<FixQuality>(quality);

    if (!parse_int(f[F_SATS], fix.satellites)) {
        return field_error(F_SATS, "satellites", f[F_SATS]);
    }
    if (!parse_double(f[F_HDOP], fix.hdop) || fix.hdop < 0.0) {
        return field_error(F_HDOP, "hdop", f[F_HDOP]);
    }
    if (!parse_double(f[F_ALT], fix.altitude)) {
        return field_error(F_ALT, "altitude", f[F_ALT]);
    }

    auto lat = nmea_to_decimal(f[F_LAT], 2, f[F_LAT_HEMI]);
    if (!lat.ok()) return lat.error();
    auto lon = nmea_to_decimal(f[F_LON], 3, f[F_LON_HEMI]);
    if (!lon.ok()) return lon.error();

    if (std::fabs(lat.value()) > 90.0) {
        return Error(ErrorCode::NMEA_PARSE_ERROR,
                     "Latitude '" + f[F_LAT] + "' is beyond 90 degrees");
    }
    if (std::fabs(lon.value()) > 180.0) {
        return Error(ErrorCode::NMEA_PARSE_ERROR,
                     "Longitude '" + f[F_LON] + "' is beyond 180 degrees");
    }

    fix.latitude = lat.value();
    fix.longitude = lon.value();

    return GgaDecode(fix);
}

std::string describe_fix(const PositionFix& fix) {
    std::ostringstream ss;
    ss << "GGA<lat=" << fix.latitude
       << ", lng=" << fix.longitude
       << ", quality=" << fix_quality_name(fix.quality)
       << ", sat_count=" << fix.satellites
       << ", altitude=" << fix.altitude
       << ", hdop=" << fix.hdop
       << ", timestamp=" << fix.timestamp << ">";
    return ss.str();
}

} // namespace kermit
