// Copyright (C) 2025 Phoenix Nest LLC
// Phoenix Nest KERMIT - RF Background Survey
// Licensed under Phoenix Nest EULA - see phoenixnestmodem_eula.md
/**
 * @file test_nmea_gga.cpp
 * @brief Tests for the GGA decoder and fix validation
 */

#include "gps/nmea_gga.h"
#include "gps/position_fix.h"

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

using namespace kermit;

// Test counters
static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    printf("  %-50s ", #name); \
    fflush(stdout); \
    try { \
        test_##name(); \
        printf("PASS\n"); \
        tests_passed++; \
    } catch (const std::exception& e) { \
        printf("FAIL: %s\n", e.what()); \
        tests_failed++; \
    } catch (...) { \
        printf("FAIL: unknown exception\n"); \
        tests_failed++; \
    } \
} while(0)

#define ASSERT(cond) do { \
    if (!(cond)) { \
        throw std::runtime_error("Assertion failed: " #cond); \
    } \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        char buf[256]; \
        snprintf(buf, sizeof(buf), "Expected %s == %s", #a, #b); \
        throw std::runtime_error(buf); \
    } \
} while(0)

#define ASSERT_NEAR(a, b, tol) do { \
    if (std::fabs((a) - (b)) > (tol)) { \
        char buf[256]; \
        snprintf(buf, sizeof(buf), "Expected %s ~= %s (got %g vs %g)", #a, #b, \
                 static_cast<double>(a), static_cast<double>(b)); \
        throw std::runtime_error(buf); \
    } \
} while(0)

static const char* EXAMPLE_GGA =
    "$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*47";

static PositionFix decode_ok(const std::string& line) {
    auto r = decode_gga(line);
    if (!r.ok()) throw std::runtime_error("decode failed: " + r.error().message);
    if (!r.value()) throw std::runtime_error("decode returned no fix");
    return *r.value();
}

// Degrees as DDMM.MMMM / DDDMM.MMMMM with hemisphere letter
static std::string nmea_coord(double value, int degree_digits, char pos, char neg,
                              std::string& hemisphere) {
    hemisphere = std::string(1, value < 0 ? neg : pos);
    double a = std::fabs(value);
    int deg = static_cast<int>(a);
    double minutes = (a - deg) * 60.0;
    char buf[32];
    snprintf(buf, sizeof(buf), "%0*d%0*.*f", degree_digits, deg,
             degree_digits == 2 ? 7 : 8, degree_digits == 2 ? 4 : 5, minutes);
    return buf;
}

static std::string make_gga(double lat, double lon, int quality, int sats, double hdop) {
    std::string lat_h, lon_h;
    std::string lat_s = nmea_coord(lat, 2, 'N', 'S', lat_h);
    std::string lon_s = nmea_coord(lon, 3, 'E', 'W', lon_h);
    char body[160];
    snprintf(body, sizeof(body), "GPGGA,101500,%s,%s,%s,%s,%d,%02d,%.1f,12.0,M,0.0,M,,",
             lat_s.c_str(), lat_h.c_str(), lon_s.c_str(), lon_h.c_str(), quality, sats, hdop);
    char sum[4];
    snprintf(sum, sizeof(sum), "%02X", nmea_checksum(body));
    return std::string("$") + body + "*" + sum;
}

//=============================================================================
// Decoding
//=============================================================================

TEST(reference_sentence) {
    PositionFix fix = decode_ok(EXAMPLE_GGA);
    ASSERT_NEAR(fix.latitude, 48.1173, 1e-4);
    ASSERT_NEAR(fix.longitude, 11.5167, 1e-4);
    ASSERT(fix.quality == FixQuality::GPS_SPS);
    ASSERT_EQ(fix.satellites, 8);
    ASSERT_NEAR(fix.altitude, 545.4, 1e-9);
    ASSERT_NEAR(fix.hdop, 0.9, 1e-9);
    ASSERT_EQ(fix.timestamp, "123519");
    ASSERT(is_valid_fix(fix));
}

TEST(trailing_crlf_ignored) {
    PositionFix fix = decode_ok(std::string(EXAMPLE_GGA) + "\r\n");
    ASSERT_EQ(fix.satellites, 8);
}

TEST(gngga_accepted) {
    std::string body = "GNGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,";
    char sum[4];
    snprintf(sum, sizeof(sum), "%02X", nmea_checksum(body));
    PositionFix fix = decode_ok("$" + body + "*" + sum);
    ASSERT_NEAR(fix.latitude, 48.1173, 1e-4);
}

TEST(southern_western_negated) {
    PositionFix fix = decode_ok(
        "$GPGGA,000001,3351.5000,S,15112.6000,W,1,05,1.2,10.0,M,0.0,M,,");
    ASSERT_NEAR(fix.latitude, -(33 + 51.5 / 60.0), 1e-9);
    ASSERT_NEAR(fix.longitude, -(151 + 12.6 / 60.0), 1e-9);
}

TEST(round_trip_coordinates) {
    const double coords[][2] = {
        {48.1173, 11.5167},
        {-33.8688, 151.2093},
        {40.7128, -74.0060},
        {-0.5, -0.25},
        {89.9999, 179.9999},
    };
    for (const auto& c : coords) {
        PositionFix fix = decode_ok(make_gga(c[0], c[1], 1, 7, 1.0));
        ASSERT_NEAR(fix.latitude, c[0], 1e-4);
        ASSERT_NEAR(fix.longitude, c[1], 1e-4);
    }
}

TEST(no_fix_quality_zero) {
    auto r = decode_gga("$GPGGA,123519,,,,,0,00,,,M,,M,,");
    ASSERT(r.ok());
    ASSERT(!r.value().has_value());
}

TEST(not_gga) {
    auto r = decode_gga("$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6A");
    ASSERT(!r.ok());
    ASSERT(r.error() == api::ErrorCode::NMEA_NOT_GGA);
    ASSERT(!is_gga_sentence("garbage"));
    ASSERT(is_gga_sentence(EXAMPLE_GGA));
}

TEST(short_sentence_fails_explicitly) {
    auto r = decode_gga("$GPGGA,123519,4807.038,N");
    ASSERT(!r.ok());
    ASSERT(r.error() == api::ErrorCode::NMEA_FIELD_COUNT);
}

TEST(checksum_mismatch) {
    auto r = decode_gga("$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*48");
    ASSERT(!r.ok());
    ASSERT(r.error() == api::ErrorCode::NMEA_CHECKSUM);
}

TEST(non_numeric_fields) {
    auto sats = decode_gga("$GPGGA,123519,4807.038,N,01131.000,E,1,xx,0.9,545.4,M,46.9,M,,");
    ASSERT(!sats.ok());
    ASSERT(sats.error() == api::ErrorCode::NMEA_PARSE_ERROR);

    auto lat = decode_gga("$GPGGA,123519,48O7.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,");
    ASSERT(!lat.ok());
    ASSERT(lat.error() == api::ErrorCode::NMEA_PARSE_ERROR);

    auto quality = decode_gga("$GPGGA,123519,4807.038,N,01131.000,E,Q,08,0.9,545.4,M,46.9,M,,");
    ASSERT(!quality.ok());
    ASSERT(quality.error() == api::ErrorCode::NMEA_PARSE_ERROR);
}

TEST(non_finite_fields) {
    auto lat = decode_gga("$GPGGA,123519,48nan,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,");
    ASSERT(!lat.ok());
    ASSERT(lat.error() == api::ErrorCode::NMEA_PARSE_ERROR);

    auto lon = decode_gga("$GPGGA,123519,4807.038,N,011inf,E,1,08,0.9,545.4,M,46.9,M,,");
    ASSERT(!lon.ok());
    ASSERT(lon.error() == api::ErrorCode::NMEA_PARSE_ERROR);

    auto alt = decode_gga("$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,inf,M,46.9,M,,");
    ASSERT(!alt.ok());
    ASSERT(alt.error() == api::ErrorCode::NMEA_PARSE_ERROR);

    auto hdop = decode_gga("$GPGGA,123519,4807.038,N,01131.000,E,1,08,nan,545.4,M,46.9,M,,");
    ASSERT(!hdop.ok());
    ASSERT(hdop.error() == api::ErrorCode::NMEA_PARSE_ERROR);
}

TEST(coordinates_out_of_range) {
    auto lat = decode_gga("$GPGGA,123519,9530.000,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,");
    ASSERT(!lat.ok());
    ASSERT(lat.error() == api::ErrorCode::NMEA_PARSE_ERROR);

    auto lon = decode_gga("$GPGGA,123519,4807.038,N,18130.000,W,1,08,0.9,545.4,M,46.9,M,,");
    ASSERT(!lon.ok());
    ASSERT(lon.error() == api::ErrorCode::NMEA_PARSE_ERROR);

    PositionFix pole = decode_ok("$GPGGA,123519,9000.000,S,18000.000,W,1,08,0.9,2.0,M,46.9,M,,");
    ASSERT_NEAR(pole.latitude, -90.0, 1e-9);
    ASSERT_NEAR(pole.longitude, -180.0, 1e-9);
}

TEST(bad_hemisphere) {
    auto r = decode_gga("$GPGGA,123519,4807.038,X,01131.000,E,1,08,0.9,545.4,M,46.9,M,,");
    ASSERT(!r.ok());
    ASSERT(r.error() == api::ErrorCode::NMEA_PARSE_ERROR);
}

TEST(nmea_to_decimal_prefixes) {
    auto lat = nmea_to_decimal("4807.038", 2, "N");
    ASSERT(lat.ok());
    ASSERT_NEAR(lat.value(), 48.0 + 7.038 / 60.0, 1e-12);

    auto lon = nmea_to_decimal("01131.000", 3, "W");
    ASSERT(lon.ok());
    ASSERT_NEAR(lon.value(), -(11.0 + 31.0 / 60.0), 1e-12);

    ASSERT(!nmea_to_decimal("48", 2, "N").ok());
    ASSERT(!nmea_to_decimal("4875.000", 2, "N").ok());
}

//=============================================================================
// Fix validation
//=============================================================================

static PositionFix good_fix() {
    PositionFix fix;
    fix.quality = FixQuality::GPS_SPS;
    fix.satellites = 8;
    fix.hdop = 0.9;
    return fix;
}

TEST(two_satellites_rejected) {
    PositionFix fix = good_fix();
    fix.satellites = 2;
    ASSERT(!is_valid_fix(fix));
}

TEST(hdop_twenty_rejected) {
    PositionFix fix = good_fix();
    fix.hdop = 20.0;
    ASSERT(!is_valid_fix(fix));
}

TEST(minimum_acceptable_fix) {
    PositionFix fix = good_fix();
    fix.hdop = 19.99;
    fix.satellites = 3;
    ASSERT(is_valid_fix(fix));
}

TEST(invalid_quality_rejected) {
    PositionFix fix = good_fix();
    fix.quality = FixQuality::INVALID;
    ASSERT(!is_valid_fix(fix));
}

TEST(validation_leaves_fix_untouched) {
    PositionFix fix = good_fix();
    fix.latitude = 1.5;
    fix.hdop = 25.0;
    ASSERT(!is_valid_fix(fix));
    ASSERT_EQ(fix.latitude, 1.5);
    ASSERT_EQ(fix.hdop, 25.0);
}

int main() {
    printf("\n=== NMEA GGA Tests ===\n\n");

    RUN_TEST(reference_sentence);
    RUN_TEST(trailing_crlf_ignored);
    RUN_TEST(gngga_accepted);
    RUN_TEST(southern_western_negated);
    RUN_TEST(round_trip_coordinates);
    RUN_TEST(no_fix_quality_zero);
    RUN_TEST(not_gga);
    RUN_TEST(short_sentence_fails_explicitly);
    RUN_TEST(checksum_mismatch);
    RUN_TEST(non_numeric_fields);
    RUN_TEST(non_finite_fields);
    RUN_TEST(coordinates_out_of_range);
    RUN_TEST(bad_hemisphere);
    RUN_TEST(nmea_to_decimal_prefixes);
    RUN_TEST(two_satellites_rejected);
    RUN_TEST(hdop_twenty_rejected);
    RUN_TEST(minimum_acceptable_fix);
    RUN_TEST(invalid_quality_rejected);
    RUN_TEST(validation_leaves_fix_untouched);

    printf("\n--- Results: %d passed, %d failed ---\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
