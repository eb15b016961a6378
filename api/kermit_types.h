// Copyright (C) 2025 Phoenix Nest LLC
// Phoenix Nest KERMIT - RF Background Survey
// Licensed under Phoenix Nest EULA - see phoenixnestmodem_eula.md
/**
 * @file kermit_types.h
 * @brief Core types for the KERMIT survey API
 *
 * Provides Result<T> pattern for error handling, error codes,
 * and the record types shared by the survey pipeline.
 */

#ifndef KERMIT_API_KERMIT_TYPES_H
#define KERMIT_API_KERMIT_TYPES_H

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

namespace kermit {
namespace api {

// ============================================================
// Error Handling
// ============================================================

/**
 * Error codes for survey operations
 */
enum class ErrorCode {
    // Success (not typically used with Result pattern)
    OK = 0,

    // Configuration errors (100-199)
    INVALID_CONFIG = 100,
    INVALID_SAMPLE_RATE = 101,
    INVALID_FREQUENCY = 102,
    INVALID_SCALE = 103,
    SOURCE_NOT_IMPLEMENTED = 104,

    // Signal processing errors (200-299)
    EMPTY_SAMPLE_BLOCK = 200,
    WINDOW_LENGTH_MISMATCH = 201,

    // Positioning errors (300-399)
    NMEA_NOT_GGA = 300,
    NMEA_FIELD_COUNT = 301,
    NMEA_PARSE_ERROR = 302,
    NMEA_CHECKSUM = 303,
    GPS_TIMEOUT = 304,
    SERIAL_OPEN_FAILED = 305,
    SERIAL_READ_FAILED = 306,

    // I/O errors (400-499)
    FILE_NOT_FOUND = 400,
    FILE_READ_ERROR = 401,
    FILE_WRITE_ERROR = 402,
    INVALID_FILE_FORMAT = 403,
    DESTINATION_EXISTS = 404,

    // Hardware and internal errors (500-599)
    DEVICE_OPEN_FAILED = 500,
    DEVICE_READ_FAILED = 501,
    INTERNAL_ERROR = 502,
};

/**
 * Error information with code and message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, const std::string& msg = "")
        : code(c), message(msg) {
        if (message.empty()) {
            message = default_message(c);
        }
    }

    static std::string default_message(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "Success";
            case ErrorCode::INVALID_CONFIG: return "Invalid configuration";
            case ErrorCode::INVALID_SAMPLE_RATE: return "Invalid sample rate";
            case ErrorCode::INVALID_FREQUENCY: return "Invalid frequency";
            case ErrorCode::INVALID_SCALE: return "Invalid interval scale";
            case ErrorCode::SOURCE_NOT_IMPLEMENTED: return "Signal source not implemented";
            case ErrorCode::EMPTY_SAMPLE_BLOCK: return "Sample block is empty";
            case ErrorCode::WINDOW_LENGTH_MISMATCH: return "Window length does not match sample block";
            case ErrorCode::NMEA_NOT_GGA: return "Not a GGA sentence";
            case ErrorCode::NMEA_FIELD_COUNT: return "Unexpected NMEA field count";
            case ErrorCode::NMEA_PARSE_ERROR: return "Malformed NMEA field";
            case ErrorCode::NMEA_CHECKSUM: return "NMEA checksum mismatch";
            case ErrorCode::GPS_TIMEOUT: return "Timed out waiting for a valid GPS fix";
            case ErrorCode::SERIAL_OPEN_FAILED: return "Serial port open failed";
            case ErrorCode::SERIAL_READ_FAILED: return "Serial port read failed";
            case ErrorCode::FILE_NOT_FOUND: return "File not found";
            case ErrorCode::FILE_READ_ERROR: return "File read error";
            case ErrorCode::FILE_WRITE_ERROR: return "File write error";
            case ErrorCode::INVALID_FILE_FORMAT: return "Invalid file format";
            case ErrorCode::DESTINATION_EXISTS: return "Output destination already exists";
            case ErrorCode::DEVICE_OPEN_FAILED: return "Device open failed";
            case ErrorCode::DEVICE_READ_FAILED: return "Device read failed";
            case ErrorCode::INTERNAL_ERROR: return "Internal error";
            default: return "Unknown error";
        }
    }

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
};

/**
 * Result type for operations that can fail
 *
 * Usage:
 *   Result<PositionFix> result = decode_gga(line);
 *   if (result.ok()) {
 *       auto fix = result.value();
 *   } else {
 *       std::cerr << result.error().message << std::endl;
 *   }
 */
template<typename T>
class Result {
public:
    // Construct success result
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct error result
    Result(const Error& error) : data_(error) {}
    Result(ErrorCode code, const std::string& msg = "")
        : data_(Error(code, msg)) {}

    // Check status
    bool ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (call only if ok())
    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    // Access value with default
    T value_or(const T& default_value) const {
        return ok() ? value() : default_value;
    }

    // Access error (call only if is_error())
    const Error& error() const { return std::get<Error>(data_); }

    // Convenience accessors
    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }
    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

private:
    std::variant<T, Error> data_;
};

/**
 * Result type for void operations
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(const Error& error) : error_(error) {}
    Result(ErrorCode code, const std::string& msg = "")
        : error_(Error(code, msg)) {}

    bool ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_.value(); }

private:
    std::optional<Error> error_;
};

// ============================================================
// Survey Records
// ============================================================

/**
 * A geographic position in decimal degrees plus elevation (meters)
 */
struct GeoPosition {
    double latitude = 0.0;
    double longitude = 0.0;
    double elevation = 0.0;
};

/**
 * One row of survey output.
 *
 * position is absent when no accepted fix was available; it is never
 * filled from an unvalidated fix.
 */
struct SurveyRecord {
    std::string timestamp;          // Host UTC time, ISO-8601
    double level_db = 0.0;          // Calibrated level
    std::string label;              // S-unit classification
    std::optional<GeoPosition> position;
};

using SurveyRecords = std::vector<SurveyRecord>;

} // namespace api
} // namespace kermit

#endif // KERMIT_API_KERMIT_TYPES_H
