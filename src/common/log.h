/**
 * @file log.h
 * @brief Tagged console logging
 *
 * Lines look like:
 *   [2025-06-01T14:03:22Z] [GPS] Found GPS device at /dev/ttyUSB0
 *
 * INFO and DEBUG go to stdout, WARN and ERROR to stderr. The threshold is
 * process-wide and set once from the command line.
 */

#ifndef KERMIT_LOG_H
#define KERMIT_LOG_H

#include <atomic>
#include <sstream>
#include <string>

namespace kermit {
namespace log {

enum class Level {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
};

/// Set the minimum level that is printed (default INFO)
void set_level(Level level);
Level level();

inline bool enabled(Level l) { return static_cast<int>(l) >= static_cast<int>(level()); }

/// UTC time formatted as YYYY-MM-DDTHH:MM:SSZ
std::string utc_timestamp();

void write(Level level, const char* tag, const std::string& message);

inline void debug(const char* tag, const std::string& msg) { write(Level::DEBUG, tag, msg); }
inline void info(const char* tag, const std::string& msg) { write(Level::INFO, tag, msg); }
inline void warn(const char* tag, const std::string& msg) { write(Level::WARN, tag, msg); }
inline void error(const char* tag, const std::string& msg) { write(Level::ERROR, tag, msg); }

} // namespace log
} // namespace kermit

#endif
