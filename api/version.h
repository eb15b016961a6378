/**
 * @file version.h
 * @brief KERMIT version information
 */

#ifndef KERMIT_API_VERSION_H
#define KERMIT_API_VERSION_H

#include <string>

#define KERMIT_VERSION_MAJOR 0
#define KERMIT_VERSION_MINOR 3
#define KERMIT_VERSION_PATCH 0
#define KERMIT_VERSION_STRING "0.3.0"

namespace kermit {

namespace api {

inline const char* version() { return KERMIT_VERSION_STRING; }

} // namespace api

inline std::string version_header() {
    return std::string("KERMIT v") + KERMIT_VERSION_STRING +
           " - Kinetic Environmental RF Mapping Tool";
}

inline std::string build_info() {
    return std::string("Built ") + __DATE__ + " " + __TIME__;
}

inline std::string copyright_notice() {
    return "Copyright (C) 2025 Phoenix Nest LLC";
}

} // namespace kermit

#endif // KERMIT_API_VERSION_H
