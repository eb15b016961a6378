// src/common/log.cpp
#include "log.h"

#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace kermit {
namespace log {

static std::atomic<int> g_level{static_cast<int>(Level::INFO)};
static std::mutex g_write_mutex;

void set_level(Level l) {
    g_level.store(static_cast<int>(l));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return std::string(buf);
}

void write(Level l, const char* tag, const std::string& message) {
    if (!enabled(l)) return;

    std::ostringstream line;
    line << "[" << utc_timestamp() << "] [" << tag << "] ";
    if (l == Level::WARN) line << "WARNING: ";
    if (l == Level::ERROR) line << "ERROR: ";
    line << message << "\n";

    std::lock_guard<std::mutex> lock(g_write_mutex);
    if (l >= Level::WARN) {
        std::cerr << line.str() << std::flush;
    } else {
        std::cout << line.str() << std::flush;
    }
}

} // namespace log
} // namespace kermit
