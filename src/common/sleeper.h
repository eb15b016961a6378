// src/common/sleeper.h
#ifndef KERMIT_SLEEPER_H
#define KERMIT_SLEEPER_H

#include <chrono>
#include <functional>
#include <thread>

namespace kermit {

// Injected wherever the code waits, so tests run without wall-clock delays
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper real_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

// Monotonic time since an arbitrary epoch, for deadlines
using MonotonicClock = std::function<std::chrono::milliseconds()>;

inline MonotonicClock real_clock() {
    return []() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch());
    };
}

// Polled by long waits; false asks them to give up early
using KeepGoing = std::function<bool()>;

} // namespace kermit

#endif
