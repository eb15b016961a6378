// src/audio/announcer.cpp
#include "announcer.h"
#include "common/log.h"
#include "common/spawn.h"

namespace kermit {

void SpeechAnnouncer::speak(const std::string& text) {
    if (spawn_detached({program_, text})) {
        log::debug("SPEAK", text);
        return;
    }
    // Logged once; the loop carries on without speech
    if (!reported_failure_) {
        log::debug("SPEAK", "Could not run " + program_ + "; announcements are silent");
        reported_failure_ = true;
    }
}

std::unique_ptr<Announcer> make_platform_announcer() {
#if defined(__APPLE__)
    return std::make_unique<SpeechAnnouncer>("say");
#elif defined(__linux__)
    return std::make_unique<SpeechAnnouncer>("espeak");
#else
    log::debug("SPEAK", "No speech program on this platform");
    return std::make_unique<NullAnnouncer>();
#endif
}

} // namespace kermit
