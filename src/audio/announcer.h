/**
 * @file announcer.h
 * @brief Fire-and-forget spoken announcements of the S-unit label
 */

#ifndef KERMIT_ANNOUNCER_H
#define KERMIT_ANNOUNCER_H

#include <memory>
#include <string>

namespace kermit {

/**
 * Narrow speech capability: text in, nothing out.
 * speak() never blocks on playback and never reports failure.
 */
class Announcer {
public:
    virtual ~Announcer() = default;
    virtual void speak(const std::string& text) = 0;
};

/// Discards everything (no speech backend, or announcements disabled)
class NullAnnouncer : public Announcer {
public:
    void speak(const std::string&) override {}
};

/**
 * Runs an external text-to-speech program with the text as its last
 * argument, e.g. {"say"} on macOS or {"espeak"} on Linux.
 */
class SpeechAnnouncer : public Announcer {
public:
    explicit SpeechAnnouncer(const std::string& program) : program_(program) {}

    void speak(const std::string& text) override;

    const std::string& program() const { return program_; }

private:
    std::string program_;
    bool reported_failure_ = false;
};

/// Speech program for this platform, or a NullAnnouncer if there is none
std::unique_ptr<Announcer> make_platform_announcer();

} // namespace kermit

#endif
