// src/survey/acquisition_loop.cpp
#include "acquisition_loop.h"
#include "common/log.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace kermit {

using api::Result;
using api::SurveyRecord;

const char* tick_phase_name(TickPhase phase) {
    switch (phase) {
        case TickPhase::IDLE: return "IDLE";
        case TickPhase::SOURCE_CONFIGURED: return "SOURCE_CONFIGURED";
        case TickPhase::SAMPLING: return "SAMPLING";
        case TickPhase::CLASSIFYING: return "CLASSIFYING";
        case TickPhase::POSITIONING: return "POSITIONING";
        case TickPhase::EMITTING: return "EMITTING";
        case TickPhase::ANNOUNCING: return "ANNOUNCING";
        case TickPhase::SLEEPING: return "SLEEPING";
        default: return "UNKNOWN";
    }
}

TickPhase next_phase(TickPhase current, bool positioning, bool announce_due) {
    switch (current) {
        case TickPhase::IDLE: return TickPhase::SOURCE_CONFIGURED;
        case TickPhase::SOURCE_CONFIGURED: return TickPhase::SAMPLING;
        case TickPhase::SAMPLING: return TickPhase::CLASSIFYING;
        case TickPhase::CLASSIFYING:
            return positioning ? TickPhase::POSITIONING : TickPhase::EMITTING;
        case TickPhase::POSITIONING: return TickPhase::EMITTING;
        case TickPhase::EMITTING:
            return announce_due ? TickPhase::ANNOUNCING : TickPhase::SLEEPING;
        case TickPhase::ANNOUNCING: return TickPhase::SLEEPING;
        case TickPhase::SLEEPING: return TickPhase::SAMPLING;
    }
    return TickPhase::IDLE;
}

AcquisitionLoop::AcquisitionLoop(const api::SurveyConfig& config,
                                 const IntervalScale& scale,
                                 SampleSource& source,
                                 PositionSource* positions,
                                 RecordSink& sink,
                                 Announcer& announcer,
                                 Sleeper sleep,
                                 TimestampFn clock)
    : config_(config)
    , scale_(scale)
    , source_(source)
    , positions_(positions)
    , sink_(sink)
    , announcer_(announcer)
    , sleep_(std::move(sleep))
    , clock_(clock ? std::move(clock) : TimestampFn(log::utc_timestamp))
    , extractor_(config.spectrum_window == api::SpectrumWindow::HANN
                     ? WindowPolicy::HANN : WindowPolicy::RECTANGULAR) {
    enter(TickPhase::SOURCE_CONFIGURED);
}

void AcquisitionLoop::enter(TickPhase next) {
    log::debug("SURVEY", std::string(tick_phase_name(phase_)) + " -> " + tick_phase_name(next));
    phase_ = next;
}

void AcquisitionLoop::update_position() {
    std::optional<PositionFix> fix = positions_->next_fix();
    if (!fix) {
        log::debug("GPS", "No fix this tick");
        return;
    }
    if (!is_valid_fix(*fix)) {
        rejected_fixes_++;
        log::debug("GPS", "Rejected " + describe_fix(*fix));
        return;
    }
    last_position_ = fix->position();
}

bool AcquisitionLoop::seed_position(const PositionFix& fix) {
    if (!is_valid_fix(fix)) return false;
    last_position_ = fix.position();
    return true;
}

Result<SurveyRecord> AcquisitionLoop::run_tick() {
    const bool positioning = positions_ != nullptr;
    if (phase_ != TickPhase::SAMPLING) {
        enter(TickPhase::SAMPLING);
    }

    // SAMPLING
    auto read = source_.read_block(block_, static_cast<size_t>(config_.block_size));
    if (!read.ok()) {
        log::error("SDR", read.error().message);
        return read.error();
    }
    enter(next_phase(phase_, positioning, false));

    // CLASSIFYING
    auto reading = extractor_.extract(block_, source_.sample_rate(), config_.antenna_offset_db);
    if (!reading.ok()) {
        return reading.error();
    }
    SurveyRecord record;
    record.timestamp = clock_();
    record.level_db = reading->level_db;
    record.label = scale_.classify(record.level_db);
    enter(next_phase(phase_, positioning, false));

    // POSITIONING
    if (phase_ == TickPhase::POSITIONING) {
        update_position();
        enter(next_phase(phase_, positioning, false));
    }
    record.position = last_position_;

    // EMITTING
    auto appended = sink_.append(record);
    if (!appended.ok()) {
        log::error("CSV", appended.error().message);
        return appended.error();
    }

    std::ostringstream line;
    line << std::fixed << std::setprecision(2) << record.level_db << " dB " << record.label;
    if (record.position) {
        line << std::setprecision(6) << " @ " << record.position->latitude << ", "
             << record.position->longitude;
    }
    if (reading->floor_clamped) line << " (floor)";
    log::info("SURVEY", line.str());

    bool announce_due = false;
    if (config_.announce) {
        announce_counter_++;
        announce_due = announce_counter_ >= config_.announce_every;
    }
    enter(next_phase(phase_, positioning, announce_due));

    // ANNOUNCING
    if (phase_ == TickPhase::ANNOUNCING) {
        announcer_.speak(record.label);
        announce_counter_ = 0;
        enter(next_phase(phase_, positioning, announce_due));
    }

    // SLEEPING
    auto interval = std::chrono::milliseconds(
        static_cast<long long>(std::llround(config_.sample_interval_s * 1000.0)));
    sleep_(interval);
    tick_count_++;  // wraps at 2^32
    enter(next_phase(phase_, positioning, false));

    return record;
}

Result<void> AcquisitionLoop::run(const std::atomic<bool>& running) {
    log::info("SURVEY", std::string("Sampling from ") + source_.source_type() + " on scale " +
              scale_.name() + (positions_ ? "" : " without positioning"));

    uint32_t ticks_this_run = 0;
    while (running.load()) {
        if (config_.max_ticks > 0 && ticks_this_run >= static_cast<uint32_t>(config_.max_ticks)) {
            break;
        }
        auto tick = run_tick();
        if (!tick.ok()) {
            // A read interrupted by the stop signal is a normal stop
            if (!running.load()) break;
            return tick.error();
        }
        ticks_this_run++;
    }

    log::info("SURVEY", "Stopped after " + std::to_string(ticks_this_run) + " ticks");
    return Result<void>();
}

} // namespace kermit
