/**
 * @file acquisition_loop.h
 * @brief The survey tick: sample, classify, position, emit, announce, sleep
 *
 * One tick runs to completion before the next one starts. Every
 * collaborator is injected so a tick can be driven by fakes:
 *
 *   SampleSource    one block per tick (hardware)
 *   PositionSource  optional; nullptr disables positioning
 *   RecordSink      receives one record per tick
 *   Announcer       speaks the label every announce_every ticks
 *   Sleeper         waits sample_interval_s after each tick
 *
 * Phase order within a tick:
 *
 *   SAMPLING -> CLASSIFYING -> [POSITIONING] -> EMITTING
 *            -> [ANNOUNCING] -> SLEEPING -> SAMPLING ...
 *
 * A fix that fails validation is not an error: the record carries the
 * last accepted position instead, or no position before the first one.
 */

#ifndef KERMIT_ACQUISITION_LOOP_H
#define KERMIT_ACQUISITION_LOOP_H

#include "api/sample_source.h"
#include "api/survey_config.h"
#include "audio/announcer.h"
#include "classify/interval_scale.h"
#include "common/sleeper.h"
#include "dsp/signal_level.h"
#include "gps/gps_receiver.h"
#include "io/record_sink.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

namespace kermit {

enum class TickPhase {
    IDLE,
    SOURCE_CONFIGURED,
    SAMPLING,
    CLASSIFYING,
    POSITIONING,
    EMITTING,
    ANNOUNCING,
    SLEEPING,
};

const char* tick_phase_name(TickPhase phase);

/**
 * Transition function of the loop.
 *
 * @param positioning   a PositionSource is attached
 * @param announce_due  the cadence counter reached announce_every this tick
 */
TickPhase next_phase(TickPhase current, bool positioning, bool announce_due);

/// Host clock for record timestamps
using TimestampFn = std::function<std::string()>;

class AcquisitionLoop {
public:
    AcquisitionLoop(const api::SurveyConfig& config,
                    const IntervalScale& scale,
                    SampleSource& source,
                    PositionSource* positions,
                    RecordSink& sink,
                    Announcer& announcer,
                    Sleeper sleep = real_sleeper(),
                    TimestampFn clock = TimestampFn());

    /**
     * Run one tick from SAMPLING through SLEEPING.
     * Source and sink failures end the tick with their error.
     */
    api::Result<api::SurveyRecord> run_tick();

    /**
     * Tick until running goes false, max_ticks is reached (if non-zero)
     * or a tick fails.
     */
    api::Result<void> run(const std::atomic<bool>& running);

    TickPhase phase() const { return phase_; }
    uint32_t tick_count() const { return tick_count_; }
    int announce_counter() const { return announce_counter_; }
    WindowPolicy window_policy() const { return extractor_.window_policy(); }
    const std::optional<api::GeoPosition>& last_position() const { return last_position_; }

    /// Fixes read that failed validation
    size_t rejected_fixes() const { return rejected_fixes_; }

    void set_tick_count(uint32_t n) { tick_count_ = n; }

    /**
     * Start from a fix read before the loop (the GPS warm-up fix), so the
     * first record is positioned. Ignored unless it passes is_valid_fix().
     */
    bool seed_position(const PositionFix& fix);

private:
    void enter(TickPhase next);
    void update_position();

    const api::SurveyConfig& config_;
    const IntervalScale& scale_;
    SampleSource& source_;
    PositionSource* positions_;
    RecordSink& sink_;
    Announcer& announcer_;
    Sleeper sleep_;
    TimestampFn clock_;

    SignalLevelExtractor extractor_;
    std::vector<complex_t> block_;

    TickPhase phase_ = TickPhase::IDLE;
    uint32_t tick_count_ = 0;
    int announce_counter_ = 0;
    std::optional<api::GeoPosition> last_position_;
    size_t rejected_fixes_ = 0;
};

} // namespace kermit

#endif
