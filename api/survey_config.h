/**
 * @file survey_config.h
 * @brief Configuration structures for the KERMIT survey
 */

#ifndef KERMIT_API_SURVEY_CONFIG_H
#define KERMIT_API_SURVEY_CONFIG_H

#include "kermit_types.h"

#include <cmath>
#include <string>

namespace kermit {
namespace api {

// ============================================================
// Enumerations
// ============================================================

/**
 * Where the signal level is read from
 */
enum class SignalSource {
    RTLSDR,     // USB RTL-SDR dongle
    LINE_IN,    // Radio audio on line-in (AM only) - not implemented
};

/**
 * S-unit scale selection
 */
enum class ScaleSelection {
    AUTO,       // By listening frequency (HF below 30 MHz)
    HF,
    VHF,
};

/**
 * Window applied to each block before the FFT
 */
enum class SpectrumWindow {
    RECTANGULAR,
    HANN,
};

inline std::string source_name(SignalSource s) {
    switch (s) {
        case SignalSource::RTLSDR: return "rtlsdr";
        case SignalSource::LINE_IN: return "line-in";
        default: return "unknown";
    }
}

inline std::string scale_selection_name(ScaleSelection s) {
    switch (s) {
        case ScaleSelection::AUTO: return "auto";
        case ScaleSelection::HF: return "hf";
        case ScaleSelection::VHF: return "vhf";
        default: return "unknown";
    }
}

// ============================================================
// Defaults
// ============================================================

/// 146.52 MHz national simplex calling frequency
constexpr double LISTENING_FREQUENCY_DEFAULT = 146520000.0;
constexpr double SAMPLE_RATE_DEFAULT = 2.048e6;
constexpr double HF_VHF_BOUNDARY_HZ = 30e6;
constexpr double MAX_SAMPLE_INTERVAL_S = 86400.0;

// ============================================================
// Survey Configuration
// ============================================================

/**
 * Complete survey configuration.
 *
 * Built once at startup (defaults, then config file, then command line)
 * and passed by const reference to every component.
 */
struct SurveyConfig {
    // === Radio ===

    /// Frequency to listen on (Hz)
    double listening_frequency_hz = LISTENING_FREQUENCY_DEFAULT;

    /// SDR sample rate (Hz)
    double sample_rate_hz = SAMPLE_RATE_DEFAULT;

    /// Frequency correction (parts per million)
    int freq_correction_ppm = 1;

    /// Manual tuner gain (dB), ignored when auto_gain is set
    double gain_db = 0.0;
    bool auto_gain = false;

    /// Samples per acquisition tick
    int block_size = 1024;

    /// RTL-SDR device index
    int rtlsdr_device_index = 0;

    /// Antenna/system gain correction (dB); positive lowers the reported level
    double antenna_offset_db = 0.0;

    SignalSource signal_source = SignalSource::RTLSDR;

    ScaleSelection scale = ScaleSelection::AUTO;

    SpectrumWindow spectrum_window = SpectrumWindow::RECTANGULAR;

    // === Loop cadence ===

    /// Seconds between ticks
    double sample_interval_s = 1.0;

    /// Speak the S-unit every announce_every ticks
    bool announce = true;
    int announce_every = 5;

    /// Stop after this many ticks (0 = until terminated)
    int max_ticks = 0;

    // === Output ===

    /// Output path without extension; .csv and .html are appended
    std::string output_base = "~/Desktop/rf_mapper";

    /// Pre-confirm overwriting an existing CSV
    bool assume_yes = false;

    bool deduplicate = true;
    double dedup_bin_step_deg = 0.0001;

    bool auto_open_map = true;

    // === Positioning ===

    /// Seconds to wait for a first valid fix before giving up on GPS
    int gps_poll_seconds = 30;

    /// Serial device path; empty selects automatically
    std::string gps_device;
    int gps_baud = 9600;

    std::string csv_path() const { return output_base + ".csv"; }
    std::string map_path() const { return output_base + ".html"; }

    /**
     * Scale actually used for classification
     */
    ScaleSelection effective_scale() const {
        if (scale != ScaleSelection::AUTO) return scale;
        return listening_frequency_hz >= HF_VHF_BOUNDARY_HZ
            ? ScaleSelection::VHF : ScaleSelection::HF;
    }

    /**
     * Validate configuration
     * @return OK if valid, error code otherwise
     */
    Result<void> validate() const {
        if (signal_source == SignalSource::LINE_IN) {
            return Error(ErrorCode::SOURCE_NOT_IMPLEMENTED,
                        "Line-in signal source is not implemented; use rtlsdr");
        }
        if (!(listening_frequency_hz > 0.0) || !std::isfinite(listening_frequency_hz)) {
            return Error(ErrorCode::INVALID_FREQUENCY,
                        "Listening frequency must be positive");
        }
        if (!(sample_rate_hz > 0.0) || !std::isfinite(sample_rate_hz)) {
            return Error(ErrorCode::INVALID_SAMPLE_RATE,
                        "Sample rate must be positive");
        }
        if (!std::isfinite(gain_db)) {
            return Error(ErrorCode::INVALID_CONFIG, "Tuner gain must be a finite number");
        }
        if (!std::isfinite(antenna_offset_db)) {
            return Error(ErrorCode::INVALID_CONFIG, "Antenna offset must be a finite number");
        }
        if (block_size <= 0) {
            return Error(ErrorCode::INVALID_CONFIG, "Block size must be positive");
        }
        if (!(sample_interval_s > 0.0) || !(sample_interval_s <= MAX_SAMPLE_INTERVAL_S)) {
            return Error(ErrorCode::INVALID_CONFIG,
                        "Sample interval must be positive and at most one day");
        }
        if (announce_every < 1) {
            return Error(ErrorCode::INVALID_CONFIG, "Announce cadence must be at least 1");
        }
        if (max_ticks < 0) {
            return Error(ErrorCode::INVALID_CONFIG, "Tick limit must not be negative");
        }
        if (!(dedup_bin_step_deg > 0.0) || !std::isfinite(dedup_bin_step_deg)) {
            return Error(ErrorCode::INVALID_CONFIG, "Deduplication bin step must be positive");
        }
        if (gps_poll_seconds < 0) {
            return Error(ErrorCode::INVALID_CONFIG, "GPS poll timeout must not be negative");
        }
        if (gps_baud <= 0) {
            return Error(ErrorCode::INVALID_CONFIG, "GPS baud rate must be positive");
        }
        if (output_base.empty()) {
            return Error(ErrorCode::INVALID_CONFIG, "Output path must not be empty");
        }
        return Result<void>();
    }

    static SurveyConfig defaults() {
        return SurveyConfig();
    }
};

// ============================================================
// Builder Pattern
// ============================================================

/**
 * Fluent builder for SurveyConfig
 */
class SurveyConfigBuilder {
public:
    SurveyConfigBuilder() = default;
    explicit SurveyConfigBuilder(const SurveyConfig& base) : cfg_(base) {}

    SurveyConfigBuilder& frequency(double hz) { cfg_.listening_frequency_hz = hz; return *this; }
    SurveyConfigBuilder& sample_rate(double hz) { cfg_.sample_rate_hz = hz; return *this; }
    SurveyConfigBuilder& ppm(int p) { cfg_.freq_correction_ppm = p; return *this; }
    SurveyConfigBuilder& gain(double db) { cfg_.gain_db = db; cfg_.auto_gain = false; return *this; }
    SurveyConfigBuilder& auto_gain(bool a = true) { cfg_.auto_gain = a; return *this; }
    SurveyConfigBuilder& block_size(int n) { cfg_.block_size = n; return *this; }
    SurveyConfigBuilder& antenna_offset(double db) { cfg_.antenna_offset_db = db; return *this; }
    SurveyConfigBuilder& source(SignalSource s) { cfg_.signal_source = s; return *this; }
    SurveyConfigBuilder& scale(ScaleSelection s) { cfg_.scale = s; return *this; }
    SurveyConfigBuilder& window(SpectrumWindow w) { cfg_.spectrum_window = w; return *this; }
    SurveyConfigBuilder& interval(double seconds) { cfg_.sample_interval_s = seconds; return *this; }
    SurveyConfigBuilder& announce(bool a, int every) {
        cfg_.announce = a;
        cfg_.announce_every = every;
        return *this;
    }
    SurveyConfigBuilder& max_ticks(int n) { cfg_.max_ticks = n; return *this; }
    SurveyConfigBuilder& output(const std::string& base) { cfg_.output_base = base; return *this; }
    SurveyConfigBuilder& dedupe(bool d, double step) {
        cfg_.deduplicate = d;
        cfg_.dedup_bin_step_deg = step;
        return *this;
    }
    SurveyConfigBuilder& open_map(bool o = true) { cfg_.auto_open_map = o; return *this; }
    SurveyConfigBuilder& gps_timeout(int seconds) { cfg_.gps_poll_seconds = seconds; return *this; }
    SurveyConfigBuilder& gps_device(const std::string& dev) { cfg_.gps_device = dev; return *this; }

    Result<SurveyConfig> build() {
        auto result = cfg_.validate();
        if (!result.ok()) return result.error();
        return cfg_;
    }

private:
    SurveyConfig cfg_;
};

} // namespace api
} // namespace kermit

#endif // KERMIT_API_SURVEY_CONFIG_H
