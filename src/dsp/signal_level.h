/**
 * @file signal_level.h
 * @brief Reduce one sample block to a single calibrated level (dB)
 *
 * The level is the strongest bin of the spectrum minus the antenna offset.
 *
 * Taking the maximum over the whole band is an approximation: it assumes
 * the tuned frequency dominates the observed band, rather than reading
 * the bin nearest the listening frequency. Kept for compatibility with
 * existing survey data.
 */

#ifndef KERMIT_SIGNAL_LEVEL_H
#define KERMIT_SIGNAL_LEVEL_H

#include "spectrum_estimator.h"

namespace kermit {

enum class WindowPolicy {
    RECTANGULAR,
    HANN,
};

struct LevelReading {
    double level_db = 0.0;      // calibrated: peak_db - offset
    double peak_db = 0.0;       // uncalibrated strongest bin
    double peak_hz = 0.0;       // baseband frequency of that bin
    bool floor_clamped = false; // peak sits on the spectrum floor
};

class SignalLevelExtractor {
public:
    explicit SignalLevelExtractor(WindowPolicy window = WindowPolicy::RECTANGULAR)
        : window_policy_(window) {}

    /**
     * @param samples      One acquisition block
     * @param sample_rate  Hz
     * @param offset_db    Antenna/system correction subtracted from the peak
     */
    api::Result<LevelReading> extract(const std::vector<complex_t>& samples,
                                      double sample_rate,
                                      double offset_db);

    WindowPolicy window_policy() const { return window_policy_; }

private:
    const std::vector<double>& window_for(size_t n);

    WindowPolicy window_policy_;
    SpectrumEstimator estimator_;
    std::vector<double> window_;
    std::vector<double> no_window_;
};

} // namespace kermit

#endif
