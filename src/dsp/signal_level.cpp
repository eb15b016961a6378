// src/dsp/signal_level.cpp
#include "signal_level.h"

#include <algorithm>
#include <iterator>

namespace kermit {

const std::vector<double>& SignalLevelExtractor::window_for(size_t n) {
    if (window_policy_ == WindowPolicy::RECTANGULAR) {
        return no_window_;
    }
    if (window_.size() != n) {
        window_ = hann_window(n);
    }
    return window_;
}

api::Result<LevelReading> SignalLevelExtractor::extract(const std::vector<complex_t>& samples,
                                                        double sample_rate,
                                                        double offset_db) {
    auto spectrum = estimator_.estimate(samples, sample_rate, window_for(samples.size()));
    if (!spectrum.ok()) {
        return spectrum.error();
    }

    const Spectrum& sp = spectrum.value();
    auto peak = std::max_element(sp.power_db.begin(), sp.power_db.end());
    size_t k = static_cast<size_t>(std::distance(sp.power_db.begin(), peak));

    LevelReading reading;
    reading.peak_db = *peak;
    reading.peak_hz = sp.frequency_hz[k];
    reading.level_db = *peak - offset_db;
    reading.floor_clamped = !(*peak > estimator_.config().floor_db);
    return reading;
}

} // namespace kermit
