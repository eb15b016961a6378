// src/dsp/spectrum_estimator.cpp
#include "spectrum_estimator.h"

#include <cmath>
#include <numeric>
#include <string>

namespace kermit {

SpectrumEstimator::SpectrumEstimator(const Config& cfg) : config_(cfg) {}

SpectrumEstimator::~SpectrumEstimator() {
    release();
}

void SpectrumEstimator::release() {
    if (plan_) {
        fftw_destroy_plan(plan_);
        plan_ = nullptr;
    }
    if (in_) {
        fftw_free(in_);
        in_ = nullptr;
    }
    if (out_) {
        fftw_free(out_);
        out_ = nullptr;
    }
    n_ = 0;
}

void SpectrumEstimator::plan(size_t n) {
    if (n == n_ && plan_) return;
    release();

    in_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * n));
    out_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * n));
    plan_ = fftw_plan_dft_1d(static_cast<int>(n), in_, out_, FFTW_FORWARD, FFTW_ESTIMATE);
    n_ = n;
}

api::Result<Spectrum> SpectrumEstimator::estimate(const std::vector<complex_t>& samples,
                                                  double sample_rate,
                                                  const std::vector<double>& window) {
    using api::ErrorCode;

    const size_t n = samples.size();
    if (n == 0) {
        return api::Error(ErrorCode::EMPTY_SAMPLE_BLOCK);
    }
    if (!window.empty() && window.size() != n) {
        return api::Error(ErrorCode::WINDOW_LENGTH_MISMATCH,
                         "Window has " + std::to_string(window.size()) +
                         " taps for a block of " + std::to_string(n) + " samples");
    }
    if (!(sample_rate > 0.0)) {
        return api::Error(ErrorCode::INVALID_SAMPLE_RATE);
    }

    plan(n);
    if (!plan_ || !in_ || !out_) {
        return api::Error(ErrorCode::INTERNAL_ERROR, "FFTW plan allocation failed");
    }

    // Apply window (rectangular when none supplied)
    double window_sum = 0.0;
    for (size_t i = 0; i < n; i++) {
        double w = window.empty() ? 1.0 : window[i];
        in_[i][0] = static_cast<double>(samples[i].real()) * w;
        in_[i][1] = static_cast<double>(samples[i].imag()) * w;
        window_sum += w;
    }
    if (window_sum == 0.0) {
        return api::Error(ErrorCode::INVALID_CONFIG, "Window sums to zero");
    }

    fftw_execute(plan_);

    const size_t bins = n / 2 + 1;
    const double scale = 2.0 / window_sum;
    const double bin_hz = sample_rate / static_cast<double>(n);

    Spectrum sp;
    sp.frequency_hz.resize(bins);
    sp.power_db.resize(bins);

    for (size_t k = 0; k < bins; k++) {
        sp.frequency_hz[k] = static_cast<double>(k) * bin_hz;

        double mag = std::hypot(out_[k][0], out_[k][1]) * scale;
        double db = config_.floor_db;
        if (mag > 0.0) {
            db = 20.0 * std::log10(mag / config_.reference);
        }
        if (!(db > config_.floor_db)) {
            db = config_.floor_db;
            sp.clamped_bins++;
        }
        sp.power_db[k] = db;
    }

    return sp;
}

std::vector<double> hann_window(size_t n) {
    std::vector<double> w(n, 1.0);
    if (n < 2) return w;
    for (size_t i = 0; i < n; i++) {
        w[i] = 0.5 - 0.5 * std::cos(2.0 * PI * static_cast<double>(i) /
                                    static_cast<double>(n - 1));
    }
    return w;
}

} // namespace kermit
