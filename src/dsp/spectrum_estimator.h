/**
 * @file spectrum_estimator.h
 * @brief One-sided magnitude spectrum in dB relative to full scale
 *
 * For an N-sample block x and window w:
 *   X[k]    = FFT(x * w)[k],            k = 0 .. N/2
 *   f[k]    = k / (N / sample_rate)
 *   mag[k]  = |X[k]| * 2 / sum(w)
 *   db[k]   = 20 * log10(mag[k] / reference)
 *
 * Bins whose magnitude is zero (or would land below SPECTRUM_FLOOR_DB) are
 * clamped to the floor and counted, so the dB output is always finite.
 *
 * The estimator owns its FFTW plan and aligned buffers and reuses them
 * for every block of the same length; a new length re-plans.
 */

#ifndef KERMIT_SPECTRUM_ESTIMATOR_H
#define KERMIT_SPECTRUM_ESTIMATOR_H

#include "common/types.h"
#include "common/constants.h"
#include "api/kermit_types.h"

#include <complex>
#include <vector>

#include <fftw3.h>

namespace kermit {

struct Spectrum {
    std::vector<double> frequency_hz;
    std::vector<double> power_db;
    size_t clamped_bins = 0;    // bins held at the floor

    size_t size() const { return power_db.size(); }
    bool empty() const { return power_db.empty(); }
};

class SpectrumEstimator {
public:
    struct Config {
        double reference;   // dB reference magnitude
        double floor_db;    // clamp for zero-energy bins

        Config()
            : reference(SPECTRUM_REFERENCE)
            , floor_db(SPECTRUM_FLOOR_DB)
        {}
    };

    SpectrumEstimator() : SpectrumEstimator(Config()) {}
    explicit SpectrumEstimator(const Config& cfg);
    ~SpectrumEstimator();

    SpectrumEstimator(const SpectrumEstimator&) = delete;
    SpectrumEstimator& operator=(const SpectrumEstimator&) = delete;

    /**
     * Estimate the spectrum of one block.
     *
     * @param samples      Complex baseband block (non-empty)
     * @param sample_rate  Hz
     * @param window       Optional window, same length as samples;
     *                     empty selects a rectangular window
     */
    api::Result<Spectrum> estimate(const std::vector<complex_t>& samples,
                                   double sample_rate,
                                   const std::vector<double>& window = {});

    size_t planned_length() const { return n_; }
    const Config& config() const { return config_; }

private:
    void plan(size_t n);
    void release();

    Config config_;
    size_t n_ = 0;
    fftw_complex* in_ = nullptr;
    fftw_complex* out_ = nullptr;
    fftw_plan plan_ = nullptr;
};

/// Hann window of length n (symmetric)
std::vector<double> hann_window(size_t n);

} // namespace kermit

#endif
