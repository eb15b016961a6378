// Copyright (C) 2025 Phoenix Nest LLC
// Phoenix Nest KERMIT - RF Background Survey
// Licensed under Phoenix Nest EULA - see phoenixnestmodem_eula.md
/**
 * @file test_spectrum.cpp
 * @brief Tests for SpectrumEstimator and SignalLevelExtractor
 */

#include "dsp/signal_level.h"
#include "dsp/spectrum_estimator.h"
#include "common/constants.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <stdexcept>

using namespace kermit;

// Test counters
static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    printf("  %-50s ", #name); \
    fflush(stdout); \
    try { \
        test_##name(); \
        printf("PASS\n"); \
        tests_passed++; \
    } catch (const std::exception& e) { \
        printf("FAIL: %s\n", e.what()); \
        tests_failed++; \
    } catch (...) { \
        printf("FAIL: unknown exception\n"); \
        tests_failed++; \
    } \
} while(0)

#define ASSERT(cond) do { \
    if (!(cond)) { \
        throw std::runtime_error("Assertion failed: " #cond); \
    } \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        char buf[256]; \
        snprintf(buf, sizeof(buf), "Expected %s == %s", #a, #b); \
        throw std::runtime_error(buf); \
    } \
} while(0)

#define ASSERT_NEAR(a, b, tol) do { \
    if (std::fabs((a) - (b)) > (tol)) { \
        char buf[256]; \
        snprintf(buf, sizeof(buf), "Expected %s ~= %s (got %g vs %g)", #a, #b, \
                 static_cast<double>(a), static_cast<double>(b)); \
        throw std::runtime_error(buf); \
    } \
} while(0)

static const double FS = 2.048e6;
static const size_t N = 1024;

// Complex tone exactly on bin k
static std::vector<complex_t> tone(size_t n, size_t k, float amplitude) {
    std::vector<complex_t> s(n);
    for (size_t i = 0; i < n; i++) {
        double phase = 2.0 * PI * static_cast<double>(k) * static_cast<double>(i) / n;
        s[i] = complex_t(amplitude * static_cast<float>(std::cos(phase)),
                         amplitude * static_cast<float>(std::sin(phase)));
    }
    return s;
}

static size_t peak_bin(const Spectrum& spec) {
    auto it = std::max_element(spec.power_db.begin(), spec.power_db.end());
    return static_cast<size_t>(std::distance(spec.power_db.begin(), it));
}

//=============================================================================
// SpectrumEstimator
//=============================================================================

TEST(bin_layout) {
    SpectrumEstimator est;
    auto spec = est.estimate(tone(N, 10, 0.5f), FS);
    ASSERT(spec.ok());
    ASSERT_EQ(spec->size(), N / 2 + 1);
    ASSERT_NEAR(spec->frequency_hz[0], 0.0, 1e-9);
    ASSERT_NEAR(spec->frequency_hz[1], FS / N, 1e-6);
    ASSERT_NEAR(spec->frequency_hz.back(), FS / 2, 1e-6);
}

TEST(sinusoid_peak_at_its_bin) {
    SpectrumEstimator est;
    const size_t k = 100;
    auto spec = est.estimate(tone(N, k, 0.5f), FS);
    ASSERT(spec.ok());

    size_t peak = peak_bin(spec.value());
    double expected_hz = k * FS / N;
    ASSERT(std::fabs(spec->frequency_hz[peak] - expected_hz) <= FS / N);
}

TEST(sinusoid_peak_level) {
    // |X[k]| = A * N, scaled by 2 / N: amplitude 0.5 reads 1.0 = 0 dB
    SpectrumEstimator est;
    auto spec = est.estimate(tone(N, 64, 0.5f), FS);
    ASSERT(spec.ok());
    ASSERT_NEAR(spec->power_db[64], 0.0, 1e-3);
}

TEST(zero_block_clamps_to_floor) {
    SpectrumEstimator est;
    std::vector<complex_t> zeros(N, complex_t(0.0f, 0.0f));
    auto spec = est.estimate(zeros, FS);
    ASSERT(spec.ok());
    ASSERT_EQ(spec->clamped_bins, spec->size());
    for (double p : spec->power_db) {
        ASSERT(std::isfinite(p));
        ASSERT_EQ(p, SPECTRUM_FLOOR_DB);
    }
}

TEST(empty_block_rejected) {
    SpectrumEstimator est;
    auto spec = est.estimate({}, FS);
    ASSERT(!spec.ok());
    ASSERT(spec.error() == api::ErrorCode::EMPTY_SAMPLE_BLOCK);
}

TEST(window_length_mismatch) {
    SpectrumEstimator est;
    auto spec = est.estimate(tone(N, 5, 0.5f), FS, hann_window(N / 2));
    ASSERT(!spec.ok());
    ASSERT(spec.error() == api::ErrorCode::WINDOW_LENGTH_MISMATCH);
}

TEST(bad_sample_rate) {
    SpectrumEstimator est;
    auto spec = est.estimate(tone(N, 5, 0.5f), 0.0);
    ASSERT(!spec.ok());
    ASSERT(spec.error() == api::ErrorCode::INVALID_SAMPLE_RATE);
}

TEST(replans_on_length_change) {
    SpectrumEstimator est;
    ASSERT(est.estimate(tone(N, 5, 0.5f), FS).ok());
    ASSERT_EQ(est.planned_length(), N);
    auto spec = est.estimate(tone(256, 5, 0.5f), FS);
    ASSERT(spec.ok());
    ASSERT_EQ(est.planned_length(), 256u);
    ASSERT_EQ(peak_bin(spec.value()), 5u);
}

TEST(hann_peak_matches_rectangular) {
    // Coherent gain is normalized out, so an on-bin tone reads the same
    SpectrumEstimator est;
    auto rect = est.estimate(tone(N, 32, 0.25f), FS);
    auto hann = est.estimate(tone(N, 32, 0.25f), FS, hann_window(N));
    ASSERT(rect.ok() && hann.ok());
    ASSERT_EQ(peak_bin(hann.value()), 32u);
    ASSERT_NEAR(hann->power_db[32], rect->power_db[32], 0.01);
}

//=============================================================================
// SignalLevelExtractor
//=============================================================================

TEST(level_is_peak_minus_offset) {
    SignalLevelExtractor extractor;
    auto samples = tone(N, 200, 0.5f);

    SpectrumEstimator est;
    auto spec = est.estimate(samples, FS);
    ASSERT(spec.ok());
    double peak = *std::max_element(spec->power_db.begin(), spec->power_db.end());

    auto reading = extractor.extract(samples, FS, 12.5);
    ASSERT(reading.ok());
    ASSERT_NEAR(reading->peak_db, peak, 1e-9);
    ASSERT_NEAR(reading->level_db, peak - 12.5, 1e-9);
    ASSERT_NEAR(reading->peak_hz, 200 * FS / N, FS / N);
    ASSERT(!reading->floor_clamped);
}

TEST(zero_block_level_is_floor_minus_offset) {
    SignalLevelExtractor extractor;
    std::vector<complex_t> zeros(N, complex_t(0.0f, 0.0f));
    auto reading = extractor.extract(zeros, FS, 3.0);
    ASSERT(reading.ok());
    ASSERT(std::isfinite(reading->level_db));
    ASSERT_NEAR(reading->level_db, SPECTRUM_FLOOR_DB - 3.0, 1e-9);
    ASSERT(reading->floor_clamped);
}

TEST(hann_policy_finds_same_peak) {
    SignalLevelExtractor extractor(WindowPolicy::HANN);
    auto reading = extractor.extract(tone(N, 300, 0.5f), FS, 0.0);
    ASSERT(reading.ok());
    ASSERT_NEAR(reading->peak_hz, 300 * FS / N, FS / N);
    ASSERT_NEAR(reading->level_db, 0.0, 0.01);
}

TEST(extract_propagates_empty_block) {
    SignalLevelExtractor extractor;
    auto reading = extractor.extract({}, FS, 0.0);
    ASSERT(!reading.ok());
    ASSERT(reading.error() == api::ErrorCode::EMPTY_SAMPLE_BLOCK);
}

int main() {
    printf("\n=== Spectrum / Signal Level Tests ===\n\n");

    RUN_TEST(bin_layout);
    RUN_TEST(sinusoid_peak_at_its_bin);
    RUN_TEST(sinusoid_peak_level);
    RUN_TEST(zero_block_clamps_to_floor);
    RUN_TEST(empty_block_rejected);
    RUN_TEST(window_length_mismatch);
    RUN_TEST(bad_sample_rate);
    RUN_TEST(replans_on_length_change);
    RUN_TEST(hann_peak_matches_rectangular);
    RUN_TEST(level_is_peak_minus_offset);
    RUN_TEST(zero_block_level_is_floor_minus_offset);
    RUN_TEST(hann_policy_finds_same_peak);
    RUN_TEST(extract_propagates_empty_block);

    printf("\n--- Results: %d passed, %d failed ---\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
