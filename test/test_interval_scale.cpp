// Copyright (C) 2025 Phoenix Nest LLC
// Phoenix Nest KERMIT - RF Background Survey
// Licensed under Phoenix Nest EULA - see phoenixnestmodem_eula.md
/**
 * @file test_interval_scale.cpp
 * @brief Tests for IntervalScale and the S-unit tables
 */

#include "classify/interval_scale.h"
#include "classify/s_unit_scales.h"

#include <cmath>
#include <cstdio>
#include <limits>
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

static IntervalScale make_scale(const std::vector<ScaleBand>& bands) {
    auto scale = IntervalScale::create("test", bands);
    if (!scale.ok()) throw std::runtime_error(scale.error().message);
    return scale.value();
}

static IntervalScale hf_scale() {
    api::SurveyConfig config;
    config.scale = api::ScaleSelection::HF;
    auto scale = make_s_unit_scale(config);
    if (!scale.ok()) throw std::runtime_error(scale.error().message);
    return scale.value();
}

//=============================================================================
// Band lookup
//=============================================================================

TEST(value_inside_band) {
    auto scale = make_scale({{"low", 0.0, 10.0}, {"high", 10.0, 20.0}});
    ASSERT_EQ(scale.classify(5.0), "low");
    ASSERT_EQ(scale.classify(15.0), "high");
}

TEST(shared_boundary_matches_one_band) {
    // (0, 10] then (10, 20]: 10 closes "low" and does not open "high"
    auto scale = make_scale({{"low", 0.0, 10.0}, {"high", 10.0, 20.0}});
    ASSERT_EQ(scale.classify(10.0), "low");
    ASSERT_EQ(scale.classify(std::nextafter(10.0, 100.0)), "high");
    ASSERT_EQ(scale.classify(20.0), "high");
}

TEST(lower_bound_is_exclusive) {
    auto scale = make_scale({{"only", 0.0, 10.0}});
    ASSERT_EQ(scale.classify(0.0), UNKNOWN_LABEL);
    ASSERT_EQ(scale.classify(0.001), "only");
}

TEST(gap_is_unknown) {
    auto scale = make_scale({{"a", 0.0, 10.0}, {"b", 20.0, 30.0}});
    ASSERT_EQ(scale.classify(15.0), UNKNOWN_LABEL);
    ASSERT_EQ(scale.classify(-5.0), UNKNOWN_LABEL);
    ASSERT_EQ(scale.classify(35.0), UNKNOWN_LABEL);
}

TEST(nan_is_unknown) {
    auto scale = hf_scale();
    ASSERT_EQ(scale.classify(std::numeric_limits<double>::quiet_NaN()), UNKNOWN_LABEL);
}

//=============================================================================
// Construction
//=============================================================================

TEST(rejects_empty_scale) {
    auto scale = IntervalScale::create("empty", {});
    ASSERT(!scale.ok());
    ASSERT(scale.error() == api::ErrorCode::INVALID_SCALE);
}

TEST(rejects_inverted_band) {
    auto scale = IntervalScale::create("bad", {{"x", 10.0, 0.0}});
    ASSERT(!scale.ok());
}

TEST(rejects_overlapping_bands) {
    auto scale = IntervalScale::create("bad", {{"a", 0.0, 10.0}, {"b", 5.0, 15.0}});
    ASSERT(!scale.ok());
    ASSERT(scale.error() == api::ErrorCode::INVALID_SCALE);
}

TEST(rejects_duplicate_labels) {
    auto scale = IntervalScale::create("bad", {{"a", 0.0, 10.0}, {"a", 10.0, 20.0}});
    ASSERT(!scale.ok());
}

TEST(accepts_unordered_bands) {
    auto scale = make_scale({{"high", 10.0, 20.0}, {"low", 0.0, 10.0}});
    ASSERT_EQ(scale.classify(10.0), "low");
    ASSERT_EQ(scale.classify(12.0), "high");
}

//=============================================================================
// S-unit tables
//=============================================================================

TEST(s_unit_steps) {
    auto scale = hf_scale();
    ASSERT_EQ(scale.size(), 14u);
    ASSERT_EQ(scale.classify(-60.0), "S0");
    ASSERT_EQ(scale.classify(-48.0), "S0");
    ASSERT_EQ(scale.classify(-47.9), "S1");
    ASSERT_EQ(scale.classify(-31.0), "S3");
    ASSERT_EQ(scale.classify(0.0), "S8");
    ASSERT_EQ(scale.classify(3.0), "S9");
    ASSERT_EQ(scale.classify(24.0), "S12");
    ASSERT_EQ(scale.classify(24.5), "S too much");
}

TEST(s_unit_extremes_absorb_everything_finite) {
    auto scale = hf_scale();
    ASSERT_EQ(scale.classify(-1e300), "S0");
    ASSERT_EQ(scale.classify(1e300), "S too much");
    // Zero-energy block level
    ASSERT_EQ(scale.classify(-200.0), "S0");
}

TEST(scale_follows_listening_frequency) {
    api::SurveyConfig config;
    config.listening_frequency_hz = 7.074e6;
    auto hf = make_s_unit_scale(config);
    ASSERT(hf.ok());
    ASSERT_EQ(hf->name(), "hf");

    config.listening_frequency_hz = 146.52e6;
    auto vhf = make_s_unit_scale(config);
    ASSERT(vhf.ok());
    ASSERT_EQ(vhf->name(), "vhf");

    config.scale = api::ScaleSelection::HF;
    auto forced = make_s_unit_scale(config);
    ASSERT(forced.ok());
    ASSERT_EQ(forced->name(), "hf");
}

int main() {
    printf("\n=== IntervalScale Tests ===\n\n");

    RUN_TEST(value_inside_band);
    RUN_TEST(shared_boundary_matches_one_band);
    RUN_TEST(lower_bound_is_exclusive);
    RUN_TEST(gap_is_unknown);
    RUN_TEST(nan_is_unknown);
    RUN_TEST(rejects_empty_scale);
    RUN_TEST(rejects_inverted_band);
    RUN_TEST(rejects_overlapping_bands);
    RUN_TEST(rejects_duplicate_labels);
    RUN_TEST(accepts_unordered_bands);
    RUN_TEST(s_unit_steps);
    RUN_TEST(s_unit_extremes_absorb_everything_finite);
    RUN_TEST(scale_follows_listening_frequency);

    printf("\n--- Results: %d passed, %d failed ---\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
