// src/classify/s_unit_scales.cpp
#include "s_unit_scales.h"

#include <limits>

namespace kermit {

namespace {

constexpr double NEG_INF = -std::numeric_limits<double>::infinity();
constexpr double POS_INF = std::numeric_limits<double>::infinity();

} // namespace

std::vector<ScaleBand> hf_s_unit_bands() {
    return {
        {"S0",         NEG_INF, -48.0},
        {"S1",         -48.0,   -42.0},
        {"S2",         -42.0,   -36.0},
        {"S3",         -36.0,   -30.0},
        {"S4",         -30.0,   -24.0},
        {"S5",         -24.0,   -18.0},
        {"S6",         -18.0,   -12.0},
        {"S7",         -12.0,    -6.0},
        {"S8",          -6.0,     0.0},
        {"S9",           0.0,     6.0},
        {"S10",          6.0,    12.0},
        {"S11",         12.0,    18.0},
        {"S12",         18.0,    24.0},
        {"S too much",  24.0,  POS_INF},
    };
}

std::vector<ScaleBand> vhf_s_unit_bands() {
    return {
        {"S0",         NEG_INF, -48.0},
        {"S1",         -48.0,   -42.0},
        {"S2",         -42.0,   -36.0},
        {"S3",         -36.0,   -30.0},
        {"S4",         -30.0,   -24.0},
        {"S5",         -24.0,   -18.0},
        {"S6",         -18.0,   -12.0},
        {"S7",         -12.0,    -6.0},
        {"S8",          -6.0,     0.0},
        {"S9",           0.0,     6.0},
        {"S10",          6.0,    12.0},
        {"S11",         12.0,    18.0},
        {"S12",         18.0,    24.0},
        {"S too much",  24.0,  POS_INF},
    };
}

api::Result<IntervalScale> make_s_unit_scale(const api::SurveyConfig& config) {
    if (config.effective_scale() == api::ScaleSelection::VHF) {
        return IntervalScale::create("vhf", vhf_s_unit_bands());
    }
    return IntervalScale::create("hf", hf_s_unit_bands());
}

} // namespace kermit
