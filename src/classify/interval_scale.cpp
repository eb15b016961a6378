// src/classify/interval_scale.cpp
#include "interval_scale.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace kermit {

const char* const UNKNOWN_LABEL = "unknown";

namespace {

const std::string& unknown_label() {
    static const std::string label(UNKNOWN_LABEL);
    return label;
}

} // namespace

api::Result<IntervalScale> IntervalScale::create(const std::string& name,
                                                 std::vector<ScaleBand> bands) {
    using api::ErrorCode;

    if (bands.empty()) {
        return api::Error(ErrorCode::INVALID_SCALE, "Scale '" + name + "' has no bands");
    }

    std::set<std::string> labels;
    for (const auto& band : bands) {
        if (std::isnan(band.lower) || std::isnan(band.upper) || !(band.lower < band.upper)) {
            return api::Error(ErrorCode::INVALID_SCALE,
                             "Scale '" + name + "' band '" + band.label + "' is empty or inverted");
        }
        if (band.label == UNKNOWN_LABEL || !labels.insert(band.label).second) {
            return api::Error(ErrorCode::INVALID_SCALE,
                             "Scale '" + name + "' has a duplicate or reserved label '" +
                             band.label + "'");
        }
    }

    // (a1, b1] and (a2, b2] share more than a boundary point iff
    // max(a1, a2) < min(b1, b2)
    for (size_t i = 0; i < bands.size(); i++) {
        for (size_t j = i + 1; j < bands.size(); j++) {
            double lo = std::max(bands[i].lower, bands[j].lower);
            double hi = std::min(bands[i].upper, bands[j].upper);
            if (lo < hi) {
                return api::Error(ErrorCode::INVALID_SCALE,
                                 "Scale '" + name + "' bands '" + bands[i].label +
                                 "' and '" + bands[j].label + "' overlap");
            }
        }
    }

    return IntervalScale(name, std::move(bands));
}

const std::string& IntervalScale::classify(double value) const {
    for (const auto& band : bands_) {
        if (band.contains(value)) {
            return band.label;
        }
    }
    return unknown_label();
}

} // namespace kermit
