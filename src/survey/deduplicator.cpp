// src/survey/deduplicator.cpp
#include "deduplicator.h"
#include "common/log.h"

#include <cmath>
#include <map>

namespace kermit {

using api::Error;
using api::ErrorCode;
using api::Result;
using api::SurveyRecord;

namespace {

// Relative slack so k * step / step does not land just under k
constexpr double BIN_TOLERANCE = 1e-9;

// Well inside int64_t so the cast below is always defined
constexpr double BIN_INDEX_LIMIT = 4.0e18;

std::optional<int64_t> bin_index(double coord, double step) {
    double index = std::floor(coord / step + BIN_TOLERANCE);
    if (!std::isfinite(index) || std::fabs(index) > BIN_INDEX_LIMIT) {
        return std::nullopt;
    }
    return static_cast<int64_t>(index);
}

} // namespace

std::optional<BinKey> bin_key(const api::GeoPosition& pos, double bin_step) {
    auto lat = bin_index(pos.latitude, bin_step);
    auto lon = bin_index(pos.longitude, bin_step);
    if (!lat || !lon) return std::nullopt;
    return BinKey(*lat, *lon);
}

Result<api::SurveyRecords> dedupe(const api::SurveyRecords& records, double bin_step) {
    if (!(bin_step > 0.0) || !std::isfinite(bin_step)) {
        return Error(ErrorCode::INVALID_CONFIG, "Bin step must be a positive number of degrees");
    }

    std::map<BinKey, const SurveyRecord*> strongest;
    size_t dropped = 0;
    size_t unbinnable = 0;

    for (const auto& rec : records) {
        if (!rec.position) {
            dropped++;
            continue;
        }
        std::optional<BinKey> key;
        if (std::isfinite(rec.level_db)) {
            key = bin_key(*rec.position, bin_step);
        }
        if (!key) {
            unbinnable++;
            continue;
        }
        auto it = strongest.find(*key);
        if (it == strongest.end()) {
            strongest.emplace(*key, &rec);
        } else if (rec.level_db > it->second->level_db) {
            it->second = &rec;
        }
    }

    api::SurveyRecords out;
    out.reserve(strongest.size());
    for (const auto& entry : strongest) {
        SurveyRecord rec = *entry.second;
        rec.position->latitude = entry.first.first * bin_step;
        rec.position->longitude = entry.first.second * bin_step;
        out.push_back(rec);
    }

    log::debug("SURVEY", "Deduplicated " + std::to_string(records.size()) + " records into " +
               std::to_string(out.size()) + " bins (" + std::to_string(dropped) +
               " without position)");
    if (unbinnable > 0) {
        log::warn("SURVEY", "Skipped " + std::to_string(unbinnable) +
                  " records with a non-finite level or an unbinnable position");
    }
    return out;
}

} // namespace kermit
