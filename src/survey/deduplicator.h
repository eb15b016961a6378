/**
 * @file deduplicator.h
 * @brief Collapse survey records into spatial bins
 *
 * Latitude and longitude are floored to a multiple of the bin step. Each
 * occupied bin becomes one record at the bin corner carrying the
 * strongest record of the bin (level, label, timestamp, elevation), so
 * the map shows the worst interference seen in each cell.
 *
 * Records without a position cannot be binned and are dropped, as are
 * records with a non-finite level or a position that has no bin. Output
 * is ordered by bin (latitude, then longitude).
 */

#ifndef KERMIT_DEDUPLICATOR_H
#define KERMIT_DEDUPLICATOR_H

#include "api/kermit_types.h"

#include <cstdint>
#include <optional>
#include <utility>

namespace kermit {

using BinKey = std::pair<int64_t, int64_t>;

/**
 * Bin of a position; coordinates already on a bin corner map to that bin.
 * Empty when a coordinate is not finite or its bin index does not fit.
 */
std::optional<BinKey> bin_key(const api::GeoPosition& pos, double bin_step);

/**
 * Reduce records to at most one per bin. Returns INVALID_CONFIG for a
 * non-positive or non-finite bin step.
 */
api::Result<api::SurveyRecords> dedupe(const api::SurveyRecords& records, double bin_step);

} // namespace kermit

#endif
