/**
 * @file interval_scale.h
 * @brief Ordered table of labeled (lower, upper] ranges
 *
 * A value v belongs to a band iff lower < v <= upper, so adjacent bands
 * sharing a boundary never both claim it: the boundary goes to the lower
 * band (whose upper bound it is). Lookup scans in insertion order and
 * returns the first match, or UNKNOWN_LABEL when nothing covers v.
 */

#ifndef KERMIT_INTERVAL_SCALE_H
#define KERMIT_INTERVAL_SCALE_H

#include "api/kermit_types.h"

#include <string>
#include <vector>

namespace kermit {

/// Result of classifying a value no band covers (e.g. NaN or a gap)
extern const char* const UNKNOWN_LABEL;

struct ScaleBand {
    std::string label;
    double lower;   // exclusive
    double upper;   // inclusive

    bool contains(double value) const {
        return value > lower && value <= upper;
    }
};

class IntervalScale {
public:
    /**
     * Build a scale, rejecting empty or inverted bands, duplicate labels,
     * and any pair of bands that overlap beyond a shared boundary point.
     */
    static api::Result<IntervalScale> create(const std::string& name,
                                             std::vector<ScaleBand> bands);

    /// Label of the first band containing value, or UNKNOWN_LABEL
    const std::string& classify(double value) const;

    const std::string& name() const { return name_; }
    const std::vector<ScaleBand>& bands() const { return bands_; }
    size_t size() const { return bands_.size(); }

private:
    IntervalScale(std::string name, std::vector<ScaleBand> bands)
        : name_(std::move(name)), bands_(std::move(bands)) {}

    std::string name_;
    std::vector<ScaleBand> bands_;
};

} // namespace kermit

#endif
