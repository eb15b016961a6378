// Copyright (C) 2025 Phoenix Nest LLC
// Phoenix Nest KERMIT - RF Background Survey
// Licensed under Phoenix Nest EULA - see phoenixnestmodem_eula.md
/**
 * @file sample_source.h
 * @brief Abstract sample source interface for the acquisition loop
 *
 * A source is configured when it is constructed and released when it is
 * destroyed. Each tick pulls one fixed-length block of complex baseband
 * samples. The acquisition loop doesn't know or care about the device.
 */

#ifndef KERMIT_API_SAMPLE_SOURCE_H
#define KERMIT_API_SAMPLE_SOURCE_H

#include "kermit_types.h"

#include <complex>
#include <cstddef>
#include <vector>

namespace kermit {

/**
 * Abstract sample source.
 */
class SampleSource {
public:
    virtual ~SampleSource() = default;

    /**
     * Read one block of complex baseband samples.
     *
     * @param out     Receives exactly `length` samples on success
     * @param length  Block length in samples
     * @return        DEVICE_READ_FAILED if the device could not deliver
     */
    virtual api::Result<void> read_block(std::vector<std::complex<float>>& out,
                                         size_t length) = 0;

    /**
     * Sample rate of the delivered blocks (Hz).
     */
    virtual double sample_rate() const = 0;

    /**
     * Get source type for logging/debugging.
     */
    virtual const char* source_type() const = 0;
};

} // namespace kermit

#endif // KERMIT_API_SAMPLE_SOURCE_H
