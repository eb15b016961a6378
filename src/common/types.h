// src/common/types.h
#ifndef KERMIT_TYPES_H
#define KERMIT_TYPES_H

#include <complex>
#include <cstdint>
#include <vector>

namespace kermit {

// Sample types
using sample_t = float;
using complex_t = std::complex<float>;
using SampleBlock = std::vector<complex_t>;

// RTL-SDR delivers offset-binary 8-bit I/Q
using raw_iq_t = uint8_t;

// Convert one offset-binary byte to a normalized float (-1.0 to +1.0)
inline sample_t raw_to_float(raw_iq_t s) {
    return (static_cast<sample_t>(s) - 127.5f) / 127.5f;
}

} // namespace kermit

#endif
