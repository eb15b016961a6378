/**
 * @file line_source.h
 * @brief One-line-at-a-time text input (serial GPS, or a fake in tests)
 */

#ifndef KERMIT_LINE_SOURCE_H
#define KERMIT_LINE_SOURCE_H

#include "api/kermit_types.h"

#include <string>

namespace kermit {

class LineSource {
public:
    virtual ~LineSource() = default;

    /**
     * Block until one line arrives; the terminator is stripped.
     * @return SERIAL_READ_FAILED on timeout, EOF or device error
     */
    virtual api::Result<std::string> read_line() = 0;

    virtual std::string describe() const = 0;
};

} // namespace kermit

#endif
