// src/io/record_sink.h
#ifndef KERMIT_RECORD_SINK_H
#define KERMIT_RECORD_SINK_H

#include "api/kermit_types.h"

namespace kermit {

/**
 * Append-only destination for survey records.
 */
class RecordSink {
public:
    virtual ~RecordSink() = default;
    virtual api::Result<void> append(const api::SurveyRecord& record) = 0;
};

} // namespace kermit

#endif
