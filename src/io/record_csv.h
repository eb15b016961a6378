/**
 * @file record_csv.h
 * @brief Survey records as CSV
 *
 *   timestamp,signal_strength_db,s_unit,latitude,longitude,elevation
 *   2025-06-01T14:03:22Z,-31.25,S3,48.1173000,11.5166667,545.40
 *   2025-06-01T14:03:23Z,-30.80,S4,,,
 *
 * The header is written once when the file is created; rows are appended
 * and flushed one at a time. An existing file is only replaced after the
 * confirm callback agrees.
 */

#ifndef KERMIT_RECORD_CSV_H
#define KERMIT_RECORD_CSV_H

#include "record_sink.h"

#include <fstream>
#include <functional>
#include <memory>
#include <string>

namespace kermit {

extern const char* const CSV_HEADER;

/// Asked before an existing destination is replaced; false keeps it
using OverwriteConfirm = std::function<bool(const std::string& path)>;

/// "File exists. Overwrite? [y/N]" on stdin/stdout
bool prompt_overwrite(const std::string& path);

class CsvRecordWriter : public RecordSink {
public:
    /**
     * Create the file and write the header.
     * DESTINATION_EXISTS if the file exists and confirm refuses.
     */
    static api::Result<std::unique_ptr<CsvRecordWriter>> create(const std::string& path,
                                                                const OverwriteConfirm& confirm);

    api::Result<void> append(const api::SurveyRecord& record) override;

    const std::string& path() const { return path_; }
    size_t rows_written() const { return rows_written_; }

private:
    explicit CsvRecordWriter(const std::string& path) : path_(path) {}

    std::string path_;
    std::ofstream file_;
    size_t rows_written_ = 0;
};

/// Format one record as a CSV row (no newline)
std::string format_csv_row(const api::SurveyRecord& record);

/// Read every record back; INVALID_FILE_FORMAT names the offending line
api::Result<api::SurveyRecords> read_records_csv(const std::string& path);

} // namespace kermit

#endif
