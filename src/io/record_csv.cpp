// src/io/record_csv.cpp
#include "record_csv.h"
#include "common/log.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace kermit {

using api::Error;
using api::ErrorCode;
using api::Result;
using api::SurveyRecord;

const char* const CSV_HEADER = "timestamp,signal_strength_db,s_unit,latitude,longitude,elevation";

namespace {

constexpr size_t CSV_COLUMNS = 6;

std::string quote_if_needed(const std::string& cell) {
    if (cell.find_first_of(",\"\n") == std::string::npos) return cell;
    std::string out = "\"";
    for (char c : cell) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::vector<std::string> split_csv_row(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                i++;
            } else if (c == '"') {
                quoted = false;
            } else {
                cell += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(cell);
            cell.clear();
        } else {
            cell += c;
        }
    }
    cells.push_back(cell);
    return cells;
}

bool parse_number(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

} // namespace

bool prompt_overwrite(const std::string& path) {
    std::cout << "File " << path << " exists. Overwrite? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES";
}

// ============================================================================
// CsvRecordWriter
// ============================================================================

Result<std::unique_ptr<CsvRecordWriter>> CsvRecordWriter::create(const std::string& path,
                                                                 const OverwriteConfirm& confirm) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        if (!confirm || !confirm(path)) {
            return Error(ErrorCode::DESTINATION_EXISTS,
                         path + " already exists and was not overwritten");
        }
        log::info("CSV", "Overwriting " + path);
    }

    std::unique_ptr<CsvRecordWriter> writer(new CsvRecordWriter(path));

    // Header once, then reopen in append mode for the rows
    {
        std::ofstream header(path, std::ios::trunc);
        if (!header.is_open()) {
            return Error(ErrorCode::FILE_WRITE_ERROR, "Cannot create file: " + path);
        }
        header << CSV_HEADER << "\n";
        if (!header.good()) {
            return Error(ErrorCode::FILE_WRITE_ERROR, "Cannot write header to " + path);
        }
    }

    writer->file_.open(path, std::ios::app);
    if (!writer->file_.is_open()) {
        return Error(ErrorCode::FILE_WRITE_ERROR, "Cannot open for append: " + path);
    }
    return writer;
}

Result<void> CsvRecordWriter::append(const SurveyRecord& record) {
    file_ << format_csv_row(record) << "\n";
    file_.flush();
    if (!file_.good()) {
        return Error(ErrorCode::FILE_WRITE_ERROR, "Write to " + path_ + " failed");
    }
    rows_written_++;
    return Result<void>();
}

std::string format_csv_row(const SurveyRecord& record) {
    std::ostringstream row;
    row << quote_if_needed(record.timestamp) << ","
        << std::fixed << std::setprecision(2) << record.level_db << ","
        << quote_if_needed(record.label) << ",";
    if (record.position) {
        row << std::setprecision(7) << record.position->latitude << ","
            << record.position->longitude << ","
            << std::setprecision(2) << record.position->elevation;
    } else {
        row << ",,";
    }
    return row.str();
}

// ============================================================================
// Reader
// ============================================================================

Result<api::SurveyRecords> read_records_csv(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error(ErrorCode::FILE_NOT_FOUND, "File not found: " + path);
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return Error(ErrorCode::FILE_READ_ERROR, "Cannot open file: " + path);
    }

    api::SurveyRecords records;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (line_no == 1 && line.rfind("timestamp,", 0) == 0) continue;

        auto bad = [&](const std::string& why) {
            return Error(ErrorCode::INVALID_FILE_FORMAT,
                         path + ":" + std::to_string(line_no) + ": " + why);
        };

        auto cells = split_csv_row(line);
        if (cells.size() != CSV_COLUMNS) {
            return bad("expected " + std::to_string(CSV_COLUMNS) + " columns, found " +
                       std::to_string(cells.size()));
        }

        SurveyRecord rec;
        rec.timestamp = cells[0];
        rec.label = cells[2];
        if (!parse_number(cells[1], rec.level_db)) {
            return bad("signal level '" + cells[1] + "' is not a finite number");
        }

        bool has_lat = !cells[3].empty();
        bool has_lon = !cells[4].empty();
        if (has_lat != has_lon) {
            return bad("latitude and longitude must both be present or both empty");
        }
        if (has_lat) {
            api::GeoPosition pos;
            if (!parse_number(cells[3], pos.latitude) || !parse_number(cells[4], pos.longitude)) {
                return bad("position is not a finite number");
            }
            if (std::fabs(pos.latitude) > 90.0 || std::fabs(pos.longitude) > 180.0) {
                return bad("position is outside -90..90, -180..180");
            }
            if (!cells[5].empty() && !parse_number(cells[5], pos.elevation)) {
                return bad("elevation '" + cells[5] + "' is not a finite number");
            }
            rec.position = pos;
        }
        records.push_back(rec);
    }

    if (in.bad()) {
        return Error(ErrorCode::FILE_READ_ERROR, "Read error in " + path);
    }
    log::debug("CSV", "Read " + std::to_string(records.size()) + " records from " + path);
    return records;
}

} // namespace kermit
