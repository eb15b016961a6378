/**
 * @file config_file.h
 * @brief Load survey settings from a libconfig file
 *
 * Every setting is optional; what the file leaves out keeps the value
 * already in the config (the compiled default, normally).
 *
 *   radio = {
 *     frequency_hz = 146520000.0;
 *     sample_rate_hz = 2048000.0;
 *     ppm = 1;
 *     gain_db = 0.0;
 *     auto_gain = false;
 *     block_size = 1024;
 *     device_index = 0;
 *     antenna_offset_db = 0.0;
 *     source = "rtlsdr";          # or "line-in"
 *     scale = "auto";             # "hf", "vhf"
 *     window = "rectangular";     # or "hann"
 *   };
 *   survey = { interval_s = 1.0; announce = true; announce_every = 5; max_ticks = 0; };
 *   output = { base = "~/Desktop/rf_mapper"; dedupe = true; bin_step_deg = 0.0001; open_map = true; };
 *   gps = { poll_seconds = 30; device = ""; baud = 9600; };
 */

#ifndef KERMIT_CONFIG_FILE_H
#define KERMIT_CONFIG_FILE_H

#include "api/survey_config.h"

#include <string>

namespace kermit {

/// "rtlsdr" / "line-in" (case-insensitive)
api::Result<api::SignalSource> parse_signal_source(const std::string& name);

/// "auto" / "hf" / "vhf" (case-insensitive)
api::Result<api::ScaleSelection> parse_scale_selection(const std::string& name);

/// "rectangular" / "hann" (case-insensitive)
api::Result<api::SpectrumWindow> parse_spectrum_window(const std::string& name);

/**
 * Overlay the file's settings onto config. Does not validate the result.
 * FILE_NOT_FOUND if the file cannot be read, INVALID_CONFIG with the
 * line number for syntax errors or bad values.
 */
api::Result<void> load_config_file(const std::string& path, api::SurveyConfig& config);

} // namespace kermit

#endif
