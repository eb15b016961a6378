// src/config/config_file.cpp
#include "config_file.h"
#include "common/log.h"

#include <libconfig.h>

#include <algorithm>
#include <cctype>

namespace kermit {

using api::Error;
using api::ErrorCode;
using api::Result;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Accept 2048000 as well as 2048000.0
bool lookup_number(const config_t* cfg, const char* path, double& value) {
    if (config_lookup_float(cfg, path, &value) == CONFIG_TRUE) return true;
    int int_value = 0;
    if (config_lookup_int(cfg, path, &int_value) == CONFIG_TRUE) {
        value = int_value;
        return true;
    }
    return false;
}

void lookup_int(const config_t* cfg, const char* path, int& value) {
    int v = 0;
    if (config_lookup_int(cfg, path, &v) == CONFIG_TRUE) value = v;
}

void lookup_bool(const config_t* cfg, const char* path, bool& value) {
    int v = 0;
    if (config_lookup_bool(cfg, path, &v) == CONFIG_TRUE) value = (v != 0);
}

void lookup_string(const config_t* cfg, const char* path, std::string& value) {
    const char* v = nullptr;
    if (config_lookup_string(cfg, path, &v) == CONFIG_TRUE && v) value = v;
}

// RAII around config_t
class ConfigHandle {
public:
    ConfigHandle() { config_init(&cfg_); }
    ~ConfigHandle() { config_destroy(&cfg_); }
    ConfigHandle(const ConfigHandle&) = delete;
    ConfigHandle& operator=(const ConfigHandle&) = delete;

    config_t* get() { return &cfg_; }

private:
    config_t cfg_;
};

} // namespace

Result<api::SignalSource> parse_signal_source(const std::string& name) {
    std::string n = lower(name);
    if (n == "rtlsdr" || n == "rtl-sdr") return api::SignalSource::RTLSDR;
    if (n == "line-in" || n == "linein" || n == "line_in") return api::SignalSource::LINE_IN;
    return Error(ErrorCode::INVALID_CONFIG,
                 "Unknown signal source '" + name + "' (expected rtlsdr or line-in)");
}

Result<api::ScaleSelection> parse_scale_selection(const std::string& name) {
    std::string n = lower(name);
    if (n == "auto") return api::ScaleSelection::AUTO;
    if (n == "hf") return api::ScaleSelection::HF;
    if (n == "vhf") return api::ScaleSelection::VHF;
    return Error(ErrorCode::INVALID_SCALE,
                 "Unknown scale '" + name + "' (expected auto, hf or vhf)");
}

Result<api::SpectrumWindow> parse_spectrum_window(const std::string& name) {
    std::string n = lower(name);
    if (n == "rectangular" || n == "rect" || n == "none") return api::SpectrumWindow::RECTANGULAR;
    if (n == "hann" || n == "hanning") return api::SpectrumWindow::HANN;
    return Error(ErrorCode::INVALID_CONFIG,
                 "Unknown window '" + name + "' (expected rectangular or hann)");
}

Result<void> load_config_file(const std::string& path, api::SurveyConfig& config) {
    ConfigHandle handle;
    config_t* cfg = handle.get();

    if (config_read_file(cfg, path.c_str()) == CONFIG_FALSE) {
        if (config_error_type(cfg) == CONFIG_ERR_FILE_IO) {
            return Error(ErrorCode::FILE_NOT_FOUND, "Could not read configuration file " + path);
        }
        const char* text = config_error_text(cfg);
        return Error(ErrorCode::INVALID_CONFIG,
                     path + ":" + std::to_string(config_error_line(cfg)) + ": " +
                     (text ? text : "syntax error"));
    }

    // Radio
    lookup_number(cfg, "radio.frequency_hz", config.listening_frequency_hz);
    lookup_number(cfg, "radio.sample_rate_hz", config.sample_rate_hz);
    lookup_int(cfg, "radio.ppm", config.freq_correction_ppm);
    if (lookup_number(cfg, "radio.gain_db", config.gain_db)) config.auto_gain = false;
    lookup_bool(cfg, "radio.auto_gain", config.auto_gain);
    lookup_int(cfg, "radio.block_size", config.block_size);
    lookup_int(cfg, "radio.device_index", config.rtlsdr_device_index);
    lookup_number(cfg, "radio.antenna_offset_db", config.antenna_offset_db);

    std::string source;
    lookup_string(cfg, "radio.source", source);
    if (!source.empty()) {
        auto s = parse_signal_source(source);
        if (!s.ok()) return s.error();
        config.signal_source = s.value();
    }
    std::string scale;
    lookup_string(cfg, "radio.scale", scale);
    if (!scale.empty()) {
        auto s = parse_scale_selection(scale);
        if (!s.ok()) return s.error();
        config.scale = s.value();
    }
    std::string window;
    lookup_string(cfg, "radio.window", window);
    if (!window.empty()) {
        auto w = parse_spectrum_window(window);
        if (!w.ok()) return w.error();
        config.spectrum_window = w.value();
    }

    // Survey cadence
    lookup_number(cfg, "survey.interval_s", config.sample_interval_s);
    lookup_bool(cfg, "survey.announce", config.announce);
    lookup_int(cfg, "survey.announce_every", config.announce_every);
    lookup_int(cfg, "survey.max_ticks", config.max_ticks);

    // Output
    lookup_string(cfg, "output.base", config.output_base);
    lookup_bool(cfg, "output.dedupe", config.deduplicate);
    lookup_number(cfg, "output.bin_step_deg", config.dedup_bin_step_deg);
    lookup_bool(cfg, "output.open_map", config.auto_open_map);

    // Positioning
    lookup_int(cfg, "gps.poll_seconds", config.gps_poll_seconds);
    lookup_string(cfg, "gps.device", config.gps_device);
    lookup_int(cfg, "gps.baud", config.gps_baud);

    log::info("CONFIG", "Loaded " + path);
    return Result<void>();
}

} // namespace kermit
