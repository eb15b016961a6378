// src/config/command_line.cpp
#include "command_line.h"
#include "config_file.h"
#include "api/version.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <set>

namespace kermit {

using api::Error;
using api::ErrorCode;
using api::Result;

namespace {

const std::set<std::string> VALUE_FLAGS = {
    "-o", "--output-file", "--frequency", "--sample-rate", "--ppm", "--gain",
    "--offset", "--source", "--scale", "--window", "--interval", "--announce-every",
    "--bin-step", "--gps-timeout", "--gps-device", "--max-ticks",
};

const std::set<std::string> SWITCH_FLAGS = {
    "--announce", "--no-announce", "--dedupe", "--no-dedupe",
    "--open-map", "--no-open-map", "--auto-gain", "--yes", "-y",
};

Result<double> to_double(const std::string& flag, const std::string& text) {
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
        return Error(ErrorCode::INVALID_CONFIG, flag + ": '" + text + "' is not a number");
    }
    if (!std::isfinite(v)) {
        return Error(ErrorCode::INVALID_CONFIG, flag + ": '" + text + "' is not finite");
    }
    return v;
}

Result<int> to_int(const std::string& flag, const std::string& text) {
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE ||
        v < -2147483647L || v > 2147483647L) {
        return Error(ErrorCode::INVALID_CONFIG, flag + ": '" + text + "' is not an integer");
    }
    return static_cast<int>(v);
}

} // namespace

Result<CommandLine> parse_command_line(int argc, const char* const argv[]) {
    CommandLine cmd;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            cmd.log_level = log::Level::DEBUG;
        }
        else if (arg == "--quiet" || arg == "-q") {
            cmd.log_level = log::Level::WARN;
        }
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                return Error(ErrorCode::INVALID_CONFIG, arg + " needs a file name");
            }
            cmd.config_file = argv[++i];
        }
        else if (VALUE_FLAGS.count(arg)) {
            if (i + 1 >= argc) {
                return Error(ErrorCode::INVALID_CONFIG, arg + " needs a value");
            }
            cmd.settings.emplace_back(arg, argv[++i]);
        }
        else if (SWITCH_FLAGS.count(arg)) {
            cmd.settings.emplace_back(arg, "");
        }
        else if (!arg.empty() && arg[0] == '-') {
            return Error(ErrorCode::INVALID_CONFIG, "Unknown option: " + arg);
        }
        else if (cmd.action != Action::NONE) {
            return Error(ErrorCode::INVALID_CONFIG, "Unexpected argument: " + arg);
        }
        else if (arg == "collect-data") {
            cmd.action = Action::COLLECT_DATA;
        }
        else if (arg == "generate-map") {
            cmd.action = Action::GENERATE_MAP;
        }
        else if (arg == "version") {
            cmd.action = Action::VERSION;
        }
        else {
            return Error(ErrorCode::INVALID_CONFIG,
                         "Unknown action '" + arg + "' (collect-data, generate-map, version)");
        }
    }

    if (cmd.action == Action::NONE && !cmd.help) {
        return Error(ErrorCode::INVALID_CONFIG, "No action given");
    }
    return cmd;
}

Result<void> apply_settings(const CommandLine& cmd, api::SurveyConfig& config) {
    for (const auto& setting : cmd.settings) {
        const std::string& flag = setting.first;
        const std::string& value = setting.second;

        if (flag == "-o" || flag == "--output-file") {
            config.output_base = value;
        }
        else if (flag == "--frequency") {
            auto v = to_double(flag, value);
            if (!v.ok()) return v.error();
            config.listening_frequency_hz = v.value();
        }
        else if (flag == "--sample-rate") {
            auto v = to_double(flag, value);
            if (!v.ok()) return v.error();
            config.sample_rate_hz = v.value();
        }
        else if (flag == "--ppm") {
            auto v = to_int(flag, value);
            if (!v.ok()) return v.error();
            config.freq_correction_ppm = v.value();
        }
        else if (flag == "--gain") {
            auto v = to_double(flag, value);
            if (!v.ok()) return v.error();
            config.gain_db = v.value();
            config.auto_gain = false;
        }
        else if (flag == "--auto-gain") {
            config.auto_gain = true;
        }
        else if (flag == "--offset") {
            auto v = to_double(flag, value);
            if (!v.ok()) return v.error();
            config.antenna_offset_db = v.value();
        }
        else if (flag == "--source") {
            auto v = parse_signal_source(value);
            if (!v.ok()) return v.error();
            config.signal_source = v.value();
        }
        else if (flag == "--scale") {
            auto v = parse_scale_selection(value);
            if (!v.ok()) return v.error();
            config.scale = v.value();
        }
        else if (flag == "--window") {
            auto v = parse_spectrum_window(value);
            if (!v.ok()) return v.error();
            config.spectrum_window = v.value();
        }
        else if (flag == "--interval") {
            auto v = to_double(flag, value);
            if (!v.ok()) return v.error();
            config.sample_interval_s = v.value();
        }
        else if (flag == "--announce") {
            config.announce = true;
        }
        else if (flag == "--no-announce") {
            config.announce = false;
        }
        else if (flag == "--announce-every") {
            auto v = to_int(flag, value);
            if (!v.ok()) return v.error();
            config.announce_every = v.value();
        }
        else if (flag == "--dedupe") {
            config.deduplicate = true;
        }
        else if (flag == "--no-dedupe") {
            config.deduplicate = false;
        }
        else if (flag == "--bin-step") {
            auto v = to_double(flag, value);
            if (!v.ok()) return v.error();
            config.dedup_bin_step_deg = v.value();
        }
        else if (flag == "--open-map") {
            config.auto_open_map = true;
        }
        else if (flag == "--no-open-map") {
            config.auto_open_map = false;
        }
        else if (flag == "--gps-timeout") {
            auto v = to_int(flag, value);
            if (!v.ok()) return v.error();
            config.gps_poll_seconds = v.value();
        }
        else if (flag == "--gps-device") {
            config.gps_device = value;
        }
        else if (flag == "--max-ticks") {
            auto v = to_int(flag, value);
            if (!v.ok()) return v.error();
            config.max_ticks = v.value();
        }
        else if (flag == "--yes" || flag == "-y") {
            config.assume_yes = true;
        }
        else {
            return Error(ErrorCode::INTERNAL_ERROR, "Unhandled option " + flag);
        }
    }
    return Result<void>();
}

void print_usage(const char* program) {
    std::cout << version_header() << "\n";
    std::cout << build_info() << "\n\n";
    std::cout << "Usage: " << program << " <action> [options]\n\n";
    std::cout << "Actions:\n";
    std::cout << "  collect-data         Sample, classify and log RF levels with position\n";
    std::cout << "  generate-map         Render the collected CSV as a heatmap page\n";
    std::cout << "  version              Print the version\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output-file B  Output base without extension (default: ~/Desktop/rf_mapper)\n";
    std::cout << "  -c, --config FILE    Read settings from a configuration file\n";
    std::cout << "  --frequency HZ       Listening frequency (default: 146520000)\n";
    std::cout << "  --sample-rate HZ     SDR sample rate (default: 2048000)\n";
    std::cout << "  --ppm N              Frequency correction (default: 1)\n";
    std::cout << "  --gain DB            Manual tuner gain (default: 0)\n";
    std::cout << "  --auto-gain          Let the tuner choose the gain\n";
    std::cout << "  --offset DB          Antenna/system offset subtracted from levels\n";
    std::cout << "  --source S           rtlsdr | line-in\n";
    std::cout << "  --scale S            auto | hf | vhf\n";
    std::cout << "  --window W           rectangular | hann (default: rectangular)\n";
    std::cout << "  --interval SEC       Seconds between samples (default: 1.0)\n";
    std::cout << "  --announce, --no-announce\n";
    std::cout << "  --announce-every N   Speak every Nth sample (default: 5)\n";
    std::cout << "  --dedupe, --no-dedupe\n";
    std::cout << "  --bin-step DEG       Deduplication cell size (default: 0.0001)\n";
    std::cout << "  --open-map, --no-open-map\n";
    std::cout << "  --gps-timeout SEC    Wait for a first fix (default: 30)\n";
    std::cout << "  --gps-device PATH    Serial device, skips port selection\n";
    std::cout << "  --max-ticks N        Stop after N samples (default: run until Ctrl+C)\n";
    std::cout << "  -y, --yes            Overwrite an existing CSV without asking\n";
    std::cout << "  -v, --verbose        Debug logging\n";
    std::cout << "  -q, --quiet          Warnings and errors only\n";
    std::cout << "  -h, --help           Show this help\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " collect-data -o ~/survey/morning --frequency 146.52e6\n";
}

} // namespace kermit
