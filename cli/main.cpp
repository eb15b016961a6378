// Copyright (C) 2025 Phoenix Nest LLC
// Phoenix Nest KERMIT - RF Background Survey
// Licensed under Phoenix Nest EULA - see phoenixnestmodem_eula.md
/**
 * @file main.cpp
 * @brief KERMIT - collect RF background levels and map them
 *
 * Usage:
 *   kermit collect-data [options]
 *   kermit generate-map [options]
 *   kermit version
 *
 * Exit codes:
 *   0  success
 *   1  usage or configuration error
 *   2  hardware acquisition error
 *   3  output / file error
 */

#include "api/survey_config.h"
#include "api/version.h"
#include "audio/announcer.h"
#include "classify/s_unit_scales.h"
#include "common/log.h"
#include "config/command_line.h"
#include "config/config_file.h"
#include "gps/gps_setup.h"
#include "io/heatmap_html.h"
#include "io/paths.h"
#include "io/record_csv.h"
#include "sdr/rtlsdr_source.h"
#include "survey/acquisition_loop.h"
#include "survey/deduplicator.h"

#include <atomic>
#include <csignal>
#include <memory>
#include <iostream>
#include <string>

#include <signal.h>

using namespace kermit;

static constexpr int EXIT_CONFIG = 1;
static constexpr int EXIT_HARDWARE = 2;
static constexpr int EXIT_IO = 3;

// Global for signal handling
static std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running.store(false);
}

static int exit_code_for(const api::Error& err) {
    int code = static_cast<int>(err.code);
    if (code >= 100 && code < 200) return EXIT_CONFIG;
    if (code >= 400 && code < 500) return EXIT_IO;
    return EXIT_HARDWARE;
}

static int fail(const char* tag, const api::Error& err) {
    log::error(tag, err.message);
    return exit_code_for(err);
}

static int collect_data(const api::SurveyConfig& config) {
    auto scale = make_s_unit_scale(config);
    if (!scale.ok()) return fail("SCALE", scale.error());
    log::info("SCALE", "Using " + scale->name() + " S-unit scale for " +
              std::to_string(static_cast<long long>(config.listening_frequency_hz)) + " Hz");

    std::string csv_path = config.csv_path();
    if (!ensure_parent_directory(csv_path)) {
        log::error("CSV", "Cannot create directory for " + csv_path);
        return EXIT_IO;
    }

    OverwriteConfirm confirm = prompt_overwrite;
    if (config.assume_yes) {
        confirm = [](const std::string&) { return true; };
    }
    auto writer = CsvRecordWriter::create(csv_path, confirm);
    if (!writer.ok()) return fail("CSV", writer.error());
    log::info("CSV", "Writing records to " + csv_path);

    // From here Ctrl+C ends the run so the device is closed on the way out.
    // No SA_RESTART: a blocked port prompt returns instead of resuming.
    struct sigaction stop_action;
    stop_action.sa_handler = signal_handler;
    sigemptyset(&stop_action.sa_mask);
    stop_action.sa_flags = 0;
    sigaction(SIGINT, &stop_action, nullptr);
    sigaction(SIGTERM, &stop_action, nullptr);

    // Fail fast before any GPS warm-up; closed when this scope ends
    auto source = create_sample_source(config);
    if (!source.ok()) return fail("SDR", source.error());

    std::unique_ptr<Announcer> announcer;
    if (config.announce) {
        announcer = make_platform_announcer();
    } else {
        announcer = std::make_unique<NullAnnouncer>();
    }

    GpsSetupHooks hooks = GpsSetupHooks::system(config);
    hooks.keep_going = []() { return g_running.load(); };
    GpsSetup gps = setup_gps(config, hooks);
    if (!g_running.load()) {
        log::info("SURVEY", "Interrupted before sampling started");
        return 0;
    }
    if (!gps.receiver) {
        log::warn("GPS", "Continuing without position; records will have empty coordinates");
    }

    AcquisitionLoop loop(config, scale.value(), *source.value(), gps.receiver.get(),
                         *writer.value(), *announcer);
    if (gps.first_fix) {
        loop.seed_position(*gps.first_fix);
    }
    auto result = loop.run(g_running);

    log::info("CSV", std::to_string(writer.value()->rows_written()) + " records in " + csv_path);
    if (!result.ok()) return exit_code_for(result.error());
    return 0;
}

static int generate_map(const api::SurveyConfig& config) {
    auto records = read_records_csv(config.csv_path());
    if (!records.ok()) return fail("CSV", records.error());
    log::info("MAP", std::to_string(records->size()) + " records read from " + config.csv_path());

    api::SurveyRecords plotted = records.value();
    if (config.deduplicate) {
        auto reduced = dedupe(plotted, config.dedup_bin_step_deg);
        if (!reduced.ok()) return fail("MAP", reduced.error());
        log::info("MAP", "Deduplicated to " + std::to_string(reduced->size()) + " cells");
        plotted = reduced.value();
    }

    std::string map_path = config.map_path();
    auto written = write_heatmap(map_path, plotted);
    if (!written.ok()) return fail("MAP", written.error());

    if (config.auto_open_map && !open_in_browser(map_path)) {
        log::info("MAP", "Open " + map_path + " in a browser to view the map");
    }
    return 0;
}

int main(int argc, char* argv[]) {
    auto parsed = parse_command_line(argc, argv);
    if (!parsed.ok()) {
        std::cerr << parsed.error().message << "\n";
        std::cerr << "Use --help for usage information.\n";
        return EXIT_CONFIG;
    }
    const CommandLine& cmd = parsed.value();

    if (cmd.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (cmd.action == Action::VERSION) {
        std::cout << version_header() << "\n";
        std::cout << copyright_notice() << "\n";
        std::cout << build_info() << "\n";
        return 0;
    }

    log::set_level(cmd.log_level);

    // Defaults, then the config file, then the flags
    api::SurveyConfig config = api::SurveyConfig::defaults();
    if (!cmd.config_file.empty()) {
        auto loaded = load_config_file(expand_path(cmd.config_file), config);
        if (!loaded.ok()) {
            log::error("CONFIG", loaded.error().message);
            return EXIT_CONFIG;
        }
    }
    auto applied = apply_settings(cmd, config);
    if (!applied.ok()) {
        log::error("CONFIG", applied.error().message);
        return EXIT_CONFIG;
    }
    config.output_base = expand_path(config.output_base);

    auto valid = config.validate();
    if (!valid.ok()) {
        log::error("CONFIG", valid.error().message);
        return EXIT_CONFIG;
    }

    switch (cmd.action) {
        case Action::COLLECT_DATA: return collect_data(config);
        case Action::GENERATE_MAP: return generate_map(config);
        default: break;
    }
    print_usage(argv[0]);
    return EXIT_CONFIG;
}
