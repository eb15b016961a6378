/**
 * @file command_line.h
 * @brief kermit <action> [options]
 *
 * Parsing is split from applying so the config file named by -c can be
 * loaded in between: defaults, then the file, then the flags.
 */

#ifndef KERMIT_COMMAND_LINE_H
#define KERMIT_COMMAND_LINE_H

#include "api/survey_config.h"
#include "common/log.h"

#include <string>
#include <utility>
#include <vector>

namespace kermit {

enum class Action {
    NONE,
    COLLECT_DATA,
    GENERATE_MAP,
    VERSION,
};

struct CommandLine {
    Action action = Action::NONE;
    bool help = false;
    std::string config_file;
    log::Level log_level = log::Level::INFO;

    /// Setting flags in the order given, as (flag, value); switches have no value
    std::vector<std::pair<std::string, std::string>> settings;
};

/// INVALID_CONFIG for unknown actions/options or a missing option value
api::Result<CommandLine> parse_command_line(int argc, const char* const argv[]);

/// INVALID_CONFIG naming the flag when a value does not parse
api::Result<void> apply_settings(const CommandLine& cmd, api::SurveyConfig& config);

void print_usage(const char* program);

} // namespace kermit

#endif
