#pragma once

#include <optional>
#include <string>

#include "bench_config.hpp"

namespace kernelbench::config {

struct CliArgs {
    BenchConfig config;
    std::optional<std::string> config_path;
    bool show_help = false;
};

/**
 * @brief Builds the configuration from defaults, an optional --config JSON
 * file and command-line overrides, in that order of precedence
 * @throws kernelbench::ConfigError for unknown flags, missing or malformed
 * values and invalid results
 * @throws kernelbench::IOError if the config file cannot be read
 */
CliArgs parse_args(int argc, const char *const *argv);

void print_help(const char *argv0);

} // namespace kernelbench::config
