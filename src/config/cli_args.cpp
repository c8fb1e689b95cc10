#include "cli_args.hpp"

#include <charconv>
#include <iostream>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

namespace kernelbench::config {

namespace {

using std::string_view;

bool starts_with(string_view s, string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

std::optional<string_view> value_for(string_view arg, string_view name) {
    if (starts_with(arg, name) && arg.size() > name.size() &&
        arg[name.size()] == '=') {
        return arg.substr(name.size() + 1);
    }
    return std::nullopt;
}

template <typename T> T parse_number(string_view sv, string_view name) {
    T value{};
    const char *first = sv.data();
    const char *last = sv.data() + sv.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        throw ConfigError(fmt::format("Invalid value for {}: '{}'", name, sv));
    }
    return value;
}

} // namespace

CliArgs parse_args(int argc, const char *const *argv) {
    CliArgs args;

    // pass 1: the config file provides defaults for the flags below
    for (int i = 1; i < argc; ++i) {
        string_view cur(argv[i]);
        if (cur == "--config") {
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for --config");
            }
            args.config_path = std::string(argv[++i]);
        } else if (auto v = value_for(cur, "--config")) {
            args.config_path = std::string(*v);
        }
    }
    if (args.config_path) {
        load_config_file(*args.config_path, args.config);
    }

    BenchConfig &cfg = args.config;

    // pass 2: command-line overrides
    for (int i = 1; i < argc; ++i) {
        string_view cur(argv[i]);
        if (cur == "--help" || cur == "-h") {
            args.show_help = true;
            continue;
        }
        if (cur == "--json") {
            cfg.json_output = true;
            continue;
        }
        if (cur == "--config") {
            ++i;
            continue;
        }
        if (starts_with(cur, "--config=")) {
            continue;
        }

        auto need_next = [&](string_view name) -> string_view {
            if (i + 1 >= argc) {
                throw ConfigError(fmt::format("Missing value for {}", name));
            }
            return string_view(argv[++i]);
        };
        auto parse_opt = [&](string_view name, auto setter) {
            if (auto v = value_for(cur, name)) {
                setter(*v);
                return true;
            }
            if (cur == name) {
                setter(need_next(name));
                return true;
            }
            return false;
        };

        if (parse_opt("--kernel", [&](string_view v) {
                cfg.kernel = parse_kernel_selection(v);
            }))
            continue;
        if (parse_opt("--strategy", [&](string_view v) {
                cfg.fractal.strategies = parse_strategies(v);
                cfg.particles.strategies = cfg.fractal.strategies;
            }))
            continue;
        if (parse_opt("--fractal-strategy", [&](string_view v) {
                cfg.fractal.strategies = parse_strategies(v);
            }))
            continue;
        if (parse_opt("--particle-strategy", [&](string_view v) {
                cfg.particles.strategies = parse_strategies(v);
            }))
            continue;
        if (parse_opt("--width", [&](string_view v) {
                cfg.fractal.desired_width = parse_number<int>(v, "--width");
            }))
            continue;
        if (parse_opt("--max-iterations", [&](string_view v) {
                cfg.fractal.max_iterations =
                    parse_number<int>(v, "--max-iterations");
            }))
            continue;
        if (parse_opt("--c-real", [&](string_view v) {
                cfg.fractal.c_real = parse_number<double>(v, "--c-real");
            }))
            continue;
        if (parse_opt("--c-imag", [&](string_view v) {
                cfg.fractal.c_imag = parse_number<double>(v, "--c-imag");
            }))
            continue;
        if (parse_opt("--expected-checksum", [&](string_view v) {
                cfg.fractal.expected_checksum =
                    parse_number<long long>(v, "--expected-checksum");
            }))
            continue;
        if (parse_opt("--fixture", [&](string_view v) {
                cfg.particles.fixture = parse_fixture(v);
            }))
            continue;
        if (parse_opt("--particles", [&](string_view v) {
                cfg.particles.fixture = ParticleFixture::Random;
                cfg.particles.count = parse_number<int>(v, "--particles");
            }))
            continue;
        if (parse_opt("--seed", [&](string_view v) {
                cfg.particles.seed = parse_number<std::uint32_t>(v, "--seed");
            }))
            continue;
        if (parse_opt("--duration", [&](string_view v) {
                cfg.particles.duration = parse_number<double>(v, "--duration");
            }))
            continue;
        if (parse_opt("--repeat", [&](string_view v) {
                cfg.repeat = parse_number<int>(v, "--repeat");
            }))
            continue;
        if (parse_opt("--log-level", [&](string_view v) {
                cfg.log_level = parse_log_level(v);
            }))
            continue;

        throw ConfigError(fmt::format("Unknown argument: {}", cur));
    }

    if (!args.show_help) {
        validate(cfg);
    }
    return args;
}

void print_help(const char *argv0) {
    std::cout
        << "kernelbench - scalar vs batch numeric kernel benchmark\n\n"
           "Usage:\n"
           "  "
        << argv0
        << " [--config file.json] [--kernel all|fractal|particles]\n"
           "       [--strategy scalar|batch|both] [--repeat N] [--json]\n"
           "       [--log-level debug|info|warn|error|off]\n\n"
           "Fractal options:\n"
           "  --width N              grid steps per axis (default 1000)\n"
           "  --max-iterations N     iteration cap (default 300)\n"
           "  --c-real X --c-imag Y  Julia parameter "
           "(default -0.62772, -0.42193)\n"
           "  --expected-checksum N  sum of counts to verify\n"
           "  --fractal-strategy S   strategy for the fractal kernel only\n\n"
           "Particle options:\n"
           "  --fixture reference|random\n"
           "  --particles N          random fixture with N particles\n"
           "  --seed N               random fixture seed (default 42)\n"
           "  --duration T           simulated time (default 0.1)\n"
           "  --particle-strategy S  strategy for the particle kernel only\n\n"
           "Config values provide defaults; command-line flags override "
           "them.\n"
           "Exit status: 0 all checks passed, 2 a check failed, 1 error.\n";
}

} // namespace kernelbench::config
