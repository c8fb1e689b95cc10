#include <iostream>

#include <fmt/format.h>

#include "bench/runner.hpp"
#include "config/cli_args.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

namespace {

constexpr int exit_check_failed = 2;

int run(int argc, char **argv) {
    auto args = kernelbench::config::parse_args(argc, argv);
    if (args.show_help) {
        kernelbench::config::print_help(argv[0]);
        return 0;
    }

    kernelbench::Logger::set_level(args.config.log_level);
    if (args.config_path) {
        LOG_INFO("Loaded configuration from: " + *args.config_path);
    }
    LOG_INFO(fmt::format("Starting kernelbench (kernel={}, repeat={})",
                         kernelbench::config::to_string(args.config.kernel),
                         args.config.repeat));

    kernelbench::bench::BenchmarkRunner runner(args.config);
    const auto report = runner.run();

    if (args.config.json_output) {
        std::cout << kernelbench::bench::to_json(report).dump(2) << std::endl;
    } else {
        std::cout << kernelbench::bench::format_text(report);
    }

    if (!report.ok()) {
        LOG_ERROR("One or more result checks failed");
        return exit_check_failed;
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    try {
        return run(argc, argv);
    } catch (const kernelbench::KernelBenchException &e) {
        LOG_ERROR(std::string(e.what()));
        std::cerr << "Error: " << e.what() << "\nUse --help for usage."
                  << std::endl;
        return 1;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: " + std::string(e.what()));
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
