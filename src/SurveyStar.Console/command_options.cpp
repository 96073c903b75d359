#include "command_options.h"

#include <fmt/color.h>

#include <iostream>
#include <stdexcept>

namespace sstar {

cxxopts::Options create_options() {
    cxxopts::Options options("SurveyStar.Console",
                             "SurveyStar dimensional model and weighted access analysis.");

    // clang-format off
    options.add_options()
        ("c,config", "Path to configuration file.", cxxopts::value<std::string>())
        ("o,output", "Path to output folder, overrides the configuration file.",
            cxxopts::value<std::string>())
        ("T,threads", "The maximum number of threads to create (0: no limit, default).",
            cxxopts::value<std::size_t>())
        ("verbose", "Print more information about progress",
            cxxopts::value<bool>()->default_value("false"))
        ("help", "Help for this application.")
        ("version", "Print the application version number.");
    // clang-format on

    return options;
}

std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv) {
    namespace fs = std::filesystem;

    CommandOptions cmd;
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    if (result.count("version")) {
        fmt::print("Version {}\n\n", PROJECT_VERSION);
        return std::nullopt;
    }

    cmd.verbose = result["verbose"].as<bool>();
    if (cmd.verbose) {
        fmt::print(fg(fmt::color::dark_salmon), "Verbose output enabled\n");
    }

    if (!result.count("config")) {
        throw std::runtime_error("Configuration file argument is required.");
    }

    cmd.config_file = result["config"].as<std::string>();
    if (cmd.config_file.is_relative()) {
        cmd.config_file = fs::absolute(cmd.config_file);
    }

    fmt::print("Configuration file: {}\n", cmd.config_file.string());
    if (!fs::exists(cmd.config_file)) {
        throw std::runtime_error(
            fmt::format("Configuration file: {} not found.", cmd.config_file.string()));
    }

    if (result.count("output")) {
        cmd.output_folder = result["output"].as<std::string>();
    }

    if (result.count("threads")) {
        cmd.num_threads = result["threads"].as<std::size_t>();
    }

    return cmd;
}
} // namespace sstar
