/**
 * @file
 * @brief Functionality for parsing console application's command-line arguments
 */
#pragma once

#include <cxxopts.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace sstar {
/// @brief Defines the Command Line Interface (CLI) arguments options
struct CommandOptions {
    /// @brief The configuration file full path
    std::filesystem::path config_file;

    /// @brief The output folder where results will be saved
    std::optional<std::string> output_folder;

    /// @brief Indicates whether the application logging is verbose
    bool verbose{};

    /// @brief The maximum number of threads to use (0: no limit).
    std::size_t num_threads{};
};

/// @brief Creates the command-line interface (CLI) options
/// @return SurveyStar CLI options
cxxopts::Options create_options();

/// @brief Parses the command-line interface (CLI) arguments
/// @param options The valid CLI options
/// @param argc Number of input arguments
/// @param argv List of input arguments
/// @return User command-line options or std::nullopt if program should exit
/// @throws std::runtime_error for missing or invalid configuration file argument.
std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv);

} // namespace sstar
