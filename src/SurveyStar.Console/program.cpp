#include "SurveyStar.Core/scoped_timer.h"
#include "SurveyStar.Core/thread_util.h"
#include "SurveyStar.Core/version.h"
#include "SurveyStar.Input/api.h"
#include "SurveyStar/api.h"
#include "command_options.h"

#include <fmt/chrono.h>
#include <fmt/color.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/task_arena.h>

namespace {
/// @brief Get a string representation of current system time
/// @return The system time as string
std::string get_time_now_str() {
    auto tp = std::chrono::system_clock::now();
    return fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", tp, tp.time_since_epoch());
}

/// @brief Prints application start-up messages
void print_app_title() {
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold,
               "\n# SurveyStar Dimensional Model and Weighted Access Analysis #\n\n");

    fmt::print("Today: {}\nEngine version: {}\nMaximum threads: {}\n\n", get_time_now_str(),
               sstar::core::Version::to_string(),
               tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism));
}

/// @brief Prints the key findings of the analysed dimensions
/// @param analyses The dimension analyses
void print_key_findings(const std::vector<sstar::DimensionAnalysis> &analyses) {
    fmt::print(fg(fmt::color::cyan), "\nKey findings:\n");
    for (const auto &analysis : analyses) {
        const auto &summary = analysis.summary;
        if (!summary.highest.has_value() || !summary.lowest.has_value()) {
            fmt::print(" - {:<16} no groups with data.\n", analysis.dimension);
            continue;
        }

        fmt::print(" - {:<16} highest: {:5.1f}%, lowest: {:5.1f}%, range: {:5.1f} points, "
                   "{} group(s).\n",
                   analysis.dimension, summary.highest->percentage, summary.lowest->percentage,
                   summary.range, summary.groups);
    }
}

/// @brief Prints the pipeline diagnostics summary
/// @param log The diagnostics log
void print_diagnostics_summary(const sstar::DiagnosticLog &log) {
    fmt::print("\nDiagnostics: {} info, {} warning(s), {} error(s).\n",
               log.count(sstar::DiagnosticLevel::info), log.count(sstar::DiagnosticLevel::warning),
               log.count(sstar::DiagnosticLevel::error));
}

/// @brief Prints application exit message
/// @param exit_code The application exit code
/// @return The respective exit code
int exit_application(int exit_code) {
    fmt::print("\n\n");
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold, "Goodbye.");
    fmt::print(" {}.\n\n", get_time_now_str());
    return exit_code;
}
} // anonymous namespace

/// @brief SurveyStar host application entry point
/// @param argc The number of command arguments
/// @param argv The list of arguments provided
/// @return The application exit code
int main(int argc, char *argv[]) { // NOLINT(bugprone-exception-escape)
    using namespace sstar;
    using namespace sstar::input;

    // Create CLI options and validate minimum arguments
    auto options = create_options();
    if (argc < 2) {
        std::cout << options.help() << '\n';
        return exit_application(EXIT_FAILURE);
    }

    std::optional<CommandOptions> cmd_args_opt;
    try {
        cmd_args_opt = parse_arguments(options, argc, argv);

        // We won't get a config if e.g. the user chooses the --help option
        if (!cmd_args_opt) {
            return EXIT_SUCCESS;
        }
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\nInvalid command line argument: {}\n", ex.what());
        fmt::print("\n{}\n", options.help());
        return exit_application(EXIT_FAILURE);
    }

    const auto &cmd_args = cmd_args_opt.value();

    // Set thread limit, 0 means no limit
    auto threads = cmd_args.num_threads > 0 ? cmd_args.num_threads
                                            : static_cast<std::size_t>(
                                                  tbb::this_task_arena::max_concurrency());
    auto thread_control =
        tbb::global_control(tbb::global_control::max_allowed_parallelism, threads);

    print_app_title();

    // Parse inputs configuration file, *.json.
    Configuration config;
    try {
        config = get_configuration(cmd_args.config_file, cmd_args.output_folder, cmd_args.verbose);
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\n\nInvalid configuration - {}.\n", ex.what());
        return exit_application(EXIT_FAILURE);
    }

    auto log = DiagnosticLog{config.verbosity};

    // Load fact relation file into a datatable asynchronous
    auto table_future = core::run_async(load_datatable_from_csv, config.file);

#ifdef CATCH_EXCEPTIONS
    try {
#endif
#if USE_TIMER
        auto pipeline_timer = core::ScopedTimer{"pipeline"};
#endif
        auto codebook = load_codebook(config.codebook);
        fmt::print("Codebook variables: {}\n", codebook.size());

        // Request input datatable instance, wait, if not completed.
        auto raw_fact = table_future.get();
        if (config.verbosity == core::VerboseMode::verbose) {
            std::cout << raw_fact;
        }

        // Dimensional model
        auto builder = StarSchemaBuilder{create_schema_options(config), log};
        auto schema = builder.build(raw_fact, codebook);

        // Sentinel rows removed before the derived bucket columns are appended
        auto fact = create_analysis_fact(schema.fact, config, log);
        fmt::print("Analysis fact rows: {} of {}\n", fact.num_rows(), schema.fact.num_rows());

        // Weighted access analysis
        fmt::print(fg(fmt::color::cyan), "\nStarting analysis of {} dimension(s) ...\n",
                   config.analysis.dimensions.size());
        auto analysis = AccessAnalysis{create_aggregation_options(config), log};
        auto results = analysis.run(fact, config.analysis.dimensions, schema.dimensions);

        // Results output
        auto writer = ResultFileWriter{config.output.folder,
                                       fmt::format("{} Access Analysis Report", config.app_name)};
        for (const auto &table : schema.dimensions) {
            writer.write(table);
        }

        writer.write(fact);
        for (const auto &item : results) {
            writer.write(item);
        }

        if (config.output.report) {
            writer.write_report(results);
        }

        print_key_findings(results);
        fmt::print(fg(fmt::color::light_green), "\nResults written: {} file(s) to {}\n",
                   writer.files().size(), writer.folder().string());
        print_diagnostics_summary(log);
#ifdef CATCH_EXCEPTIONS
    } catch (const std::exception &ex) {
        log.error(config.app_name, ex.what());
        print_diagnostics_summary(log);
        return exit_application(EXIT_FAILURE);
    }
#endif

    return exit_application(EXIT_SUCCESS);
}
