#include "configuration.h"
#include "configuration_parsing.h"
#include "jsonparser.h"

#include "SurveyStar.Core/scoped_timer.h"
#include "SurveyStar.Core/string_util.h"
#include "SurveyStar/fact_projector.h"

#include <fmt/color.h>

#include <fstream>
#include <limits>

#if USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    sstar::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace sstar::input {
using json = nlohmann::json;

ConfigurationError::ConfigurationError(const std::string &msg) : std::runtime_error{msg} {}

Configuration get_configuration(const std::filesystem::path &config_file,
                                const std::optional<std::string> &output_folder, bool verbose) {
    MEASURE_FUNCTION();
    bool success = true;

    Configuration config;
    config.verbosity = verbose ? core::VerboseMode::verbose : core::VerboseMode::none;

    std::ifstream ifs(config_file, std::ifstream::in);
    if (!ifs) {
        throw ConfigurationError{
            fmt::format("Configuration file: {} not found", config_file.string())};
    }

    json opt;
    try {
        opt = json::parse(ifs);
    } catch (const json::parse_error &e) {
        throw ConfigurationError{fmt::format("Could not parse configuration file: {}", e.what())};
    }

    check_version(opt);

    // Base dir for relative paths
    config.root_path = std::filesystem::absolute(config_file).parent_path();

    // Input fact relation and codebook
    try {
        load_input_info(opt, config);
        fmt::print("Fact relation file: {}\n", config.file.name.string());
        fmt::print("Codebook file.....: {}\n", config.codebook.string());
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load input files: {}\n", e.what());
    }

    try {
        load_schema_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load schema info: {}\n", e.what());
    }

    try {
        load_buckets_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load buckets info: {}\n", e.what());
    }

    try {
        load_analysis_info(opt, config);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load analysis info: {}\n", e.what());
    }

    try {
        load_output_info(opt, config, output_folder);
    } catch (const ConfigurationError &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load output info: {}\n", e.what());
    }

    if (!success) {
        throw ConfigurationError{"Error loading config file"};
    }

    return config;
}

StarSchemaOptions create_schema_options(const Configuration &config) {
    auto options = StarSchemaOptions{};
    options.measures.insert(config.schema.measures.cbegin(), config.schema.measures.cend());
    options.exclude.insert(config.schema.exclude.cbegin(), config.schema.exclude.cend());
    return options;
}

AggregationOptions create_aggregation_options(const Configuration &config) {
    const auto &info = config.analysis;
    auto options = AggregationOptions{.weight_column = info.weight,
                                      .condition_column = info.condition.column,
                                      .condition_value = info.condition.value,
                                      .missing_sentinel = info.condition.missing_sentinel};

    if (core::case_insensitive::equals(info.zero_weight, "report_zero")) {
        options.zero_weight = ZeroWeightPolicy::report_zero;
    } else if (core::case_insensitive::equals(info.zero_weight, "omit_group")) {
        options.zero_weight = ZeroWeightPolicy::omit_group;
    } else {
        throw ConfigurationError{fmt::format("Unknown zero weight policy: {}", info.zero_weight)};
    }

    if (core::case_insensitive::equals(info.order, "descending")) {
        options.order = SortOrder::percentage_descending;
    } else if (core::case_insensitive::equals(info.order, "ascending")) {
        options.order = SortOrder::percentage_ascending;
    } else if (core::case_insensitive::equals(info.order, "group")) {
        options.order = SortOrder::group_ascending;
    } else {
        throw ConfigurationError{fmt::format("Unknown statistics order: {}", info.order)};
    }

    return options;
}

FixedEdgeBucketizer create_fixed_bucketizer(const FixedBucketInfo &info) {
    auto bands = std::vector<BucketBand>{};
    bands.reserve(info.bands.size());
    for (const auto &band : info.bands) {
        bands.emplace_back(BucketBand{.range = band.range, .label = band.label});
    }

    try {
        return FixedEdgeBucketizer{std::move(bands), info.unknown_label};
    } catch (const std::invalid_argument &e) {
        throw ConfigurationError{e.what()};
    }
}

QuantileBucketizer create_quantile_bucketizer(const QuantileBucketInfo &info) {
    auto options = QuantileBucketOptions{.quantiles = info.quantiles,
                                         .labels = info.labels,
                                         .zero_label = info.zero_label,
                                         .missing_label = info.missing_label,
                                         .fallback = {}};

    for (const auto &band : info.fallback) {
        options.fallback.emplace_back(FallbackBand{
            .upper_edge = band.upper.value_or(std::numeric_limits<double>::infinity()),
            .label = band.label});
    }

    try {
        return QuantileBucketizer{std::move(options)};
    } catch (const std::invalid_argument &e) {
        throw ConfigurationError{e.what()};
    }
}

core::DataTable create_analysis_fact(const core::DataTable &fact, const Configuration &config,
                                     DiagnosticLog &log) {
    const auto &condition = config.analysis.condition;
    auto result = condition.missing_sentinel.has_value()
                      ? FactProjector::exclude_rows_with(fact, condition.column,
                                                         condition.missing_sentinel.value())
                      : fact;

    if (result.num_rows() < fact.num_rows()) {
        log.info("Configuration", fmt::format("Excluded {} row(s) with {} missing sentinel {}.",
                                              fact.num_rows() - result.num_rows(),
                                              condition.column,
                                              condition.missing_sentinel->to_string()));
    }

    for (const auto &info : config.buckets.fixed) {
        add_bucket_column(result, info.source, info.target, create_fixed_bucketizer(info));
    }

    for (const auto &info : config.buckets.quantile) {
        add_bucket_column(result, info.source, info.target, create_quantile_bucketizer(info), log);
    }

    return result;
}

} // namespace sstar::input
