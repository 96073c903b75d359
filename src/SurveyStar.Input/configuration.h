/**
 * @file
 * @brief Main header file for functionality related to loading config files
 *
 * This file contains definitions for the main functions required to load JSON-formatted
 * configuration files from disk and to create the engine options from them.
 */
#pragma once

#include "poco.h"

#include "SurveyStar.Core/forward_type.h"
#include "SurveyStar/bucketizer.h"
#include "SurveyStar/diagnostics.h"
#include "SurveyStar/star_schema.h"
#include "SurveyStar/weighted_aggregator.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace sstar::input {

/// @brief Defines the application configuration data structure
struct Configuration {
    /// @brief The root path for configuration files
    std::filesystem::path root_path;

    /// @brief The fact relation data file details
    FileInfo file;

    /// @brief The JSON codebook file full path
    std::filesystem::path codebook;

    /// @brief The fact relation measures and excluded columns
    SchemaInfo schema;

    /// @brief The derived bucket columns
    BucketsInfo buckets;

    /// @brief The weighted access analysis
    AnalysisInfo analysis;

    /// @brief Results output folder and report information
    OutputInfo output;

    /// @brief Application logging verbosity mode
    core::VerboseMode verbosity{};

    /// @brief Application name
    const char *app_name = PROJECT_NAME;

    /// @brief Application version
    const char *app_version = PROJECT_VERSION;
};

/// @brief Represents an error that occurred with the format of a config file
class ConfigurationError : public std::runtime_error {
  public:
    ConfigurationError(const std::string &msg);
};

/// @brief Loads the input configuration file, *.json, information
/// @param config_file Path to config file
/// @param output_folder Output folder, overrides the config file value if provided
/// @param verbose Set log verbosity
/// @return The configuration file information
/// @throw ConfigurationError: Error loading config file
Configuration get_configuration(const std::filesystem::path &config_file,
                                const std::optional<std::string> &output_folder, bool verbose);

/// @brief Creates the star schema building options from configuration
/// @param config The configuration instance
/// @return The star schema options
StarSchemaOptions create_schema_options(const Configuration &config);

/// @brief Creates the weighted aggregation options from configuration
/// @param config The configuration instance
/// @return The aggregation options, without group column
/// @throw ConfigurationError: Unknown zero weight policy or sort order
AggregationOptions create_aggregation_options(const Configuration &config);

/// @brief Creates a fixed-edge bucketizer from its definition
/// @param info The bucket column definition
/// @return The fixed-edge bucketizer
/// @throw ConfigurationError: Invalid bands definition
FixedEdgeBucketizer create_fixed_bucketizer(const FixedBucketInfo &info);

/// @brief Creates a quantile bucketizer from its definition
/// @param info The bucket column definition
/// @return The quantile bucketizer
/// @throw ConfigurationError: Invalid quantiles, labels or fallback definition
QuantileBucketizer create_quantile_bucketizer(const QuantileBucketInfo &info);

/// @brief Creates the fact relation of the analysis with the derived bucket columns
///
/// @details Rows carrying the condition missing-data sentinel are removed first, so the
/// sentinel rows never take part in the quantile edges computation.
///
/// @param fact The star schema fact relation
/// @param config The configuration instance
/// @param log The pipeline diagnostics log
/// @return The analysis fact relation
/// @throw ConfigurationError: Invalid bucket column definition
/// @throw MalformedInputError: Sentinel or bucket source column not found
core::DataTable create_analysis_fact(const core::DataTable &fact, const Configuration &config,
                                     DiagnosticLog &log);

} // namespace sstar::input
