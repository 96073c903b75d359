/**
 * @file
 * @brief This file contains functions for loading subsections of the main JSON file
 */
#pragma once
#include "configuration.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace sstar::input {
/// @brief Check the schema version and throw if invalid
/// @param j The root JSON object
/// @throw ConfigurationError: If version attribute is not present or invalid
void check_version(const nlohmann::json &j);

/// @brief Load input fact relation and codebook files
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load input files
void load_input_info(const nlohmann::json &j, Configuration &config);

/// @brief Load fact relation schema section of JSON object
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load schema section
void load_schema_info(const nlohmann::json &j, Configuration &config);

/// @brief Load bucket columns section of JSON object, optional
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load buckets section
void load_buckets_info(const nlohmann::json &j, Configuration &config);

/// @brief Load analysis section of JSON object
/// @param j The root JSON object
/// @param config The config object to update
/// @throw ConfigurationError: Could not load analysis section
void load_analysis_info(const nlohmann::json &j, Configuration &config);

/// @brief Load output section of JSON object
/// @param j The root JSON object
/// @param config The config object to update
/// @param output_folder Output folder, if provided via command-line argument
/// @throw ConfigurationError: Could not load output info
void load_output_info(const nlohmann::json &j, Configuration &config,
                      const std::optional<std::string> &output_folder = std::nullopt);
} // namespace sstar::input
