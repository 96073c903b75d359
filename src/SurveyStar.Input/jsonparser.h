#pragma once
#include "poco.h"

#include <nlohmann/json.hpp>

namespace sstar::core {
/// @brief Reads a code from a JSON integer, number or string value
void from_json(const nlohmann::json &j, Code &p);

void to_json(nlohmann::json &j, const Code &p);

/// @brief Reads an interval from a "lower-upper" string or a [lower, upper] array
void from_json(const nlohmann::json &j, DoubleInterval &p);

void to_json(nlohmann::json &j, const DoubleInterval &p);
} // namespace sstar::core

namespace sstar::input {
/// @brief JSON parser namespace alias.
///
/// Configuration file serialisation / de-serialisation mapping specific
/// to the `JSON for Modern C++` library adopted by the project.
///
/// @sa https://github.com/nlohmann/json#arbitrary-types-conversions
/// for details about the contents and code structure in this file.
using json = nlohmann::json;

// Data file information
void to_json(json &j, const FileInfo &p);

// Fact relation schema
void to_json(json &j, const SchemaInfo &p);
void from_json(const json &j, SchemaInfo &p);

// Bucket columns
void to_json(json &j, const BandInfo &p);
void from_json(const json &j, BandInfo &p);

void to_json(json &j, const FixedBucketInfo &p);
void from_json(const json &j, FixedBucketInfo &p);

void to_json(json &j, const FallbackBandInfo &p);
void from_json(const json &j, FallbackBandInfo &p);

void to_json(json &j, const QuantileBucketInfo &p);
void from_json(const json &j, QuantileBucketInfo &p);

void to_json(json &j, const BucketsInfo &p);
void from_json(const json &j, BucketsInfo &p);

// Weighted access analysis
void to_json(json &j, const ConditionInfo &p);
void from_json(const json &j, ConditionInfo &p);

void to_json(json &j, const AnalysisInfo &p);
void from_json(const json &j, AnalysisInfo &p);

// Output information
void to_json(json &j, const OutputInfo &p);
void from_json(const json &j, OutputInfo &p);
} // namespace sstar::input
