#pragma once
#include "SurveyStar.Core/code.h"
#include "SurveyStar.Core/interval.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Data structures containing the pipeline configuration options
 *
 * POCO stands for "plain old class object". These structs represent data structures
 * which are contained in JSON-formatted configuration files.
 */
namespace sstar::input {

//! Information about a data file to be loaded
struct FileInfo {
    std::filesystem::path name;
    std::string delimiter{","};
    std::map<std::string, std::string> columns;

    auto operator<=>(const FileInfo &rhs) const = default;
};

//! Fact relation measures and excluded columns
struct SchemaInfo {
    std::vector<std::string> measures;
    std::vector<std::string> exclude;

    auto operator<=>(const SchemaInfo &rhs) const = default;
};

//! Fixed-edge bucket band
struct BandInfo {
    sstar::core::DoubleInterval range;
    std::string label;

    auto operator<=>(const BandInfo &rhs) const = default;
};

//! Fixed-edge bucket column definition
struct FixedBucketInfo {
    std::string source;
    std::string target;
    std::string unknown_label{"Unknown"};
    std::vector<BandInfo> bands;

    auto operator<=>(const FixedBucketInfo &rhs) const = default;
};

//! Quantile fallback band, empty upper edge means unbounded
struct FallbackBandInfo {
    std::optional<double> upper;
    std::string label;

    auto operator<=>(const FallbackBandInfo &rhs) const = default;
};

//! Quantile bucket column definition
struct QuantileBucketInfo {
    std::string source;
    std::string target;
    std::size_t quantiles{};
    std::vector<std::string> labels;
    std::string zero_label{"No Income"};
    std::string missing_label{"Unknown"};
    std::vector<FallbackBandInfo> fallback;

    auto operator<=>(const QuantileBucketInfo &rhs) const = default;
};

//! Derived bucket columns
struct BucketsInfo {
    std::vector<FixedBucketInfo> fixed;
    std::vector<QuantileBucketInfo> quantile;

    auto operator<=>(const BucketsInfo &rhs) const = default;
};

//! Access condition column
struct ConditionInfo {
    std::string column;
    sstar::core::Code value{std::int64_t{1}};
    std::optional<sstar::core::Code> missing_sentinel;

    auto operator<=>(const ConditionInfo &rhs) const = default;
};

//! Weighted access analysis
struct AnalysisInfo {
    std::string weight;
    ConditionInfo condition;
    std::string zero_weight{"report_zero"};
    std::string order{"descending"};
    std::vector<std::string> dimensions;

    auto operator<=>(const AnalysisInfo &rhs) const = default;
};

//! Results output folder and report
struct OutputInfo {
    std::string folder;
    bool report{true};

    auto operator<=>(const OutputInfo &rhs) const = default;
};

} // namespace sstar::input
