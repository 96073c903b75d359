#pragma once

#include "diagnostics.h"

#include "SurveyStar.Core/datatable.h"
#include "SurveyStar.Core/interval.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sstar {

/// @brief Fixed-edge bucket definition, inclusive range and label
struct BucketBand {
    /// @brief The inclusive values range
    core::DoubleInterval range;

    /// @brief The bucket label
    std::string label;
};

/// @brief Gets the default age bands: 0-18, 19-25, 26-35, 36-50, 51-65 and 65+
/// @return The age bands definition
std::vector<BucketBand> default_age_bands();

/// @brief Assigns continuous values to fixed-edge buckets
///
/// @details Negative values are clamped to zero, the first band containing the
/// value wins. Values outside all bands and missing values are assigned to the
/// unknown label.
class FixedEdgeBucketizer {
  public:
    /// @brief Initialises a new instance of the FixedEdgeBucketizer class.
    /// @param bands The ordered bucket bands
    /// @param unknown_label The label of values outside all bands
    /// @throws std::invalid_argument for empty bands.
    explicit FixedEdgeBucketizer(std::vector<BucketBand> bands,
                                 std::string unknown_label = "Unknown");

    /// @brief Gets the bucket bands
    /// @return The bands definition
    const std::vector<BucketBand> &bands() const noexcept;

    /// @brief Gets the label of values outside all bands
    /// @return The unknown label
    const std::string &unknown_label() const noexcept;

    /// @brief Gets the ordered bucket labels, including the unknown label
    /// @return The distinct labels
    std::vector<std::string> labels() const;

    /// @brief Assigns a single value to its bucket
    /// @param value The value to assign
    /// @return The bucket label
    std::string assign(std::optional<double> value) const;

    /// @brief Assigns a sequence of values to their buckets
    /// @param values The values to assign
    /// @return The bucket labels, one per value
    std::vector<std::string> assign(const std::vector<std::optional<double>> &values) const;

  private:
    std::vector<BucketBand> bands_;
    std::string unknown_label_;
};

/// @brief Fallback absolute band, right-inclusive upper edge and label
struct FallbackBand {
    /// @brief The inclusive upper edge, infinity for the last band
    double upper_edge{};

    /// @brief The band label
    std::string label;
};

/// @brief Gets the default income fallback bands, spanning negative to infinity
/// @return The fallback bands definition
std::vector<FallbackBand> default_fallback_bands();

/// @brief Quantile bucketing configuration
struct QuantileBucketOptions {
    /// @brief Number of quantile buckets for the strictly positive values
    std::size_t quantiles{7};

    /// @brief Quantile bucket labels, one per quantile
    std::vector<std::string> labels{"Very Low Income", "Low Income", "Lower Middle", "Middle",
                                    "Upper Middle",    "High",       "Very High"};

    /// @brief Label of the zero values
    std::string zero_label{"No Income"};

    /// @brief Label of missing values
    std::string missing_label{"Unknown"};

    /// @brief Bands used when quantile bucketing is not feasible
    std::vector<FallbackBand> fallback{default_fallback_bands()};
};

/// @brief Bucketing strategy taken enumeration
enum class BucketingPath : uint8_t {
    /// @brief Quantile buckets computed from the data
    quantile,

    /// @brief Fixed fallback bands
    fallback
};

/// @brief Converts a bucketing path to its string representation
/// @param path The path to convert
/// @return The path name
std::string to_string(BucketingPath path);

/// @brief Quantile bucketing result
struct BucketingResult {
    /// @brief The path taken to assign the buckets
    BucketingPath path{BucketingPath::quantile};

    /// @brief The bucket labels, one per input value
    std::vector<std::string> labels;

    /// @brief The ordered labels that the path can produce
    std::vector<std::string> categories;

    /// @brief The collapsed quantile edges, empty for the fallback path
    std::vector<double> edges;
};

/// @brief Assigns continuous values to quantile buckets with a deterministic fallback
///
/// @details Values are clamped to zero, zero values receive the zero label and
/// are held out of the quantiles. The strictly positive values are cut at
/// linearly interpolated quantile edges, duplicated edges are collapsed and
/// the first labels used. When the positive values have fewer distinct values
/// than quantiles, the fixed fallback bands are used instead.
class QuantileBucketizer {
  public:
    /// @brief Initialises a new instance of the QuantileBucketizer class with default options.
    QuantileBucketizer();

    /// @brief Initialises a new instance of the QuantileBucketizer class.
    /// @param options The bucketing options
    /// @throws std::invalid_argument for invalid options.
    explicit QuantileBucketizer(QuantileBucketOptions options);

    /// @brief Gets the bucketing options
    /// @return The options
    const QuantileBucketOptions &options() const noexcept;

    /// @brief Attempts to compute the quantile edges of strictly positive values
    /// @param positive The strictly positive values, any order
    /// @return The collapsed edges, if feasible; otherwise, empty.
    std::optional<std::vector<double>> try_quantile_edges(std::vector<double> positive) const;

    /// @brief Assigns a clamped value to its fallback band
    /// @param value The value to assign
    /// @return The fallback band label
    const std::string &fallback(double value) const;

    /// @brief Assigns a sequence of values to their buckets
    /// @param values The values to assign, empty for missing values
    /// @return The bucketing result
    BucketingResult assign(const std::vector<std::optional<double>> &values) const;

  private:
    QuantileBucketOptions options_;
};

/// @brief Appends a fixed-edge bucket labels column to a table
/// @param table The table to modify
/// @param source The source measure column name
/// @param target The new labels column name
/// @param bucketizer The fixed-edge bucketizer
/// @throws MalformedInputError if the source column is not found.
/// @throws std::invalid_argument if the target column already exists.
void add_bucket_column(core::DataTable &table, const std::string &source,
                       const std::string &target, const FixedEdgeBucketizer &bucketizer);

/// @brief Appends a quantile bucket labels column to a table
/// @param table The table to modify
/// @param source The source measure column name
/// @param target The new labels column name
/// @param bucketizer The quantile bucketizer
/// @param log The diagnostics log, records fallback path warnings
/// @return The path taken to assign the buckets
/// @throws MalformedInputError if the source column is not found.
/// @throws std::invalid_argument if the target column already exists.
BucketingPath add_bucket_column(core::DataTable &table, const std::string &source,
                                const std::string &target, const QuantileBucketizer &bucketizer,
                                DiagnosticLog &log);

} // namespace sstar
