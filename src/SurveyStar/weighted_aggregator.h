#pragma once

#include "dimension_table.h"

#include "SurveyStar.Core/code.h"
#include "SurveyStar.Core/datatable.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sstar {

/// @brief Policy for groups with zero total weight
enum class ZeroWeightPolicy : uint8_t {
    /// @brief Report the group with zero percentage and population
    report_zero,

    /// @brief Leave the group out of the result
    omit_group
};

/// @brief Weighted statistics result ordering
enum class SortOrder : uint8_t {
    /// @brief Highest percentage first
    percentage_descending,

    /// @brief Lowest percentage first
    percentage_ascending,

    /// @brief Group value order
    group_ascending
};

/// @brief Weighted aggregation configuration
struct AggregationOptions {
    /// @brief The grouping column name
    std::string group_column;

    /// @brief The survey weight column name
    std::string weight_column;

    /// @brief The condition column name
    std::string condition_column;

    /// @brief The condition value counted as positive
    core::Code condition_value{std::int64_t{1}};

    /// @brief Condition code meaning "not reported", rows carrying it are excluded
    std::optional<core::Code> missing_sentinel{};

    /// @brief Zero total weight groups policy
    ZeroWeightPolicy zero_weight{ZeroWeightPolicy::report_zero};

    /// @brief The result ordering
    SortOrder order{SortOrder::percentage_descending};
};

/// @brief Weighted statistic of a single group value
struct WeightedStatistic {
    /// @brief The group value
    core::Code dimension_value;

    /// @brief Weighted percentage of the group satisfying the condition, 0..100
    double percentage{};

    /// @brief Sum of weights of all rows in the group
    double population_estimate{};

    /// @brief The group value label, empty when not labelled
    std::optional<std::string> label{};
};

/// @brief Weighted aggregation result
struct AggregationResult {
    /// @brief The statistics, one per group
    std::vector<WeightedStatistic> statistics;

    /// @brief Rows excluded for null group, weight or condition values
    std::size_t skipped_rows{};

    /// @brief Rows excluded for carrying the missing-data sentinel
    std::size_t filtered_rows{};
};

/// @brief Key findings of a dimension statistics
struct DimensionSummary {
    /// @brief The group with highest percentage
    std::optional<WeightedStatistic> highest;

    /// @brief The group with lowest percentage
    std::optional<WeightedStatistic> lowest;

    /// @brief Difference between highest and lowest percentage, percentage points
    double range{};

    /// @brief Number of groups
    std::size_t groups{};

    /// @brief Sum of the groups population estimate
    double total_population{};
};

/// @brief Computes survey-weighted percentage and population estimate per group
class WeightedAggregator {
  public:
    /// @brief Aggregates the fact relation by group
    ///
    /// @details For each group: total weight is the sum of weights of the group rows,
    /// condition weight the sum over rows with condition value, percentage is
    /// 100 * condition weight / total weight or zero when total weight is zero.
    ///
    /// @param fact The fact relation
    /// @param options The aggregation options
    /// @return The aggregation result, sorted by the options order
    /// @throws MalformedInputError for group, weight or condition columns not found.
    static AggregationResult aggregate(const core::DataTable &fact,
                                       const AggregationOptions &options);

    /// @brief Left joins statistics to a dimension table on group value
    /// @param statistics The statistics to label
    /// @param table The dimension table
    /// @return The statistics with labels, unmatched groups keep an empty label
    static std::vector<WeightedStatistic> merge_labels(std::vector<WeightedStatistic> statistics,
                                                       const DimensionTable &table);

    /// @brief Sorts statistics, ties are broken by ascending group value
    /// @param statistics The statistics to sort
    /// @param order The sort order
    static void sort(std::vector<WeightedStatistic> &statistics, SortOrder order);

    /// @brief Summarises a dimension statistics
    /// @param statistics The statistics
    /// @return The dimension key findings
    static DimensionSummary summarize(const std::vector<WeightedStatistic> &statistics);
};

} // namespace sstar
