#pragma once

#include "diagnostics.h"
#include "dimension_table.h"
#include "weighted_aggregator.h"

#include "SurveyStar.Core/datatable.h"

#include <string>
#include <vector>

namespace sstar {

/// @brief Weighted access statistics of a single dimension
struct DimensionAnalysis {
    /// @brief The grouping dimension column name
    std::string dimension;

    /// @brief The aggregation result, labelled when a dimension table exists
    AggregationResult result;

    /// @brief The dimension key findings
    DimensionSummary summary;

    /// @brief Whether labels were merged into the statistics
    bool labelled{false};
};

/// @brief Runs the weighted aggregation over a set of independent dimensions
///
/// @details Each dimension is a pure computation over the same immutable fact
/// relation, the dimensions are evaluated in parallel. Bucket columns must be
/// appended to the fact relation before running.
class AccessAnalysis {
  public:
    AccessAnalysis() = delete;

    /// @brief Initialises a new instance of the AccessAnalysis class.
    /// @param options The aggregation options, the group column is set per dimension
    /// @param log The diagnostics log
    AccessAnalysis(AggregationOptions options, DiagnosticLog &log);

    /// @brief Gets the aggregation options
    /// @return The options
    const AggregationOptions &options() const noexcept;

    /// @brief Runs the analysis
    /// @param fact The fact relation
    /// @param dimensions The grouping columns to analyse
    /// @param tables The available dimension tables for label merging
    /// @return The analyses in requested order, dimensions not in the fact relation are skipped.
    /// @throws MalformedInputError for weight or condition columns not found.
    std::vector<DimensionAnalysis> run(const core::DataTable &fact,
                                       const std::vector<std::string> &dimensions,
                                       const std::vector<DimensionTable> &tables) const;

  private:
    AggregationOptions options_;
    DiagnosticLog &log_;
};

} // namespace sstar
