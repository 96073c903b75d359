#include "access_analysis.h"

#include "SurveyStar.Core/string_util.h"
#include "SurveyStar.Core/thread_util.h"

#include <fmt/format.h>

#include <algorithm>
#include <optional>

namespace sstar {

AccessAnalysis::AccessAnalysis(AggregationOptions options, DiagnosticLog &log)
    : options_{std::move(options)}, log_{log} {}

const AggregationOptions &AccessAnalysis::options() const noexcept { return options_; }

std::vector<DimensionAnalysis> AccessAnalysis::run(const core::DataTable &fact,
                                                   const std::vector<std::string> &dimensions,
                                                   const std::vector<DimensionTable> &tables) const {
    auto available = std::vector<std::string>{};
    for (const auto &dimension : dimensions) {
        if (fact.contains(dimension)) {
            available.emplace_back(dimension);
        } else {
            log_.warning("AccessAnalysis",
                         fmt::format("Dimension {} not found in fact relation, skipped.",
                                     dimension));
        }
    }

    auto analyses = std::vector<std::optional<DimensionAnalysis>>(available.size());
    core::parallel_for(std::size_t{0}, available.size(), [&](std::size_t index) {
        auto options = options_;
        options.group_column = available[index];

        auto analysis = DimensionAnalysis{.dimension = available[index]};
        analysis.result = WeightedAggregator::aggregate(fact, options);

        auto table = std::find_if(tables.cbegin(), tables.cend(), [&](const auto &item) {
            return core::case_insensitive::equals(item.variable(), available[index]);
        });
        if (table != tables.cend()) {
            analysis.result.statistics =
                WeightedAggregator::merge_labels(std::move(analysis.result.statistics), *table);
            analysis.labelled = table->is_labelled();
        }

        analysis.summary = WeightedAggregator::summarize(analysis.result.statistics);
        analyses[index] = std::move(analysis);
    });

    auto result = std::vector<DimensionAnalysis>{};
    result.reserve(analyses.size());
    for (auto &analysis : analyses) {
        result.emplace_back(std::move(analysis.value()));
        log_.info("AccessAnalysis",
                  fmt::format("Dimension {}: {} group(s), {} skipped row(s).",
                              result.back().dimension, result.back().result.statistics.size(),
                              result.back().result.skipped_rows));
    }

    return result;
}

} // namespace sstar
