#include "weighted_aggregator.h"
#include "column_visitors.h"
#include "errors.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <map>

namespace sstar {

namespace {

struct GroupWeights {
    double total{};
    double condition{};
};

const core::DataTableColumn &required_column(const core::DataTable &fact, const std::string &name,
                                             const std::string &role) {
    auto column = fact.column_if_exists(name);
    if (!column.has_value()) {
        throw MalformedInputError("fact relation",
                                  fmt::format("{} column '{}' not found", role, name));
    }

    return column->get();
}

} // namespace

AggregationResult WeightedAggregator::aggregate(const core::DataTable &fact,
                                                const AggregationOptions &options) {
    auto groups = read_codes(required_column(fact, options.group_column, "group"));
    auto weights = read_numeric(required_column(fact, options.weight_column, "weight"));
    auto conditions = read_codes(required_column(fact, options.condition_column, "condition"));

    auto result = AggregationResult{};
    auto accumulator = std::map<core::Code, GroupWeights>{};
    for (std::size_t i = 0; i < groups.size(); i++) {
        if (conditions[i].has_value() && options.missing_sentinel.has_value() &&
            conditions[i].value() == options.missing_sentinel.value()) {
            result.filtered_rows++;
            continue;
        }

        if (!groups[i].has_value() || !weights[i].has_value() || std::isnan(*weights[i]) ||
            !conditions[i].has_value()) {
            result.skipped_rows++;
            continue;
        }

        auto &group = accumulator[groups[i].value()];
        group.total += weights[i].value();
        if (conditions[i].value() == options.condition_value) {
            group.condition += weights[i].value();
        }
    }

    result.statistics.reserve(accumulator.size());
    for (const auto &[code, weight] : accumulator) {
        if (weight.total == 0.0) {
            if (options.zero_weight == ZeroWeightPolicy::report_zero) {
                result.statistics.emplace_back(WeightedStatistic{
                    .dimension_value = code, .percentage = 0.0, .population_estimate = 0.0});
            }

            continue;
        }

        result.statistics.emplace_back(
            WeightedStatistic{.dimension_value = code,
                              .percentage = 100.0 * weight.condition / weight.total,
                              .population_estimate = weight.total});
    }

    sort(result.statistics, options.order);
    return result;
}

std::vector<WeightedStatistic>
WeightedAggregator::merge_labels(std::vector<WeightedStatistic> statistics,
                                 const DimensionTable &table) {
    for (auto &item : statistics) {
        item.label = table.label_of(item.dimension_value);
    }

    return statistics;
}

void WeightedAggregator::sort(std::vector<WeightedStatistic> &statistics, SortOrder order) {
    std::sort(statistics.begin(), statistics.end(),
              [order](const WeightedStatistic &left, const WeightedStatistic &right) {
                  if (order != SortOrder::group_ascending &&
                      left.percentage != right.percentage) {
                      return order == SortOrder::percentage_descending
                                 ? left.percentage > right.percentage
                                 : left.percentage < right.percentage;
                  }

                  return left.dimension_value < right.dimension_value;
              });
}

DimensionSummary WeightedAggregator::summarize(const std::vector<WeightedStatistic> &statistics) {
    auto summary = DimensionSummary{};
    if (statistics.empty()) {
        return summary;
    }

    // ties resolve to the smallest group value, as in the sorted statistics
    auto highest = std::max_element(statistics.cbegin(), statistics.cend(),
                                    [](const auto &left, const auto &right) {
                                        if (left.percentage != right.percentage) {
                                            return left.percentage < right.percentage;
                                        }

                                        return left.dimension_value > right.dimension_value;
                                    });

    auto lowest = std::min_element(statistics.cbegin(), statistics.cend(),
                                   [](const auto &left, const auto &right) {
                                       if (left.percentage != right.percentage) {
                                           return left.percentage < right.percentage;
                                       }

                                       return left.dimension_value < right.dimension_value;
                                   });

    summary.highest = *highest;
    summary.lowest = *lowest;
    summary.range = highest->percentage - lowest->percentage;
    summary.groups = statistics.size();
    for (const auto &item : statistics) {
        summary.total_population += item.population_estimate;
    }

    return summary;
}

} // namespace sstar
