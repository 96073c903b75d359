#include "fact_projector.h"
#include "column_visitors.h"
#include "errors.h"

#include <fmt/format.h>

namespace sstar {

core::DataTable FactProjector::project(const core::DataTable &fact, const ColumnNameSet &exclude,
                                       const ColumnNameSet &required_measures) {
    for (const auto &measure : required_measures) {
        if (!fact.contains(measure)) {
            throw MissingMeasureError(measure);
        }
    }

    auto result = core::DataTable{};
    for (auto it = fact.cbegin(); it != fact.cend(); ++it) {
        const auto &column = **it;
        if (!exclude.contains(column.name())) {
            result.add(column.clone());
        }
    }

    return result;
}

std::vector<std::string> FactProjector::dimension_columns(const core::DataTable &fact,
                                                          const ColumnNameSet &measures,
                                                          const ColumnNameSet &exclude) {
    auto result = std::vector<std::string>{};
    for (const auto &name : fact.names()) {
        if (!measures.contains(name) && !exclude.contains(name)) {
            result.emplace_back(name);
        }
    }

    return result;
}

core::DataTable FactProjector::exclude_rows_with(const core::DataTable &fact,
                                                 const std::string &column,
                                                 const core::Code &sentinel) {
    auto source = fact.column_if_exists(column);
    if (!source.has_value()) {
        throw MalformedInputError("fact relation",
                                  fmt::format("sentinel column '{}' not found", column));
    }

    auto codes = read_codes(source->get());
    auto rows = std::vector<std::size_t>{};
    rows.reserve(codes.size());
    for (std::size_t i = 0; i < codes.size(); i++) {
        if (!codes[i].has_value() || codes[i].value() != sentinel) {
            rows.emplace_back(i);
        }
    }

    return fact.take(rows);
}

} // namespace sstar
