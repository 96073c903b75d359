#include "star_schema.h"

#include "SurveyStar.Core/string_util.h"

#include <fmt/format.h>

#include <algorithm>
#include <sstream>

namespace sstar {

std::optional<std::reference_wrapper<const DimensionTable>>
StarSchema::dimension(const std::string &variable) const {
    auto it = std::find_if(dimensions.cbegin(), dimensions.cend(), [&variable](const auto &table) {
        return core::case_insensitive::equals(table.variable(), variable);
    });

    if (it != dimensions.cend()) {
        return std::cref(*it);
    }

    return std::nullopt;
}

std::string StarSchema::to_string() const {
    auto ss = std::stringstream{};
    ss << fmt::format("Star schema: fact {} rows x {} columns, {} dimension(s)\n", fact.num_rows(),
                      fact.num_columns(), dimensions.size());
    for (const auto &table : dimensions) {
        ss << fmt::format(" - {:<12} {:>5} code(s), {}\n", table.variable(), table.size(),
                          table.description().value_or("no definition"));
    }

    return ss.str();
}

StarSchemaBuilder::StarSchemaBuilder(StarSchemaOptions options, DiagnosticLog &log)
    : options_{std::move(options)}, log_{log} {}

const StarSchemaOptions &StarSchemaBuilder::options() const noexcept { return options_; }

StarSchema StarSchemaBuilder::build(const core::DataTable &raw_fact,
                                    const CodebookIndex &codebook) const {
    auto schema = StarSchema{};
    schema.fact = FactProjector::project(raw_fact, options_.exclude, options_.measures);

    auto variables =
        FactProjector::dimension_columns(schema.fact, options_.measures, options_.exclude);
    schema.dimensions.reserve(variables.size());
    for (const auto &variable : variables) {
        schema.dimensions.emplace_back(
            DimensionTableBuilder::build(schema.fact, variable, codebook, log_));
    }

    log_.info("StarSchemaBuilder", schema.to_string());
    return schema;
}

} // namespace sstar
