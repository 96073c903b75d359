#pragma once

#include "codebook.h"
#include "diagnostics.h"
#include "dimension_table.h"
#include "fact_projector.h"

#include "SurveyStar.Core/datatable.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sstar {

/// @brief Dimensional model of a survey extract, one fact relation and its dimension tables
struct StarSchema {
    /// @brief The projected fact relation
    core::DataTable fact;

    /// @brief The dimension tables, in fact column order
    std::vector<DimensionTable> dimensions;

    /// @brief Finds the dimension table of a variable
    /// @param variable The variable name, case-insensitive
    /// @return The dimension table, if found; otherwise, empty.
    std::optional<std::reference_wrapper<const DimensionTable>>
    dimension(const std::string &variable) const;

    /// @brief Creates a string representation of the schema structure
    /// @return The structure string representation
    std::string to_string() const;
};

/// @brief Star schema building configuration
struct StarSchemaOptions {
    /// @brief The measure columns, must be present in the fact relation
    ColumnNameSet measures;

    /// @brief The columns dropped from the fact relation
    ColumnNameSet exclude;
};

/// @brief Builds the dimensional model of a raw survey extract
class StarSchemaBuilder {
  public:
    StarSchemaBuilder() = delete;

    /// @brief Initialises a new instance of the StarSchemaBuilder class.
    /// @param options The building options
    /// @param log The diagnostics log
    StarSchemaBuilder(StarSchemaOptions options, DiagnosticLog &log);

    /// @brief Gets the building options
    /// @return The options
    const StarSchemaOptions &options() const noexcept;

    /// @brief Builds the star schema of a raw fact relation
    /// @param raw_fact The raw fact relation
    /// @param codebook The codebook index
    /// @return The star schema
    /// @throws MissingMeasureError for a measure not found in the fact relation.
    StarSchema build(const core::DataTable &raw_fact, const CodebookIndex &codebook) const;

  private:
    StarSchemaOptions options_;
    DiagnosticLog &log_;
};

} // namespace sstar
