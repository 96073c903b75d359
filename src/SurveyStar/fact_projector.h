#pragma once

#include "SurveyStar.Core/code.h"
#include "SurveyStar.Core/datatable.h"
#include "SurveyStar.Core/string_util.h"

#include <set>
#include <string>
#include <vector>

namespace sstar {

/// @brief Column names set type, case-insensitive
using ColumnNameSet = std::set<std::string, core::case_insensitive::comparator>;

/// @brief Produces the retained fact relation of a pipeline stage
class FactProjector {
  public:
    /// @brief Creates a new fact relation without the excluded columns
    /// @param fact The source fact relation
    /// @param exclude The columns to drop, absent columns are ignored
    /// @param required_measures The columns that must be present
    /// @return The projected fact relation
    /// @throws MissingMeasureError for a required measure not found in the fact relation.
    static core::DataTable project(const core::DataTable &fact, const ColumnNameSet &exclude,
                                   const ColumnNameSet &required_measures);

    /// @brief Gets the coded variables of a fact relation
    /// @param fact The fact relation
    /// @param measures The measure columns
    /// @param exclude The excluded columns
    /// @return The column names that are neither measures nor excluded, in table order
    static std::vector<std::string> dimension_columns(const core::DataTable &fact,
                                                      const ColumnNameSet &measures,
                                                      const ColumnNameSet &exclude);

    /// @brief Creates a new fact relation without the rows carrying a sentinel code
    /// @param fact The source fact relation
    /// @param column The column holding the sentinel
    /// @param sentinel The missing-data sentinel code
    /// @return The filtered fact relation, null cells are kept
    /// @throws MalformedInputError if the column is not found.
    static core::DataTable exclude_rows_with(const core::DataTable &fact,
                                             const std::string &column,
                                             const core::Code &sentinel);
};

} // namespace sstar
