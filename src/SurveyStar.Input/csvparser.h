#pragma once

#include "poco.h"

#include "SurveyStar.Core/datatable.h"

namespace sstar::input {

/// @brief Populates a datatable with the fact relation data file contents
///
/// @details Only the configured columns are loaded, with the configured type:
/// integer, double or string. Empty cells are loaded as null values.
///
/// @param file_info The fact relation data file information object
/// @return The populated datatable
/// @throws MalformedInputError for configured columns not found, unknown column
/// types or cells that cannot be converted to the column type.
core::DataTable load_datatable_from_csv(const FileInfo &file_info);

} // namespace sstar::input
