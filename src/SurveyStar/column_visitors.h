#pragma once

#include "SurveyStar.Core/code.h"
#include "SurveyStar.Core/column_numeric.h"
#include "SurveyStar.Core/visitor.h"

#include <optional>
#include <vector>

namespace sstar {

/// @brief Reads any core::DataTable column as optional double-precision values
///
/// @details Null cells are read as empty values. String cells are parsed as
/// decimal numbers, text that is not a number is read as empty.
class NumericColumnVisitor : public core::DataTableColumnVisitor {
  public:
    /// @brief Gets the values of the visited column
    /// @return The column values, one per row
    std::vector<std::optional<double>> get_values();

    void visit(const core::StringDataTableColumn &column) override;

    void visit(const core::DoubleDataTableColumn &column) override;

    void visit(const core::IntegerDataTableColumn &column) override;

  private:
    std::vector<std::optional<double>> values_;
};

/// @brief Reads any core::DataTable column as optional core::Code values
///
/// @details Integer cells become numeric codes, double cells are converted with
/// core::Code::from_value and string cells with core::Code::parse. Null cells
/// are read as empty values.
class CodeColumnVisitor : public core::DataTableColumnVisitor {
  public:
    /// @brief Gets the codes of the visited column
    /// @return The column codes, one per row
    std::vector<std::optional<core::Code>> get_codes();

    void visit(const core::StringDataTableColumn &column) override;

    void visit(const core::DoubleDataTableColumn &column) override;

    void visit(const core::IntegerDataTableColumn &column) override;

  private:
    std::vector<std::optional<core::Code>> codes_;
};

/// @brief Reads a column as optional double-precision values
/// @param column The column to read
/// @return The column values, one per row
std::vector<std::optional<double>> read_numeric(const core::DataTableColumn &column);

/// @brief Reads a column as optional core::Code values
/// @param column The column to read
/// @return The column codes, one per row
std::vector<std::optional<core::Code>> read_codes(const core::DataTableColumn &column);

} // namespace sstar
