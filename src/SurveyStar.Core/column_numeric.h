#pragma once

#include "column_primitive.h"

namespace sstar::core {

/// @brief DataTable column for storing string data type
class StringDataTableColumn final : public PrimitiveDataTableColumn<std::string> {
  public:
    using PrimitiveDataTableColumn<std::string>::PrimitiveDataTableColumn;

    std::string type() const noexcept override { return "string"; }

    void accept(DataTableColumnVisitor &visitor) const override { visitor.visit(*this); }

  protected:
    std::unique_ptr<DataTableColumn> make_column(std::vector<std::string> data,
                                                 std::vector<bool> null_bitmap) const override {
        return std::make_unique<StringDataTableColumn>(name(), std::move(data),
                                                       std::move(null_bitmap));
    }
};

/// @brief DataTable column for storing double data type
class DoubleDataTableColumn final : public PrimitiveDataTableColumn<double> {
  public:
    using PrimitiveDataTableColumn<double>::PrimitiveDataTableColumn;

    std::string type() const noexcept override { return "double"; }

    void accept(DataTableColumnVisitor &visitor) const override { visitor.visit(*this); }

  protected:
    std::unique_ptr<DataTableColumn> make_column(std::vector<double> data,
                                                 std::vector<bool> null_bitmap) const override {
        return std::make_unique<DoubleDataTableColumn>(name(), std::move(data),
                                                       std::move(null_bitmap));
    }
};

/// @brief DataTable column for storing integer data type
class IntegerDataTableColumn final : public PrimitiveDataTableColumn<int> {
  public:
    using PrimitiveDataTableColumn<int>::PrimitiveDataTableColumn;

    std::string type() const noexcept override { return "integer"; }

    void accept(DataTableColumnVisitor &visitor) const override { visitor.visit(*this); }

  protected:
    std::unique_ptr<DataTableColumn> make_column(std::vector<int> data,
                                                 std::vector<bool> null_bitmap) const override {
        return std::make_unique<IntegerDataTableColumn>(name(), std::move(data),
                                                        std::move(null_bitmap));
    }
};
} // namespace sstar::core
