#pragma once

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "column.h"
#include "forward_type.h"
#include "visitor.h"

namespace sstar::core {

/// @brief Primitive data type DataTable columns class.
/// @tparam TYPE Column data type
template <typename TYPE> class PrimitiveDataTableColumn : public DataTableColumn {
  public:
    using value_type = TYPE;

    /// @brief Default constructor deleted to prevent empty columns
    PrimitiveDataTableColumn() = delete;

    /// @brief Initialises a new instance with name and data
    /// @param name Column name
    /// @param data Column data
    /// @throws std::invalid_argument for invalid column name
    PrimitiveDataTableColumn(std::string name, std::vector<TYPE> data)
        : name_(std::move(name)), data_(std::move(data)) {
        validate_name();
        null_bitmap_.resize(data_.size(), false);
    }

    /// @brief Initialises a new instance with name, data and null bitmap
    /// @param name Column name
    /// @param data Column data
    /// @param null_bitmap Column null values index (true means value is null)
    /// @throws std::invalid_argument for invalid column name
    /// @throws std::out_of_range for size mismatch
    PrimitiveDataTableColumn(std::string name, std::vector<TYPE> data,
                             std::vector<bool> null_bitmap)
        : name_(std::move(name)), data_(std::move(data)), null_bitmap_(std::move(null_bitmap)) {
        validate_name();
        validate_sizes();
        if (null_bitmap_.empty()) {
            null_bitmap_.resize(data_.size(), false);
        }

        null_count_ = std::count(null_bitmap_.begin(), null_bitmap_.end(), true);
    }

    std::unique_ptr<DataTableColumn> clone() const override {
        return make_column(data_, null_bitmap_);
    }

    std::unique_ptr<DataTableColumn> take(const std::vector<std::size_t> &rows) const override {
        auto data = std::vector<TYPE>{};
        auto nulls = std::vector<bool>{};
        data.reserve(rows.size());
        nulls.reserve(rows.size());
        for (const auto row : rows) {
            if (row >= size()) {
                throw std::out_of_range(fmt::format("Row index {} outside column {} of size {}.",
                                                    row, name_, size()));
            }

            data.push_back(data_[row]);
            nulls.push_back(null_bitmap_[row]);
        }

        return make_column(std::move(data), std::move(nulls));
    }

    std::string name() const noexcept override { return name_; }

    std::size_t null_count() const noexcept override { return null_count_; }

    std::size_t size() const noexcept override { return data_.size(); }

    bool is_null(std::size_t index) const noexcept override {
        if (index >= size()) {
            return true; // Out of bounds indices are treated as null
        }

        return null_bitmap_[index];
    }

    bool is_valid(std::size_t index) const noexcept override { return !is_null(index); }

    const std::any value(std::size_t index) const noexcept override {
        if (is_null(index)) {
            return std::any();
        }

        return data_[index];
    }

    /// @brief Gets the column value at a given index.
    /// @param index Column index
    /// @return The value at index, if inside bounds and not null; otherwise empty
    const std::optional<value_type> value_safe(const std::size_t index) const noexcept {
        if (is_null(index)) {
            return std::nullopt;
        }

        return data_[index];
    }

    /// @brief Gets the column value at a given index, unsafe without boundary checks.
    /// @param index Column index
    /// @return The value at index
    const value_type &value_unsafe(const std::size_t index) const { return data_[index]; }

  protected:
    /// @brief Creates a new column of the concrete type sharing this column name
    /// @param data The new column data
    /// @param null_bitmap The new column null values index
    /// @return The new column instance
    virtual std::unique_ptr<DataTableColumn> make_column(std::vector<TYPE> data,
                                                         std::vector<bool> null_bitmap) const = 0;

    void validate_name() const {
        if (name_.length() < 2 || !std::isalpha(static_cast<unsigned char>(name_.front()))) {
            throw std::invalid_argument(
                "Invalid column name: minimum length of two and start with alpha character.");
        }

        if (std::any_of(name_.begin(), name_.end(),
                        [](char c) { return std::isspace(static_cast<unsigned char>(c)); })) {
            throw std::invalid_argument("Invalid column name: must not contain spaces.");
        }
    }

    void validate_sizes() const {
        if (!null_bitmap_.empty() && data_.size() != null_bitmap_.size()) {
            throw std::out_of_range(
                "Input vectors size mismatch, the data and null vectors size must be the same.");
        }
    }

  private:
    std::string name_;
    std::vector<TYPE> data_;
    std::vector<bool> null_bitmap_{};
    std::size_t null_count_ = 0;
};

} // namespace sstar::core
