#pragma once
#include <cctype>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "column_numeric.h"

namespace sstar::core {

/// @brief Primitive data type DataTable column builder class
/// @tparam ColumnType The column type to build
template <typename ColumnType> class PrimitiveDataTableColumnBuilder {

  public:
    using value_type = typename ColumnType::value_type;

    PrimitiveDataTableColumnBuilder() = delete;

    /// @brief Initialise a new instance of the PrimitiveDataTableColumnBuilder class.
    /// @param name The column name
    /// @throws std::invalid_argument for invalid column name
    explicit PrimitiveDataTableColumnBuilder(std::string name) : name_{std::move(name)} {
        if (name_.length() < 2 || !std::isalpha(static_cast<unsigned char>(name_.front()))) {
            throw std::invalid_argument(
                "Invalid column name: minimum length of two and start with alpha character.");
        }
    }

    /// @brief Gets the column name
    /// @return Column name
    std::string name() const { return name_; }

    /// @brief Gets the column data size
    /// @return Column size
    std::size_t size() const { return data_.size(); }

    /// @brief Gets the number of null values in the column data
    /// @return Column null values count
    std::size_t null_count() const { return null_count_; }

    /// @brief Reserve builder storage capacity
    /// @param capacity new capacity, in number of elements
    void reserve(std::size_t capacity) {
        data_.reserve(capacity);
        null_bitmap_.reserve(capacity);
    }

    /// @brief Append a single null value
    void append_null() { append_null_internal(1); }

    /// @brief Append multiple null values
    /// @param count The number of null values to append
    void append_null(const std::size_t count) { append_null_internal(count); }

    /// @brief Append a single value
    /// @param value The value to append
    void append(const value_type value) {
        data_.push_back(value);
        null_bitmap_.push_back(false);
    }

    /// @brief Append a value, or a null value for an empty optional
    /// @param value The optional value to append
    void append(const std::optional<value_type> &value) {
        if (value.has_value()) {
            append(value.value());
        } else {
            append_null();
        }
    }

    /// @brief Gets the column value at a given index, no boundary checks
    /// @param index Column index
    /// @return The value at index, if inside bounds; otherwise, undefined behaviour.
    value_type value(std::size_t index) const { return data_[index]; }

    /// @brief Resets the column builder data
    void reset() {
        data_.clear();
        null_bitmap_.clear();
        null_count_ = 0;
    }

    /// @brief Builds the column with current data
    /// @return The new column instance
    [[nodiscard]] std::unique_ptr<ColumnType> build() {
        if (null_count_ > 0) {
            return std::make_unique<ColumnType>(std::move(name_), std::move(data_),
                                                std::move(null_bitmap_));
        }

        // Full vector, no need for null bitmap
        return std::make_unique<ColumnType>(std::move(name_), std::move(data_));
    }

  private:
    std::string name_;
    std::vector<value_type> data_{};
    std::vector<bool> null_bitmap_{};
    std::size_t null_count_ = 0;

    void append_null_internal(const std::size_t length) {
        null_count_ += length;
        data_.insert(data_.end(), length, value_type{});
        null_bitmap_.insert(null_bitmap_.end(), length, true);
    }
};

/// @brief Builder for DataTable columns storing @c string data type class
using StringDataTableColumnBuilder = PrimitiveDataTableColumnBuilder<StringDataTableColumn>;

/// @brief Builder for DataTable columns storing @c double data type class
using DoubleDataTableColumnBuilder = PrimitiveDataTableColumnBuilder<DoubleDataTableColumn>;

/// @brief Builder for DataTable columns storing @c integer data type class
using IntegerDataTableColumnBuilder = PrimitiveDataTableColumnBuilder<IntegerDataTableColumn>;
} // namespace sstar::core
