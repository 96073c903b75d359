#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "column.h"
#include "forward_type.h"

namespace sstar::core {

/// @brief Defines the in-memory columnar table data type
///
/// @details All columns have the same number of rows; column names are unique and
/// looked up case-insensitively. The table owns its columns; copies are deep.
class DataTable {
  public:
    /// @brief DataTable columns iterator type
    using IteratorType = std::vector<std::unique_ptr<DataTableColumn>>::const_iterator;

    /// @brief Default constructor
    DataTable() = default;

    /// @brief Copy constructor - performs deep copy of all columns
    /// @param other The DataTable to copy from
    DataTable(const DataTable &other)
        : sync_mtx_(std::make_unique<std::mutex>()), names_(other.names_), index_(other.index_),
          rows_count_(other.rows_count_) {
        columns_.reserve(other.columns_.size());
        for (const auto &col : other.columns_) {
            columns_.push_back(col->clone());
        }
    }

    /// @brief Copy assignment operator - performs deep copy of all columns
    /// @param other The DataTable to copy from
    /// @return Reference to this DataTable
    DataTable &operator=(const DataTable &other) {
        if (this != &other) {
            DataTable temp(other); // Copy-and-swap idiom
            std::swap(sync_mtx_, temp.sync_mtx_);
            std::swap(names_, temp.names_);
            std::swap(index_, temp.index_);
            std::swap(columns_, temp.columns_);
            std::swap(rows_count_, temp.rows_count_);
        }
        return *this;
    }

    DataTable(DataTable &&other) noexcept = default;
    DataTable &operator=(DataTable &&other) noexcept = default;
    ~DataTable() = default;

    /// @brief Gets the number of columns
    /// @return Number of columns
    std::size_t num_columns() const noexcept;

    /// @brief Gets the number of rows
    /// @return Number of rows
    std::size_t num_rows() const noexcept;

    /// @brief Gets the collection of columns name, in insertion order
    /// @return Columns name collection
    std::vector<std::string> names() const;

    /// @brief Adds a new column to the table
    /// @param column The column to add
    /// @throws std::invalid_argument for duplicated column name or size mismatch.
    void add(std::unique_ptr<DataTableColumn> column);

    /// @brief Determines whether the table has a column with the given name
    /// @param name The column name
    /// @return true if the column exists; otherwise, false.
    bool contains(const std::string &name) const noexcept;

    /// @brief Gets the column at a given index
    /// @param index Column index
    /// @return The column instance
    /// @throws std::out_of_range for column index outside the range.
    const DataTableColumn &column(std::size_t index) const;

    /// @brief Gets the column by name
    /// @param name The column name
    /// @return The column instance
    /// @throws std::out_of_range for column name not found.
    const DataTableColumn &column(const std::string &name) const;

    /// @brief Gets the column by name, also checking if the column exists
    /// @param name The column name
    /// @return The column instance, if found; otherwise empty.
    std::optional<std::reference_wrapper<const DataTableColumn>>
    column_if_exists(const std::string &name) const;

    /// @brief Creates a new table with the selected rows of every column
    /// @param rows The zero-based row indices to select, in output order
    /// @return The new table instance
    /// @throws std::out_of_range for row indices outside the table.
    DataTable take(const std::vector<std::size_t> &rows) const;

    /// @brief Gets the iterator to the first column of the table.
    /// @return An iterator to the beginning
    IteratorType cbegin() const noexcept { return columns_.cbegin(); }

    /// @brief Gets the iterator element following the last column of the table.
    /// @return An iterator to the end
    IteratorType cend() const noexcept { return columns_.cend(); }

    /// @brief Creates a string representation of the DataTable structure
    /// @return The structure string representation
    std::string to_string() const noexcept;

  private:
    std::unique_ptr<std::mutex> sync_mtx_{std::make_unique<std::mutex>()};
    std::vector<std::string> names_{};
    std::unordered_map<std::string, std::size_t> index_{};
    std::vector<std::unique_ptr<DataTableColumn>> columns_{};
    std::size_t rows_count_ = 0;
};

} // namespace sstar::core

/// @brief Output streams operator for DataTable type.
/// @param stream The stream to output
/// @param table The DataTable instance
/// @return The output stream
std::ostream &operator<<(std::ostream &stream, const sstar::core::DataTable &table);
