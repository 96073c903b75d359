#pragma once
#include <cstdint>
#include <type_traits>

// forward type declaration
namespace sstar::core {

/// @brief Verbosity mode enumeration
enum class VerboseMode : uint8_t {
    /// @brief only report warnings and errors
    none,

    /// @brief Print more information about actions, including progress
    verbose
};

/// @brief C++20 concept for numeric columns types
template <typename T>
concept Numerical = std::is_arithmetic_v<T>;

class Code;

class DataTable;
class DataTableColumn;

class DataTableColumnVisitor;

// Forward declarations for specialized column types
class StringDataTableColumn;
class DoubleDataTableColumn;
class IntegerDataTableColumn;

} // namespace sstar::core
