#pragma once

#include "SurveyStar.Core/forward_type.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace sstar {

/// @brief Diagnostic record severity enumeration
enum class DiagnosticLevel : uint8_t {
    /// @brief General notification and progress message
    info,

    /// @brief Recoverable condition, the output shape reflects it
    warning,

    /// @brief Fatal condition reporting message
    error
};

/// @brief Converts a diagnostic level to its string representation
/// @param level The level to convert
/// @return The level name
std::string to_string(DiagnosticLevel level);

/// @brief Defines a single diagnostic entry raised while processing a pipeline stage
struct DiagnosticRecord {
    /// @brief The record severity
    DiagnosticLevel level{DiagnosticLevel::info};

    /// @brief The component that raised the record
    std::string source;

    /// @brief The record message
    std::string message;

    /// @brief Create a string representation of this instance
    /// @return The string representation
    std::string to_string() const;
};

/// @brief Thread-safe collector of pipeline diagnostic records
///
/// @details Engine components never print directly, recoverable conditions are
/// recorded here instead. When echo is enabled, warnings and errors are printed
/// to the console in colour as they arrive, info records only in verbose mode.
class DiagnosticLog {
  public:
    /// @brief Initialises a new instance of the DiagnosticLog class, silent.
    DiagnosticLog() = default;

    /// @brief Initialises a new instance of the DiagnosticLog class.
    /// @param verbosity The console echo verbosity
    /// @param echo Whether to echo records to the console
    explicit DiagnosticLog(core::VerboseMode verbosity, bool echo = true);

    DiagnosticLog(const DiagnosticLog &) = delete;
    DiagnosticLog &operator=(const DiagnosticLog &) = delete;
    DiagnosticLog(DiagnosticLog &&) = delete;
    DiagnosticLog &operator=(DiagnosticLog &&) = delete;
    ~DiagnosticLog() = default;

    /// @brief Adds a new diagnostic record to the log
    /// @param record The record to add
    void add(DiagnosticRecord record);

    /// @brief Adds an info level record
    /// @param source The record source
    /// @param message The record message
    void info(std::string source, std::string message);

    /// @brief Adds a warning level record
    /// @param source The record source
    /// @param message The record message
    void warning(std::string source, std::string message);

    /// @brief Adds an error level record
    /// @param source The record source
    /// @param message The record message
    void error(std::string source, std::string message);

    /// @brief Gets a snapshot of the records in arrival order
    /// @return The records collection
    std::vector<DiagnosticRecord> records() const;

    /// @brief Gets the number of records with a given level
    /// @param level The level to count
    /// @return The number of records
    std::size_t count(DiagnosticLevel level) const;

    /// @brief Gets the total number of records
    /// @return The number of records
    std::size_t size() const;

    /// @brief Determines whether any error level record has been added
    /// @return true if the log has errors; otherwise, false.
    bool has_errors() const;

    /// @brief Removes all records from the log
    void clear();

    /// @brief Gets the console echo verbosity
    /// @return The verbosity mode
    core::VerboseMode verbosity() const noexcept;

  private:
    mutable std::mutex sync_mtx_;
    core::VerboseMode verbosity_{core::VerboseMode::none};
    bool echo_{false};
    std::vector<DiagnosticRecord> records_;

    void print(const DiagnosticRecord &record) const;
};

} // namespace sstar
