#pragma once

#include "SurveyStar.Core/datatable.h"
#include "SurveyStar/access_analysis.h"
#include "SurveyStar/dimension_table.h"

#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <vector>

namespace sstar::input {

/// @brief Writes a dimension table as CSV: `<VAR>,<VAR>_value,<VAR>_desc`
/// @param stream The output stream
/// @param table The dimension table
void write_dimension_csv(std::ostream &stream, const DimensionTable &table);

/// @brief Writes a dimension analysis statistics as CSV
/// @param stream The output stream
/// @param analysis The dimension analysis
void write_statistics_csv(std::ostream &stream, const DimensionAnalysis &analysis);

/// @brief Writes a fact relation as CSV, null cells are empty
/// @param stream The output stream
/// @param fact The fact relation
void write_fact_csv(std::ostream &stream, const core::DataTable &fact);

/// @brief Writes the Markdown summary report of the analysed dimensions
/// @param stream The output stream
/// @param title The report title
/// @param analyses The dimension analyses
void write_markdown_report(std::ostream &stream, const std::string &title,
                           const std::vector<DimensionAnalysis> &analyses);

/// @brief Defines the pipeline results writer interface
class ResultWriter {
  public:
    /// @brief Destroys a ResultWriter instance
    virtual ~ResultWriter() = default;

    /// @brief Writes a dimension table
    /// @param table The dimension table
    virtual void write(const DimensionTable &table) = 0;

    /// @brief Writes a dimension analysis statistics
    /// @param analysis The dimension analysis
    virtual void write(const DimensionAnalysis &analysis) = 0;

    /// @brief Writes the projected fact relation
    /// @param fact The fact relation
    virtual void write(const core::DataTable &fact) = 0;

    /// @brief Writes the summary report of the analysed dimensions
    /// @param analyses The dimension analyses
    virtual void write_report(const std::vector<DimensionAnalysis> &analyses) = 0;
};

/// @brief Implements the results writer for files in an output folder
class ResultFileWriter final : public ResultWriter {
  public:
    ResultFileWriter() = delete;

    /// @brief Initialises a new instance of the ResultFileWriter class.
    /// @param folder The output folder, created if not found
    /// @param title The summary report title
    /// @throws std::invalid_argument if the output folder cannot be created.
    ResultFileWriter(std::filesystem::path folder, std::string title);

    /// @brief Gets the output folder
    /// @return The folder full path
    const std::filesystem::path &folder() const noexcept;

    /// @brief Gets the files written so far
    /// @return The written files full path
    const std::vector<std::filesystem::path> &files() const noexcept;

    void write(const DimensionTable &table) override;

    void write(const DimensionAnalysis &analysis) override;

    void write(const core::DataTable &fact) override;

    void write_report(const std::vector<DimensionAnalysis> &analyses) override;

  private:
    std::filesystem::path folder_;
    std::string title_;
    std::vector<std::filesystem::path> files_;

    std::ofstream open(const std::string &file_name);
};

} // namespace sstar::input
