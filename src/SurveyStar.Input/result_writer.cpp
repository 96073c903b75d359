#include "result_writer.h"

#include "SurveyStar.Core/column_numeric.h"
#include "SurveyStar.Core/string_util.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <any>
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace sstar::input {

namespace {

std::string cell_text(const core::DataTableColumn &column, std::size_t row) {
    if (column.is_null(row)) {
        return {};
    }

    auto value = column.value(row);
    if (column.type() == "integer") {
        return std::to_string(std::any_cast<int>(value));
    }

    if (column.type() == "double") {
        return fmt::format("{}", std::any_cast<double>(value));
    }

    return core::quote_field(std::any_cast<std::string>(value));
}

// Markdown table cell, a pipe or line break would split the row
std::string table_cell(const std::string &text) {
    auto result = std::string{};
    result.reserve(text.size());
    for (auto ch : text) {
        if (ch == '|') {
            result += "\\|";
        } else if (ch == '\n' || ch == '\r') {
            result += ' ';
        } else {
            result += ch;
        }
    }

    return result;
}

} // namespace

void write_dimension_csv(std::ostream &stream, const DimensionTable &table) {
    const auto &var = table.variable();
    stream << fmt::format("{0},{0}_value,{0}_desc\n", var);
    for (const auto &entry : table.entries()) {
        stream << fmt::format("{},{},{}\n", core::quote_field(entry.code.to_string()),
                              core::quote_field(entry.label.value_or("")),
                              core::quote_field(entry.description));
    }
}

void write_statistics_csv(std::ostream &stream, const DimensionAnalysis &analysis) {
    stream << "dimension_value,label,population_estimate,percentage\n";
    for (const auto &item : analysis.result.statistics) {
        stream << fmt::format("{},{},{},{}\n", core::quote_field(item.dimension_value.to_string()),
                              core::quote_field(item.label.value_or("")), item.population_estimate,
                              item.percentage);
    }
}

void write_fact_csv(std::ostream &stream, const core::DataTable &fact) {
    auto names = fact.names();
    auto header = std::vector<std::string>{};
    for (const auto &name : names) {
        header.emplace_back(core::quote_field(name));
    }

    stream << core::join_strings(",", header) << '\n';
    for (std::size_t row = 0; row < fact.num_rows(); row++) {
        auto cells = std::vector<std::string>{};
        cells.reserve(fact.num_columns());
        for (auto it = fact.cbegin(); it != fact.cend(); ++it) {
            cells.emplace_back(cell_text(**it, row));
        }

        stream << core::join_strings(",", cells) << '\n';
    }
}

void write_markdown_report(std::ostream &stream, const std::string &title,
                           const std::vector<DimensionAnalysis> &analyses) {
    auto tp = std::chrono::system_clock::now();
    stream << fmt::format("# {}\n", title);
    stream << fmt::format("Generated: {0:%F %H:%M:}{1:%S}\n\n", tp, tp.time_since_epoch());
    stream << "## Overview\n";
    stream << fmt::format("Weighted access analysis across {} dimension(s).\n\n", analyses.size());

    for (const auto &analysis : analyses) {
        const auto &summary = analysis.summary;
        stream << fmt::format("## {} Analysis\n\n", core::to_title_case(analysis.dimension));
        stream << "### Key Findings\n";
        if (summary.highest.has_value() && summary.lowest.has_value()) {
            const auto &high = summary.highest.value();
            const auto &low = summary.lowest.value();
            stream << fmt::format("- Highest access: {:.1f}% ({})\n", high.percentage,
                                  high.label.value_or(high.dimension_value.to_string()));
            stream << fmt::format("- Lowest access: {:.1f}% ({})\n", low.percentage,
                                  low.label.value_or(low.dimension_value.to_string()));
        } else {
            stream << "- No groups with data.\n";
        }

        stream << fmt::format("- Range: {:.1f} percentage points\n", summary.range);
        stream << fmt::format("- Population estimate: {:.0f}\n\n", summary.total_population);

        stream << "| Value | Label | Population | Access (%) |\n";
        stream << "|---|---|---:|---:|\n";
        for (const auto &item : analysis.result.statistics) {
            stream << fmt::format("| {} | {} | {:.0f} | {:.1f} |\n",
                                  table_cell(item.dimension_value.to_string()),
                                  table_cell(item.label.value_or("")),
                                  item.population_estimate, item.percentage);
        }

        stream << '\n';
    }
}

ResultFileWriter::ResultFileWriter(std::filesystem::path folder, std::string title)
    : folder_{std::move(folder)}, title_{std::move(title)} {
    std::error_code ec;
    if (!std::filesystem::exists(folder_, ec) &&
        !std::filesystem::create_directories(folder_, ec)) {
        throw std::invalid_argument(
            fmt::format("Cannot create output folder: {}, {}", folder_.string(), ec.message()));
    }
}

const std::filesystem::path &ResultFileWriter::folder() const noexcept { return folder_; }

const std::vector<std::filesystem::path> &ResultFileWriter::files() const noexcept {
    return files_;
}

void ResultFileWriter::write(const DimensionTable &table) {
    auto stream = open(fmt::format("dim_{}.csv", core::to_lower(table.variable())));
    write_dimension_csv(stream, table);
}

void ResultFileWriter::write(const DimensionAnalysis &analysis) {
    auto stream = open(fmt::format("{}_statistics.csv", core::to_lower(analysis.dimension)));
    write_statistics_csv(stream, analysis);
}

void ResultFileWriter::write(const core::DataTable &fact) {
    auto stream = open("fact.csv");
    write_fact_csv(stream, fact);
}

void ResultFileWriter::write_report(const std::vector<DimensionAnalysis> &analyses) {
    auto stream = open("analysis_report.md");
    write_markdown_report(stream, title_, analyses);
}

std::ofstream ResultFileWriter::open(const std::string &file_name) {
    auto full_name = folder_ / file_name;
    auto stream = std::ofstream{full_name, std::ofstream::out | std::ofstream::trunc};
    if (stream.fail() || !stream.is_open()) {
        throw std::invalid_argument(fmt::format("Cannot open output file: {}", full_name.string()));
    }

    files_.emplace_back(std::move(full_name));
    return stream;
}

} // namespace sstar::input
