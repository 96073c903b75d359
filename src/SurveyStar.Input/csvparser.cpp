#include "csvparser.h"
#include <rapidcsv.h>

#include "SurveyStar.Core/column_builder.h"
#include "SurveyStar.Core/scoped_timer.h"
#include "SurveyStar.Core/string_util.h"
#include "SurveyStar/errors.h"

#include <fmt/color.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <memory>
#include <optional>

#if USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    sstar::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace {

namespace sc = sstar::core;

[[noreturn]] void throw_conversion_error(const std::string &name, std::size_t row,
                                         const std::string &value, const std::string &type) {
    throw sstar::MalformedInputError(
        "fact relation", fmt::format("cannot convert value '{}' to {} in column '{}' at row {}",
                                     value, type, name, row));
}

/// @brief Builds a column from the raw cell texts, empty cells become nulls
/// @tparam Builder The column builder type
/// @tparam Parser Function converting a non-empty cell text, the full text must be used
template <typename Builder, typename Parser>
std::unique_ptr<sc::DataTableColumn>
parse_column(const std::string &name, const std::string &type,
             const std::vector<std::string> &data, Parser parse) {
    using value_type = typename Builder::value_type;

    auto builder = Builder(name);
    builder.reserve(data.size());
    for (std::size_t row = 0; row < data.size(); row++) {
        auto text = sc::trim(data[row]);
        if (text.empty()) {
            builder.append(std::optional<value_type>{});
            continue;
        }

        try {
            std::size_t pos{};
            auto value = parse(text, pos);
            if (pos != text.size()) {
                throw_conversion_error(name, row, text, type);
            }

            builder.append(std::optional<value_type>{std::move(value)});
        } catch (const std::logic_error &) {
            throw_conversion_error(name, row, text, type);
        }
    }

    return builder.build();
}

std::unique_ptr<sc::DataTableColumn> parse_column(const std::string &name,
                                                  const std::string &type,
                                                  const std::vector<std::string> &data) {
    if (type == "integer") {
        return parse_column<sc::IntegerDataTableColumnBuilder>(
            name, type, data,
            [](const std::string &text, std::size_t &pos) { return std::stoi(text, &pos); });
    }

    if (type == "double") {
        return parse_column<sc::DoubleDataTableColumnBuilder>(
            name, type, data,
            [](const std::string &text, std::size_t &pos) { return std::stod(text, &pos); });
    }

    if (type == "string") {
        return parse_column<sc::StringDataTableColumnBuilder>(
            name, type, data, [](const std::string &text, std::size_t &pos) {
                pos = text.size();
                return text;
            });
    }

    throw sstar::MalformedInputError(
        "fact relation", fmt::format("unknown data type: {} in column: {}", type, name));
}

} // namespace

namespace sstar::input {

core::DataTable load_datatable_from_csv(const FileInfo &file_info) {
    MEASURE_FUNCTION();
    using namespace rapidcsv;

    bool success = true;
    Document doc{file_info.name.string(), LabelParams{},
                 SeparatorParams{file_info.delimiter.front()}};

    // Validate columns and create file columns map
    auto headers = doc.GetColumnNames();
    auto trimmed_headers = std::vector<std::string>{};
    std::transform(headers.cbegin(), headers.cend(), std::back_inserter(trimmed_headers),
                   [](const auto &header) { return sc::trim(header); });

    std::map<std::string, std::string, sc::case_insensitive::comparator> csv_column_map;
    for (const auto &[col_name, col_type] : file_info.columns) {
        auto index = sc::case_insensitive::index_of(trimmed_headers, col_name);
        if (index >= 0) {
            csv_column_map[col_name] = headers[static_cast<std::size_t>(index)];
        } else {
            success = false;
            fmt::print(fg(fmt::color::dark_salmon), "Column: {} not found in dataset.\n", col_name);
        }
    }

    if (!success) {
        throw MalformedInputError("fact relation", "configured columns not found in dataset");
    }

    // Keep the file column order
    auto ordered = std::vector<std::string>{};
    for (const auto &header : headers) {
        auto it = std::find_if(csv_column_map.cbegin(), csv_column_map.cend(),
                               [&header](const auto &pair) { return pair.second == header; });
        if (it != csv_column_map.cend()) {
            ordered.emplace_back(it->first);
        }
    }

    core::DataTable out_table;
    for (const auto &col_name : ordered) {
        auto col_type = sc::to_lower(file_info.columns.at(col_name));
        auto data = doc.GetColumn<std::string>(csv_column_map.at(col_name));
        out_table.add(parse_column(col_name, col_type, data));
    }

    return out_table;
}

} // namespace sstar::input
