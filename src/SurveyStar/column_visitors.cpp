#include "column_visitors.h"

#include "SurveyStar.Core/string_util.h"

#include <charconv>

namespace sstar {

namespace {

std::optional<double> parse_number(const std::string &text) {
    auto trimmed = core::trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    double value{};
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size()) {
        return std::nullopt;
    }

    return value;
}

} // namespace

std::vector<std::optional<double>> NumericColumnVisitor::get_values() {
    return std::move(values_);
}

void NumericColumnVisitor::visit(const core::StringDataTableColumn &column) {
    values_.clear();
    values_.reserve(column.size());
    for (std::size_t i = 0; i < column.size(); i++) {
        if (column.is_null(i)) {
            values_.emplace_back(std::nullopt);
        } else {
            values_.emplace_back(parse_number(column.value_unsafe(i)));
        }
    }
}

void NumericColumnVisitor::visit(const core::DoubleDataTableColumn &column) {
    values_.clear();
    values_.reserve(column.size());
    for (std::size_t i = 0; i < column.size(); i++) {
        values_.emplace_back(column.value_safe(i));
    }
}

void NumericColumnVisitor::visit(const core::IntegerDataTableColumn &column) {
    values_.clear();
    values_.reserve(column.size());
    for (std::size_t i = 0; i < column.size(); i++) {
        if (column.is_null(i)) {
            values_.emplace_back(std::nullopt);
        } else {
            values_.emplace_back(static_cast<double>(column.value_unsafe(i)));
        }
    }
}

std::vector<std::optional<core::Code>> CodeColumnVisitor::get_codes() { return std::move(codes_); }

void CodeColumnVisitor::visit(const core::StringDataTableColumn &column) {
    codes_.clear();
    codes_.reserve(column.size());
    for (std::size_t i = 0; i < column.size(); i++) {
        if (column.is_null(i)) {
            codes_.emplace_back(std::nullopt);
        } else {
            codes_.emplace_back(core::Code::parse(column.value_unsafe(i)));
        }
    }
}

void CodeColumnVisitor::visit(const core::DoubleDataTableColumn &column) {
    codes_.clear();
    codes_.reserve(column.size());
    for (std::size_t i = 0; i < column.size(); i++) {
        if (column.is_null(i)) {
            codes_.emplace_back(std::nullopt);
        } else {
            codes_.emplace_back(core::Code::from_value(column.value_unsafe(i)));
        }
    }
}

void CodeColumnVisitor::visit(const core::IntegerDataTableColumn &column) {
    codes_.clear();
    codes_.reserve(column.size());
    for (std::size_t i = 0; i < column.size(); i++) {
        if (column.is_null(i)) {
            codes_.emplace_back(std::nullopt);
        } else {
            codes_.emplace_back(core::Code{static_cast<std::int64_t>(column.value_unsafe(i))});
        }
    }
}

std::vector<std::optional<double>> read_numeric(const core::DataTableColumn &column) {
    auto visitor = NumericColumnVisitor{};
    column.accept(visitor);
    return visitor.get_values();
}

std::vector<std::optional<core::Code>> read_codes(const core::DataTableColumn &column) {
    auto visitor = CodeColumnVisitor{};
    column.accept(visitor);
    return visitor.get_codes();
}

} // namespace sstar
