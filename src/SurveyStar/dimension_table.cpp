#include "dimension_table.h"
#include "column_visitors.h"
#include "errors.h"

#include <fmt/format.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace sstar {

DimensionTable::DimensionTable(std::string variable, std::vector<DimensionEntry> entries,
                               std::optional<std::string> description)
    : variable_{std::move(variable)}, entries_{std::move(entries)},
      description_{std::move(description)} {
    std::sort(entries_.begin(), entries_.end(),
              [](const auto &left, const auto &right) { return left.code < right.code; });

    auto duplicate = std::adjacent_find(
        entries_.cbegin(), entries_.cend(),
        [](const auto &left, const auto &right) { return left.code == right.code; });
    if (duplicate != entries_.cend()) {
        throw std::invalid_argument(fmt::format("Duplicated code: {} in dimension table: {}",
                                                duplicate->code.to_string(), variable_));
    }
}

const std::string &DimensionTable::variable() const noexcept { return variable_; }

const std::vector<DimensionEntry> &DimensionTable::entries() const noexcept { return entries_; }

std::size_t DimensionTable::size() const noexcept { return entries_.size(); }

bool DimensionTable::empty() const noexcept { return entries_.empty(); }

const std::optional<std::string> &DimensionTable::description() const noexcept {
    return description_;
}

bool DimensionTable::is_labelled() const noexcept {
    return std::any_of(entries_.cbegin(), entries_.cend(),
                       [](const auto &entry) { return entry.label.has_value(); });
}

std::size_t DimensionTable::undeclared_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        entries_.cbegin(), entries_.cend(), [](const auto &entry) { return !entry.declared; }));
}

std::optional<std::reference_wrapper<const DimensionEntry>>
DimensionTable::find(const core::Code &code) const {
    auto it = std::lower_bound(entries_.cbegin(), entries_.cend(), code,
                               [](const auto &entry, const auto &value) { return entry.code < value; });
    if (it != entries_.cend() && it->code == code) {
        return std::cref(*it);
    }

    return std::nullopt;
}

std::optional<std::string> DimensionTable::label_of(const core::Code &code) const {
    auto entry = find(code);
    if (entry.has_value()) {
        return entry->get().label;
    }

    return std::nullopt;
}

std::vector<core::Code> DimensionTable::codes() const {
    auto result = std::vector<core::Code>{};
    result.reserve(entries_.size());
    for (const auto &entry : entries_) {
        result.emplace_back(entry.code);
    }

    return result;
}

bool VerificationReport::is_consistent() const noexcept {
    return missing_codes.empty() && label_mismatches.empty();
}

DimensionTable DimensionTableBuilder::build(const std::string &variable,
                                            const std::vector<std::optional<core::Code>> &fact_column,
                                            const VariableDefinition &definition) {
    auto entries = std::vector<DimensionEntry>{};
    auto declared = std::set<core::Code>{};
    for (const auto &[code_text, label] : definition.codes) {
        auto code = core::Code::parse(code_text);
        if (declared.emplace(code).second) {
            entries.emplace_back(DimensionEntry{.code = std::move(code),
                                                .label = label,
                                                .description = definition.description,
                                                .declared = true});
        }
    }

    auto observed = std::set<core::Code>{};
    for (const auto &value : fact_column) {
        if (value.has_value() && !declared.contains(*value)) {
            observed.emplace(*value);
        }
    }

    for (const auto &code : observed) {
        entries.emplace_back(
            DimensionEntry{.code = code,
                           .label = fmt::format("{}{}", undefined_code_prefix, code.to_string()),
                           .description = definition.description,
                           .declared = false});
    }

    return DimensionTable{variable, std::move(entries), definition.description};
}

DimensionTable DimensionTableBuilder::build(const core::DataTableColumn &column,
                                            const VariableDefinition &definition) {
    return build(column.name(), read_codes(column), definition);
}

DimensionTable
DimensionTableBuilder::build_unlabelled(const std::string &variable,
                                        const std::vector<std::optional<core::Code>> &fact_column) {
    auto observed = std::set<core::Code>{};
    for (const auto &value : fact_column) {
        if (value.has_value()) {
            observed.emplace(*value);
        }
    }

    auto entries = std::vector<DimensionEntry>{};
    entries.reserve(observed.size());
    for (const auto &code : observed) {
        entries.emplace_back(DimensionEntry{.code = code});
    }

    return DimensionTable{variable, std::move(entries)};
}

DimensionTable DimensionTableBuilder::build(const core::DataTable &fact,
                                            const std::string &variable,
                                            const CodebookIndex &codebook, DiagnosticLog &log) {
    auto column = fact.column_if_exists(variable);
    if (!column.has_value()) {
        throw MalformedInputError("fact relation",
                                  fmt::format("dimension column '{}' not found", variable));
    }

    auto codes = read_codes(column->get());
    auto definition = codebook.definition_of(variable);
    if (!definition.has_value()) {
        log.warning("DimensionTableBuilder",
                    fmt::format("Variable {} has no codebook definition, labels not available.",
                                variable));
        return build_unlabelled(variable, codes);
    }

    auto table = build(variable, codes, definition->get());
    auto undeclared = table.undeclared_count();
    if (undeclared > 0) {
        log.warning("DimensionTableBuilder",
                    fmt::format("Variable {} has {} observed code(s) not declared in codebook.",
                                variable, undeclared));
    }

    return table;
}

VerificationReport DimensionTableBuilder::verify(const DimensionTable &table,
                                                 const VariableDefinition &definition) {
    auto report = VerificationReport{};
    auto declared = std::set<core::Code>{};
    for (const auto &[code_text, label] : definition.codes) {
        auto code = core::Code::parse(code_text);
        declared.emplace(code);
        auto entry = table.find(code);
        if (!entry.has_value()) {
            report.missing_codes.emplace_back(code_text);
        } else if (entry->get().label != label) {
            report.label_mismatches.emplace_back(code_text);
        }
    }

    for (const auto &entry : table.entries()) {
        if (!declared.contains(entry.code)) {
            report.extra_codes.emplace_back(entry.code.to_string());
        }
    }

    return report;
}

} // namespace sstar
