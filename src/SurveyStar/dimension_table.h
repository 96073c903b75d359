#pragma once

#include "codebook.h"
#include "diagnostics.h"

#include "SurveyStar.Core/code.h"
#include "SurveyStar.Core/datatable.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sstar {

/// @brief Dimension table entry, the label of a single code
struct DimensionEntry {
    /// @brief The attribute code
    core::Code code;

    /// @brief The code label, empty for unlabelled tables
    std::optional<std::string> label;

    /// @brief The variable description
    std::string description;

    /// @brief Whether the code is declared in the codebook
    bool declared{false};
};

/// @brief Code to label lookup relation for one coded attribute
///
/// @details Entries are unique by code and sorted ascending by the core::Code
/// total order: numeric codes first, then symbolic codes.
class DimensionTable {
  public:
    /// @brief Entries iterator type
    using IteratorType = std::vector<DimensionEntry>::const_iterator;

    /// @brief Initialises a new instance of the DimensionTable class, empty.
    DimensionTable() = default;

    /// @brief Initialises a new instance of the DimensionTable class.
    /// @param variable The coded variable name
    /// @param entries The table entries, in any order
    /// @param description The codebook variable description, empty for undefined variables
    /// @throws std::invalid_argument for duplicated entry codes.
    DimensionTable(std::string variable, std::vector<DimensionEntry> entries,
                   std::optional<std::string> description = std::nullopt);

    /// @brief Gets the coded variable name
    /// @return The variable name
    const std::string &variable() const noexcept;

    /// @brief Gets the table entries
    /// @return The entries sorted by code
    const std::vector<DimensionEntry> &entries() const noexcept;

    /// @brief Gets the number of entries
    /// @return Number of entries
    std::size_t size() const noexcept;

    /// @brief Determines whether the table is empty
    /// @return true if the table has no entries; otherwise, false.
    bool empty() const noexcept;

    /// @brief Gets the codebook variable description
    /// @return The description, if the variable has a definition; otherwise, empty.
    const std::optional<std::string> &description() const noexcept;

    /// @brief Determines whether any entry carries a label
    /// @return true for labelled tables; otherwise, false.
    bool is_labelled() const noexcept;

    /// @brief Gets the number of entries not declared in the codebook
    /// @return Number of synthesised or passthrough entries
    std::size_t undeclared_count() const noexcept;

    /// @brief Finds the entry of a code
    /// @param code The code to find
    /// @return The code entry, if found; otherwise, empty.
    std::optional<std::reference_wrapper<const DimensionEntry>> find(const core::Code &code) const;

    /// @brief Gets the label of a code
    /// @param code The code to find
    /// @return The code label, if found and labelled; otherwise, empty.
    std::optional<std::string> label_of(const core::Code &code) const;

    /// @brief Gets the table codes
    /// @return The codes in table order
    std::vector<core::Code> codes() const;

    /// @brief Gets the iterator to the first entry
    /// @return An iterator to the beginning
    IteratorType cbegin() const noexcept { return entries_.cbegin(); }

    /// @brief Gets the iterator following the last entry
    /// @return An iterator to the end
    IteratorType cend() const noexcept { return entries_.cend(); }

  private:
    std::string variable_;
    std::vector<DimensionEntry> entries_;
    std::optional<std::string> description_;
};

/// @brief Result of comparing a dimension table against its codebook definition
struct VerificationReport {
    /// @brief Declared codes absent from the table
    std::vector<std::string> missing_codes;

    /// @brief Table codes not declared in the codebook
    std::vector<std::string> extra_codes;

    /// @brief Declared codes whose table label differs from the declared label
    std::vector<std::string> label_mismatches;

    /// @brief Determines whether the table is consistent with the definition
    /// @return true if no code is missing and no label differs; otherwise, false.
    bool is_consistent() const noexcept;
};

/// @brief Builds dimension tables by reconciling codebook declarations with observed codes
///
/// @details The set of codes in a table built from a fact column is exactly the
/// union of the declared codes and the observed codes. Observed codes missing
/// from the codebook are synthesised with an "Undefined code: <code>" label.
class DimensionTableBuilder {
  public:
    /// @brief The label prefix of synthesised entries
    static constexpr auto undefined_code_prefix = "Undefined code: ";

    /// @brief Reconciles a variable definition with the observed column codes
    /// @param variable The coded variable name
    /// @param fact_column The observed codes, empty values are ignored
    /// @param definition The variable codebook definition
    /// @return The reconciled dimension table
    static DimensionTable build(const std::string &variable,
                                const std::vector<std::optional<core::Code>> &fact_column,
                                const VariableDefinition &definition);

    /// @brief Reconciles a variable definition with the codes of a fact column
    /// @param column The fact relation column
    /// @param definition The variable codebook definition
    /// @return The reconciled dimension table
    static DimensionTable build(const core::DataTableColumn &column,
                                const VariableDefinition &definition);

    /// @brief Creates an unlabelled passthrough table with the observed codes only
    /// @param variable The coded variable name
    /// @param fact_column The observed codes, empty values are ignored
    /// @return The unlabelled dimension table
    static DimensionTable build_unlabelled(const std::string &variable,
                                           const std::vector<std::optional<core::Code>> &fact_column);

    /// @brief Builds the dimension table of a fact relation column using a codebook
    ///
    /// @details A variable without codebook definition is recoverable, the
    /// unlabelled passthrough table is returned and a warning is recorded.
    ///
    /// @param fact The fact relation
    /// @param variable The coded variable column name
    /// @param codebook The codebook index
    /// @param log The diagnostics log
    /// @return The dimension table
    /// @throws MalformedInputError if the fact relation has no such column.
    static DimensionTable build(const core::DataTable &fact, const std::string &variable,
                                const CodebookIndex &codebook, DiagnosticLog &log);

    /// @brief Compares a dimension table against its codebook definition
    /// @param table The dimension table
    /// @param definition The variable codebook definition
    /// @return The verification report
    static VerificationReport verify(const DimensionTable &table,
                                     const VariableDefinition &definition);
};

} // namespace sstar
