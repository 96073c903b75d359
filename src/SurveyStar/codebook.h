#pragma once

#include "SurveyStar.Core/string_util.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sstar {

/// @brief Codebook definition of a single coded variable
struct VariableDefinition {
    /// @brief The variable description
    std::string description;

    /// @brief The declared code text to label mapping
    std::map<std::string, std::string> codes;
};

/// @brief Immutable lookup of variable definitions by variable name
///
/// @details Variable names are matched case-insensitively, in line with the
/// DataTable column name lookup.
class CodebookIndex {
  public:
    /// @brief The definitions collection type
    using DefinitionMap =
        std::map<std::string, VariableDefinition, core::case_insensitive::comparator>;

    /// @brief Initialises a new instance of the CodebookIndex class, empty.
    CodebookIndex() = default;

    /// @brief Initialises a new instance of the CodebookIndex class.
    /// @param definitions The variable definitions, keyed by variable name
    explicit CodebookIndex(DefinitionMap definitions);

    /// @brief Finds the definition of a variable
    /// @param variable The variable name
    /// @return The variable definition, if found; otherwise, empty.
    std::optional<std::reference_wrapper<const VariableDefinition>>
    definition_of(const std::string &variable) const;

    /// @brief Determines whether the codebook defines a variable
    /// @param variable The variable name
    /// @return true if the variable is defined; otherwise, false.
    bool contains(const std::string &variable) const;

    /// @brief Gets the number of defined variables
    /// @return Number of variables
    std::size_t size() const noexcept;

    /// @brief Determines whether the codebook is empty
    /// @return true if no variable is defined; otherwise, false.
    bool empty() const noexcept;

    /// @brief Gets the defined variable names, in case-insensitive order
    /// @return The variable names
    std::vector<std::string> variables() const;

    /// @brief Gets the iterator to the first definition
    /// @return An iterator to the beginning
    DefinitionMap::const_iterator cbegin() const noexcept { return definitions_.cbegin(); }

    /// @brief Gets the iterator following the last definition
    /// @return An iterator to the end
    DefinitionMap::const_iterator cend() const noexcept { return definitions_.cend(); }

  private:
    DefinitionMap definitions_;
};

} // namespace sstar
