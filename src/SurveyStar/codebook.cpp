#include "codebook.h"

namespace sstar {

CodebookIndex::CodebookIndex(DefinitionMap definitions) : definitions_{std::move(definitions)} {}

std::optional<std::reference_wrapper<const VariableDefinition>>
CodebookIndex::definition_of(const std::string &variable) const {
    auto it = definitions_.find(variable);
    if (it != definitions_.end()) {
        return std::cref(it->second);
    }

    return std::nullopt;
}

bool CodebookIndex::contains(const std::string &variable) const {
    return definitions_.contains(variable);
}

std::size_t CodebookIndex::size() const noexcept { return definitions_.size(); }

bool CodebookIndex::empty() const noexcept { return definitions_.empty(); }

std::vector<std::string> CodebookIndex::variables() const {
    auto result = std::vector<std::string>{};
    result.reserve(definitions_.size());
    for (const auto &[name, definition] : definitions_) {
        result.emplace_back(name);
    }

    return result;
}

} // namespace sstar
