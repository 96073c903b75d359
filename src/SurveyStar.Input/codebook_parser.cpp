#include "codebook_parser.h"

#include "SurveyStar/errors.h"

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>

namespace sstar::input {
using json = nlohmann::json;

namespace {

std::string label_text(const json &value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }

    return value.dump();
}

VariableDefinition parse_definition(const std::string &variable, const json &node) {
    if (!node.is_object()) {
        throw MalformedInputError("codebook",
                                  fmt::format("definition of {} is not an object", variable));
    }

    auto definition = VariableDefinition{};
    if (node.contains("desc") && !node.at("desc").is_null()) {
        if (!node.at("desc").is_string()) {
            throw MalformedInputError("codebook",
                                      fmt::format("description of {} is not text", variable));
        }

        definition.description = node.at("desc").get<std::string>();
    }

    if (!node.contains("codes")) {
        return definition;
    }

    const auto &codes = node.at("codes");
    if (!codes.is_object()) {
        throw MalformedInputError("codebook",
                                  fmt::format("codes of {} is not an object", variable));
    }

    for (const auto &[code, label] : codes.items()) {
        definition.codes.emplace(code, label_text(label));
    }

    return definition;
}

} // namespace

CodebookIndex parse_codebook(const json &j) {
    if (!j.is_object()) {
        throw MalformedInputError("codebook", "root is not an object of variable definitions");
    }

    auto definitions = CodebookIndex::DefinitionMap{};
    for (const auto &[variable, node] : j.items()) {
        auto [it, inserted] = definitions.emplace(variable, parse_definition(variable, node));
        if (!inserted) {
            throw MalformedInputError("codebook",
                                      fmt::format("duplicated variable definition: {}", variable));
        }
    }

    return CodebookIndex{std::move(definitions)};
}

CodebookIndex load_codebook(const std::filesystem::path &file_name) {
    std::ifstream ifs(file_name, std::ifstream::in);
    if (!ifs) {
        throw std::invalid_argument(fmt::format("Codebook file: {} not found", file_name.string()));
    }

    try {
        return parse_codebook(json::parse(ifs));
    } catch (const json::parse_error &e) {
        throw MalformedInputError("codebook", e.what());
    }
}

} // namespace sstar::input
