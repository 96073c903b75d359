#pragma once

#include "SurveyStar/codebook.h"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace sstar::input {

/// @brief Creates a codebook index from its JSON representation
///
/// @details The codebook is an object of variable definitions,
/// `{ "VAR": { "desc": "...", "codes": { "1": "Yes" } } }`, a missing
/// description defaults to empty text.
///
/// @param j The codebook JSON object
/// @return The codebook index
/// @throws MalformedInputError for codebook not an object of variable definitions.
CodebookIndex parse_codebook(const nlohmann::json &j);

/// @brief Loads a codebook index from a JSON file
/// @param file_name The codebook file full path
/// @return The codebook index
/// @throws std::invalid_argument if the file is not found.
/// @throws MalformedInputError for invalid file contents.
CodebookIndex load_codebook(const std::filesystem::path &file_name);

} // namespace sstar::input
