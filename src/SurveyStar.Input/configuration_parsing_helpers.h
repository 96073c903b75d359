#pragma once
#include "configuration.h"
#include "poco.h"

#include <fmt/color.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace sstar::input {
/// @brief Prints a configuration key error message in red
/// @param key The offending configuration key
/// @param reason The error description
void print_key_error(const std::string &key, const std::string &reason);

/// @brief Gets a required member of a configuration section
/// @param j The configuration section
/// @param key Member name
/// @return The member JSON value
/// @throw ConfigurationError: Key not found
nlohmann::json get(const nlohmann::json &j, const std::string &key);

/// @brief Converts a required member of a configuration section
///
/// @details Conversion failures are printed, not thrown, so that a section
/// loader can report every invalid member before giving up.
///
/// @tparam T Type of output object
/// @param j The configuration section
/// @param key Member name
/// @param out The converted value, unchanged on failure
/// @return true if the member exists and was converted, otherwise false
template <class T> bool get_to(const nlohmann::json &j, const std::string &key, T &out) noexcept {
    try {
        out = j.at(key).get<T>();
        return true;
    } catch (const nlohmann::json::out_of_range &) {
        print_key_error(key, "missing key");
    } catch (const nlohmann::json::type_error &) {
        print_key_error(key, "wrong value type");
    } catch (const std::exception &e) {
        print_key_error(key, e.what());
    }

    return false;
}

/// @brief Converts a required member, clearing success on failure
template <class T>
bool get_to(const nlohmann::json &j, const std::string &key, T &out, bool &success) noexcept {
    const bool ret = get_to(j, key, out);
    success = success && ret;
    return ret;
}

/// @brief Validates a list of fact relation column names
///
/// @details Names must be non-empty and unique, ignoring case, as the
/// datatable column lookup is case-insensitive.
///
/// @param key The configuration key holding the list, for messages
/// @param names The column names to validate
/// @return true if the list is valid, otherwise false
bool validate_column_names(const std::string &key, const std::vector<std::string> &names);

/// @brief Rebases a relative path on base_dir and checks that it exists
/// @param path The path to rebase, absolute on return
/// @param base_dir The configuration file directory
/// @throw ConfigurationError: If path does not exist
void rebase_valid_path(std::filesystem::path &path, const std::filesystem::path &base_dir);

/// @brief Reads a path member, rebases it, and checks that it exists
/// @param j The configuration section
/// @param key Member name
/// @param out The resulting absolute path
/// @param base_dir The configuration file directory
/// @param success Cleared on failure
void rebase_valid_path_to(const nlohmann::json &j, const std::string &key,
                          std::filesystem::path &out, const std::filesystem::path &base_dir,
                          bool &success) noexcept;

/// @brief Load the fact relation file information
/// @param node The file information section
/// @param base_dir The configuration file directory
/// @return FileInfo
/// @throw ConfigurationError: Invalid file information
FileInfo get_file_info(const nlohmann::json &node, const std::filesystem::path &base_dir);
} // namespace sstar::input
