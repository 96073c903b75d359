#include "configuration_parsing.h"
#include "configuration_parsing_helpers.h"
#include "jsonparser.h"

#include <fmt/color.h>

#include "SurveyStar.Core/string_util.h"

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace sstar::input {
using json = nlohmann::json;

namespace {

constexpr int ConfigSchemaVersion = 1;

std::string expand_environment_variables(const std::string &path) {
    auto start = path.find("${");
    if (start == std::string::npos) {
        return path;
    }

    auto end = path.find('}', start + 2);
    if (end == std::string::npos) {
        return path;
    }

    auto variable = path.substr(start + 2, end - start - 2);
    auto value = std::string{};
    if (const char *v = std::getenv(variable.c_str())) {
        value = v;
    }

    return expand_environment_variables(path.substr(0, start) + value + path.substr(end + 1));
}

} // namespace

void print_key_error(const std::string &key, const std::string &reason) {
    fmt::print(fmt::fg(fmt::color::red), "Configuration key \"{}\": {}.\n", key, reason);
}

nlohmann::json get(const json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key)) {
        print_key_error(key, "missing key");
        throw ConfigurationError{fmt::format("Missing key \"{}\"", key)};
    }

    return j.at(key);
}

bool validate_column_names(const std::string &key, const std::vector<std::string> &names) {
    auto seen = std::set<std::string, core::case_insensitive::comparator>{};
    auto valid = true;
    for (const auto &name : names) {
        if (core::trim(name).empty()) {
            print_key_error(key, "empty column name");
            valid = false;
        } else if (!seen.insert(name).second) {
            print_key_error(key, fmt::format("duplicated column name {}", name));
            valid = false;
        }
    }

    return valid;
}

void rebase_valid_path(std::filesystem::path &path, const std::filesystem::path &base_dir) try {
    if (path.is_relative()) {
        path = std::filesystem::absolute(base_dir / path);
    }

    if (!std::filesystem::exists(path)) {
        throw ConfigurationError{fmt::format("Path does not exist: {}", path.string())};
    }
} catch (const std::filesystem::filesystem_error &) {
    throw ConfigurationError{fmt::format("OS error while reading path {}", path.string())};
}

// NOLINTNEXTLINE(bugprone-exception-escape)
void rebase_valid_path_to(const json &j, const std::string &key, std::filesystem::path &out,
                          const std::filesystem::path &base_dir, bool &success) noexcept {
    if (!get_to(j, key, out, success)) {
        return;
    }

    try {
        rebase_valid_path(out, base_dir);
    } catch (const ConfigurationError &e) {
        print_key_error(key, e.what());
        success = false;
    }
}

FileInfo get_file_info(const json &node, const std::filesystem::path &base_dir) {
    bool success = true;
    FileInfo info;
    rebase_valid_path_to(node, "name", info.name, base_dir, success);
    if (node.contains("delimiter")) {
        get_to(node, "delimiter", info.delimiter, success);
    }

    get_to(node, "columns", info.columns, success);
    if (success && info.delimiter.size() != 1) {
        print_key_error("delimiter", "must be a single character");
        success = false;
    }

    if (!success) {
        throw ConfigurationError{"Could not load input file info"};
    }

    return info;
}

void check_version(const json &j) {
    int version;
    if (!get_to(j, "version", version)) {
        throw ConfigurationError{"File must have a schema version"};
    }

    if (version != ConfigSchemaVersion) {
        throw ConfigurationError{fmt::format(
            "Configuration schema version: {} mismatch, supported: {}", version,
            ConfigSchemaVersion)};
    }
}

void load_input_info(const json &j, Configuration &config) {
    const auto inputs = get(j, "inputs");
    bool success = true;

    // Fact relation file
    try {
        config.file = get_file_info(get(inputs, "fact"), config.root_path);
    } catch (const std::exception &e) {
        success = false;
        fmt::print(fmt::fg(fmt::color::red), "Could not load fact file: {}\n", e.what());
    }

    // Codebook file
    rebase_valid_path_to(inputs, "codebook", config.codebook, config.root_path, success);

    if (!success) {
        throw ConfigurationError{"Could not load input info"};
    }
}

void load_schema_info(const json &j, Configuration &config) {
    if (!get_to(j, "schema", config.schema)) {
        throw ConfigurationError{"Could not load schema info"};
    }

    auto valid = validate_column_names("measures", config.schema.measures);
    valid = validate_column_names("exclude", config.schema.exclude) && valid;
    if (!valid) {
        throw ConfigurationError{"Invalid schema column names"};
    }

    if (config.schema.measures.empty()) {
        fmt::print(fmt::fg(fmt::color::dark_salmon), "Schema has no measure columns.\n");
    }
}

void load_buckets_info(const json &j, Configuration &config) {
    if (!j.contains("buckets")) {
        config.buckets = BucketsInfo{};
        return;
    }

    if (!get_to(j, "buckets", config.buckets)) {
        throw ConfigurationError{"Could not load buckets info"};
    }

    bool success = true;
    for (const auto &info : config.buckets.fixed) {
        for (auto i = std::size_t{1}; i < info.bands.size(); i++) {
            for (auto k = std::size_t{0}; k < i; k++) {
                if (info.bands[k].range.overlaps(info.bands[i].range)) {
                    fmt::print(fmt::fg(fmt::color::dark_salmon),
                               "Bucket column {}: band {} overlaps {}, first band wins.\n",
                               info.target, info.bands[i].label, info.bands[k].label);
                }
            }
        }

        try {
            create_fixed_bucketizer(info);
        } catch (const ConfigurationError &e) {
            success = false;
            fmt::print(fmt::fg(fmt::color::red), "Bucket column {}: {}\n", info.target, e.what());
        }
    }

    for (const auto &info : config.buckets.quantile) {
        try {
            create_quantile_bucketizer(info);
        } catch (const ConfigurationError &e) {
            success = false;
            fmt::print(fmt::fg(fmt::color::red), "Bucket column {}: {}\n", info.target, e.what());
        }
    }

    if (!success) {
        throw ConfigurationError{"Invalid bucket column definitions"};
    }
}

void load_analysis_info(const json &j, Configuration &config) {
    if (!get_to(j, "analysis", config.analysis)) {
        throw ConfigurationError{"Could not load analysis info"};
    }

    if (!validate_column_names("dimensions", config.analysis.dimensions)) {
        throw ConfigurationError{"Invalid analysis dimension names"};
    }

    // validates the policy names
    create_aggregation_options(config);
}

void load_output_info(const json &j, Configuration &config,
                      const std::optional<std::string> &output_folder) {
    if (j.contains("output") && !get_to(j, "output", config.output)) {
        throw ConfigurationError{"Could not load output info"};
    }

    if (output_folder.has_value()) {
        config.output.folder = output_folder.value();
    } else {
        config.output.folder = expand_environment_variables(config.output.folder);
    }

    if (config.output.folder.empty()) {
        throw ConfigurationError(
            "Must specify output folder via command line argument or config file");
    }

    auto folder = std::filesystem::path{config.output.folder};
    if (folder.is_relative()) {
        config.output.folder = (config.root_path / folder).lexically_normal().string();
    }
}

} // namespace sstar::input
