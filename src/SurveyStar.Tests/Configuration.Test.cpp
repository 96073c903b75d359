#include "pch.h"

#include "SurveyStar.Core/column_numeric.h"
#include "SurveyStar.Input/configuration_parsing.h"
#include "SurveyStar.Input/configuration_parsing_helpers.h"
#include "SurveyStar.Input/jsonparser.h"
#include "SurveyStar/errors.h"

#include <cstdlib>
#include <fstream>
#include <random>
#include <type_traits>

using json = nlohmann::json;
using namespace sstar;
using namespace sstar::input;

#define TYPE_OF(x) std::remove_cvref_t<decltype(x)>

namespace {
const std::string TEST_KEY = "my_key";
const std::string TEST_KEY2 = "other_key";

constexpr auto *ANALYSIS_CONFIG = R"(
    {
        "version": 1,
        "inputs": {
            "fact": {
                "name": "survey.csv",
                "delimiter": ",",
                "columns": {"SEX": "integer", "AGE": "double", "WEIGHT": "double",
                            "ACCESS": "integer"}
            },
            "codebook": "codebook.json"
        },
        "schema": {"measures": ["WEIGHT", "ACCESS", "AGE"], "exclude": []},
        "buckets": {
            "fixed": [
                {
                    "source": "AGE",
                    "target": "AGE_GROUP",
                    "bands": [{"range": "0-18", "label": "0-18"},
                              {"range": [19, 100], "label": "19+"}]
                }
            ]
        },
        "analysis": {
            "weight": "WEIGHT",
            "condition": {"column": "ACCESS", "value": 1, "missing_sentinel": 9},
            "zero_weight": "omit_group",
            "order": "group",
            "dimensions": ["SEX", "AGE_GROUP"]
        },
        "output": {"folder": "results", "report": false}
    })";

class TempDir {
  public:
    TempDir() : rnd_{std::random_device()()} {
        path_ = std::filesystem::path{::testing::TempDir()} / "sstar" / random_string();
        if (!std::filesystem::create_directories(path_)) {
            throw std::runtime_error{"Could not create temp dir"};
        }

        path_ = std::filesystem::absolute(path_);
    }

    ~TempDir() {
        if (std::filesystem::exists(path_)) {
            std::filesystem::remove_all(path_);
        }
    }

    std::string random_string() const { return std::to_string(rnd_()); }

    const auto &path() const { return path_; }

  private:
    mutable std::mt19937 rnd_;
    std::filesystem::path path_;
};

class ConfigParsingFixture : public ::testing::Test {
  public:
    const auto &tmp_path() const { return dir_.path(); }

    std::filesystem::path random_filename() const { return dir_.random_string(); }

    std::filesystem::path create_file_relative() const {
        auto file_path = random_filename();
        std::ofstream ofs{dir_.path() / file_path};
        return file_path;
    }

    std::filesystem::path create_file_absolute() const {
        auto file_path = tmp_path() / random_filename();
        std::ofstream ofs{file_path};
        return file_path;
    }

    std::filesystem::path write_file(const std::string &name, const std::string &content) const {
        auto file_path = tmp_path() / name;
        std::ofstream ofs{file_path};
        ofs << content;
        return file_path;
    }

    auto create_config() const {
        Configuration config;
        config.root_path = dir_.path();
        return config;
    }

  private:
    TempDir dir_;
};

} // anonymous namespace

TEST(ConfigParsing, Get) {
    json j;

    EXPECT_THROW(get(j, TEST_KEY), ConfigurationError);

    j[TEST_KEY2] = 1;
    EXPECT_THROW(get(j, TEST_KEY), ConfigurationError);

    j[TEST_KEY] = 2;
    EXPECT_NO_THROW(get(j, TEST_KEY));
}

template <class Func> void testGetTo(const Func &f) {
    f(1);
    f(std::string{"hello"});
}

TEST(ConfigParsing, GetToGood) {
    testGetTo([](const auto &exp) {
        json j;
        j[TEST_KEY] = exp;

        TYPE_OF(exp) out;
        EXPECT_TRUE(get_to(j, TEST_KEY, out));
        EXPECT_EQ(out, exp);
    });
}

TEST(ConfigParsing, GetToBadKeySetFlag) {
    testGetTo([](const auto &exp) {
        json j;
        j[TEST_KEY] = exp;

        bool success = true;
        TYPE_OF(exp) out;
        EXPECT_FALSE(get_to(j, TEST_KEY2, out, success));
        EXPECT_FALSE(success);
    });
}

TEST(ConfigParsing, GetToWrongType) {
    testGetTo([](const auto &exp) {
        json j;
        j[TEST_KEY] = exp;

        std::vector<int> out;
        bool success = true;
        EXPECT_FALSE(get_to(j, TEST_KEY, out, success));
        EXPECT_FALSE(success);
    });
}

TEST(ConfigParsing, GetToInvalidInterval) {
    json j;
    j[TEST_KEY] = "25-19";

    sstar::core::DoubleInterval out;
    EXPECT_FALSE(get_to(j, TEST_KEY, out));
}

TEST(ConfigParsing, ValidateColumnNames) {
    EXPECT_TRUE(validate_column_names(TEST_KEY, {}));
    EXPECT_TRUE(validate_column_names(TEST_KEY, {"SEX", "AGE_GROUP"}));
    EXPECT_FALSE(validate_column_names(TEST_KEY, {"SEX", "sex"}));
    EXPECT_FALSE(validate_column_names(TEST_KEY, {"SEX", "  "}));
}

TEST(ConfigParsing, CheckVersion) {
    json j;
    EXPECT_THROW(check_version(j), ConfigurationError);

    j["version"] = 2;
    EXPECT_THROW(check_version(j), ConfigurationError);

    j["version"] = 1;
    EXPECT_NO_THROW(check_version(j));
}

TEST_F(ConfigParsingFixture, RebaseValidPathGood) {
    {
        const auto abs_path = create_file_absolute();
        auto path = abs_path;
        EXPECT_NO_THROW(rebase_valid_path(path, tmp_path()));
        EXPECT_EQ(path, abs_path);
    }

    {
        const auto rel_path = create_file_relative();
        auto path = rel_path;
        EXPECT_NO_THROW(rebase_valid_path(path, tmp_path()));
        EXPECT_EQ(path, tmp_path() / rel_path);
    }
}

TEST_F(ConfigParsingFixture, RebaseValidPathBad) {
    auto path = random_filename();
    EXPECT_THROW(rebase_valid_path(path, tmp_path()), ConfigurationError);

    json j;
    j[TEST_KEY] = random_filename();
    bool success = true;
    std::filesystem::path out;
    rebase_valid_path_to(j, TEST_KEY, out, tmp_path(), success);
    EXPECT_FALSE(success);
}

TEST_F(ConfigParsingFixture, GetFileInfo) {
    const auto file_name = create_file_relative();
    json j;
    j["name"] = file_name;
    j["delimiter"] = ";";
    j["columns"] = {{"SEX", "integer"}, {"WEIGHT", "double"}};

    auto info = get_file_info(j, tmp_path());
    EXPECT_EQ(tmp_path() / file_name, info.name);
    EXPECT_EQ(";", info.delimiter);
    EXPECT_EQ(2, info.columns.size());

    j["delimiter"] = ";;";
    EXPECT_THROW(get_file_info(j, tmp_path()), ConfigurationError);
}

TEST_F(ConfigParsingFixture, LoadOutputInfo) {
    auto config = create_config();
    json j;
    j["output"] = {{"folder", "results"}};

    load_output_info(j, config);
    EXPECT_EQ((tmp_path() / "results").lexically_normal().string(), config.output.folder);
    EXPECT_TRUE(config.output.report);

    const auto override_folder = (tmp_path() / "override").string();
    load_output_info(j, config, override_folder);
    EXPECT_EQ(override_folder, config.output.folder);

    auto empty = create_config();
    EXPECT_THROW(load_output_info(json::object(), empty), ConfigurationError);
}

TEST_F(ConfigParsingFixture, LoadOutputInfoExpandsEnvironment) {
#ifndef _WIN32
    ::setenv("SSTAR_TEST_OUTPUT", tmp_path().string().c_str(), 1);
    auto config = create_config();
    json j;
    j["output"] = {{"folder", "${SSTAR_TEST_OUTPUT}/out"}};

    load_output_info(j, config);
    EXPECT_EQ((tmp_path() / "out").string(), config.output.folder);
    ::unsetenv("SSTAR_TEST_OUTPUT");
#endif
}

TEST_F(ConfigParsingFixture, LoadAnalysisInfoValidatesPolicies) {
    auto config = create_config();
    auto j = json::parse(ANALYSIS_CONFIG);

    EXPECT_NO_THROW(load_analysis_info(j, config));
    EXPECT_EQ("WEIGHT", config.analysis.weight);
    EXPECT_EQ(sstar::core::Code{9}, config.analysis.condition.missing_sentinel.value());

    j["analysis"]["zero_weight"] = "drop";
    EXPECT_THROW(load_analysis_info(j, config), ConfigurationError);

    j["analysis"]["zero_weight"] = "report_zero";
    j["analysis"]["order"] = "random";
    EXPECT_THROW(load_analysis_info(j, config), ConfigurationError);
}

TEST_F(ConfigParsingFixture, LoadSchemaAndDimensionNames) {
    auto config = create_config();
    auto j = json::parse(ANALYSIS_CONFIG);

    EXPECT_NO_THROW(load_schema_info(j, config));
    EXPECT_EQ(3, config.schema.measures.size());

    j["schema"]["exclude"] = {"ID", "id"};
    EXPECT_THROW(load_schema_info(j, config), ConfigurationError);

    j["analysis"]["dimensions"] = {"SEX", ""};
    EXPECT_THROW(load_analysis_info(j, config), ConfigurationError);
}

TEST_F(ConfigParsingFixture, LoadBucketsInfo) {
    auto config = create_config();
    auto j = json::parse(ANALYSIS_CONFIG);

    load_buckets_info(j, config);
    ASSERT_EQ(1, config.buckets.fixed.size());
    EXPECT_TRUE(config.buckets.quantile.empty());
    EXPECT_EQ(sstar::core::DoubleInterval(19.0, 100.0), config.buckets.fixed[0].bands[1].range);

    j["buckets"]["quantile"] = json::parse(R"([{
        "source": "INCOME",
        "target": "INCOME_GROUP",
        "quantiles": 2,
        "labels": ["Lower"],
        "fallback": [{"upper": null, "label": "All"}]
    }])");
    EXPECT_THROW(load_buckets_info(j, config), ConfigurationError);

    j.erase("buckets");
    EXPECT_NO_THROW(load_buckets_info(j, config));
    EXPECT_TRUE(config.buckets.fixed.empty());
}

TEST_F(ConfigParsingFixture, GetConfiguration) {
    write_file("survey.csv", "SEX,AGE,WEIGHT,ACCESS\n1,20,1.0,1\n");
    write_file("codebook.json", R"({"SEX": {"desc": "Sex", "codes": {"1": "Male"}}})");
    auto config_file = write_file("config.json", ANALYSIS_CONFIG);

    auto config = get_configuration(config_file, std::nullopt, true);

    EXPECT_EQ(tmp_path(), config.root_path);
    EXPECT_EQ(tmp_path() / "survey.csv", config.file.name);
    EXPECT_EQ(tmp_path() / "codebook.json", config.codebook);
    EXPECT_EQ(4, config.file.columns.size());
    EXPECT_EQ(3, config.schema.measures.size());
    EXPECT_EQ(sstar::core::VerboseMode::verbose, config.verbosity);
    EXPECT_FALSE(config.output.report);
    EXPECT_EQ((tmp_path() / "results").lexically_normal().string(), config.output.folder);

    auto options = create_aggregation_options(config);
    EXPECT_EQ("WEIGHT", options.weight_column);
    EXPECT_EQ("ACCESS", options.condition_column);
    EXPECT_EQ(sstar::core::Code{1}, options.condition_value);
    EXPECT_EQ(ZeroWeightPolicy::omit_group, options.zero_weight);
    EXPECT_EQ(SortOrder::group_ascending, options.order);

    auto schema = create_schema_options(config);
    EXPECT_TRUE(schema.measures.contains("weight"));
    EXPECT_TRUE(schema.exclude.empty());
}

TEST_F(ConfigParsingFixture, GetConfigurationFailures) {
    EXPECT_THROW(get_configuration(tmp_path() / "missing.json", std::nullopt, false),
                 ConfigurationError);

    auto bad_json = write_file("bad.json", "{ version: 1");
    EXPECT_THROW(get_configuration(bad_json, std::nullopt, false), ConfigurationError);

    auto missing_inputs = write_file("config.json", ANALYSIS_CONFIG);
    EXPECT_THROW(get_configuration(missing_inputs, std::nullopt, false), ConfigurationError);
}

TEST(ConfigFactories, CreateBucketizers) {
    auto fixed = FixedBucketInfo{.source = "AGE",
                                 .target = "AGE_GROUP",
                                 .unknown_label = "Other",
                                 .bands = {BandInfo{sstar::core::DoubleInterval{0.0, 17.0}, "Child"}}};

    auto bucketizer = create_fixed_bucketizer(fixed);
    EXPECT_EQ("Child", bucketizer.assign(10.0));
    EXPECT_EQ("Other", bucketizer.assign(30.0));

    fixed.bands.clear();
    EXPECT_THROW(create_fixed_bucketizer(fixed), ConfigurationError);

    auto quantile = QuantileBucketInfo{.source = "INCOME",
                                       .target = "INCOME_GROUP",
                                       .quantiles = 2,
                                       .labels = {"Lower", "Upper"},
                                       .fallback = {FallbackBandInfo{0.0, "None"},
                                                    FallbackBandInfo{std::nullopt, "Some"}}};

    auto quantile_bucketizer = create_quantile_bucketizer(quantile);
    EXPECT_EQ(2, quantile_bucketizer.options().quantiles);
    EXPECT_EQ("Some", quantile_bucketizer.fallback(1e12));

    quantile.fallback.pop_back();
    EXPECT_THROW(create_quantile_bucketizer(quantile), ConfigurationError);
}

namespace {
core::DataTable create_access_income_fact() {
    auto fact = core::DataTable{};
    fact.add(std::make_unique<core::IntegerDataTableColumn>("ACCESS",
                                                            std::vector<int>{1, 0, 1, 9, 0}));
    fact.add(std::make_unique<core::DoubleDataTableColumn>(
        "INCOME", std::vector<double>{10.0, 20.0, 30.0, 1000000.0, 40.0}));
    return fact;
}

Configuration create_income_bucket_config() {
    auto config = Configuration{};
    config.analysis.condition = ConditionInfo{.column = "ACCESS", .value = core::Code{1}};
    config.buckets.quantile.emplace_back(
        QuantileBucketInfo{.source = "INCOME",
                           .target = "INCOME_GROUP",
                           .quantiles = 2,
                           .labels = {"Lower", "Upper"},
                           .fallback = {FallbackBandInfo{std::nullopt, "All"}}});
    return config;
}

std::vector<std::string> income_groups(const core::DataTable &fact) {
    const auto &column =
        dynamic_cast<const core::StringDataTableColumn &>(fact.column("INCOME_GROUP"));
    auto result = std::vector<std::string>{};
    for (std::size_t i = 0; i < column.size(); i++) {
        result.emplace_back(column.value_unsafe(i));
    }

    return result;
}
} // namespace

TEST(ConfigFactories, AnalysisFactWithoutSentinelKeepsAllRows) {
    auto fact = create_access_income_fact();
    auto config = create_income_bucket_config();
    auto log = DiagnosticLog{};

    auto result = create_analysis_fact(fact, config, log);

    // the extreme income moves the median edge to 30
    ASSERT_EQ(5, result.num_rows());
    ASSERT_EQ((std::vector<std::string>{"Lower", "Lower", "Lower", "Upper", "Upper"}),
              income_groups(result));
    ASSERT_FALSE(fact.contains("INCOME_GROUP"));
}

TEST(ConfigFactories, AnalysisFactExcludesSentinelBeforeBucketing) {
    auto fact = create_access_income_fact();
    auto config = create_income_bucket_config();
    config.analysis.condition.missing_sentinel = core::Code{9};
    auto log = DiagnosticLog{};

    auto result = create_analysis_fact(fact, config, log);

    ASSERT_EQ(4, result.num_rows());
    ASSERT_EQ(5, fact.num_rows());
    ASSERT_EQ(2, log.count(DiagnosticLevel::info));

    auto expected = create_quantile_bucketizer(config.buckets.quantile.front())
                        .assign({10.0, 20.0, 30.0, 40.0});
    ASSERT_EQ((std::vector<double>{10.0, 25.0, 40.0}), expected.edges);
    ASSERT_EQ(expected.labels, income_groups(result));
    ASSERT_EQ((std::vector<std::string>{"Lower", "Lower", "Upper", "Upper"}),
              income_groups(result));
}

TEST(ConfigFactories, AnalysisFactMissingSentinelColumnThrows) {
    auto fact = create_access_income_fact();
    auto config = create_income_bucket_config();
    config.analysis.condition.column = "MISSING";
    config.analysis.condition.missing_sentinel = core::Code{9};
    auto log = DiagnosticLog{};

    ASSERT_THROW(create_analysis_fact(fact, config, log), MalformedInputError);
}
