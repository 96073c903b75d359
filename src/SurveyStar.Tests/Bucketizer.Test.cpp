#include "pch.h"

#include "SurveyStar.Core/column_numeric.h"
#include "SurveyStar/bucketizer.h"
#include "SurveyStar/errors.h"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace sstar;

TEST(TestBucketizer, DefaultAgeBands) {
    auto bucketizer = FixedEdgeBucketizer{default_age_bands()};

    ASSERT_EQ("0-18", bucketizer.assign(10.0));
    ASSERT_EQ("0-18", bucketizer.assign(0.0));
    ASSERT_EQ("0-18", bucketizer.assign(18.0));
    ASSERT_EQ("19-25", bucketizer.assign(19.0));
    ASSERT_EQ("26-35", bucketizer.assign(30.0));
    ASSERT_EQ("36-50", bucketizer.assign(50.0));
    ASSERT_EQ("51-65", bucketizer.assign(65.0));
    ASSERT_EQ("65+", bucketizer.assign(66.0));
    ASSERT_EQ("65+", bucketizer.assign(100.0));
}

TEST(TestBucketizer, FixedEdgeOutOfRangeValues) {
    auto bucketizer = FixedEdgeBucketizer{default_age_bands()};

    ASSERT_EQ("0-18", bucketizer.assign(-5.0));
    ASSERT_EQ("Unknown", bucketizer.assign(999.0));
    ASSERT_EQ("Unknown", bucketizer.assign(std::nullopt));
    ASSERT_EQ("Unknown", bucketizer.assign(std::nan("")));

    auto labels = bucketizer.assign({10.0, std::nullopt, 70.0});
    ASSERT_EQ((std::vector<std::string>{"0-18", "Unknown", "65+"}), labels);
}

TEST(TestBucketizer, FixedEdgeFirstBandWins) {
    auto bands = std::vector<BucketBand>{
        BucketBand{.range = core::DoubleInterval{0.0, 10.0}, .label = "Low"},
        BucketBand{.range = core::DoubleInterval{10.0, 20.0}, .label = "High"},
    };

    auto bucketizer = FixedEdgeBucketizer{bands, "Other"};

    ASSERT_EQ("Low", bucketizer.assign(10.0));
    ASSERT_EQ("High", bucketizer.assign(10.5));
    ASSERT_EQ("Other", bucketizer.assign(25.0));
    ASSERT_EQ("Other", bucketizer.unknown_label());
    ASSERT_EQ((std::vector<std::string>{"Low", "High", "Other"}), bucketizer.labels());
    ASSERT_THROW(FixedEdgeBucketizer(std::vector<BucketBand>{}), std::invalid_argument);
}

TEST(TestBucketizer, QuantileBucketsWithEnoughDistinctValues) {
    auto values = std::vector<std::optional<double>>{};
    for (auto i = 1; i <= 14; i++) {
        values.emplace_back(static_cast<double>(i));
    }

    values.emplace_back(0.0);
    values.emplace_back(std::nullopt);
    values.emplace_back(-5.0);

    auto bucketizer = QuantileBucketizer{};
    auto result = bucketizer.assign(values);

    ASSERT_EQ(BucketingPath::quantile, result.path);
    ASSERT_EQ(values.size(), result.labels.size());
    ASSERT_EQ(8, result.edges.size());
    ASSERT_DOUBLE_EQ(1.0, result.edges.front());
    ASSERT_DOUBLE_EQ(14.0, result.edges.back());

    ASSERT_EQ("Very Low Income", result.labels[0]);
    ASSERT_EQ("Very Low Income", result.labels[1]);
    ASSERT_EQ("Low Income", result.labels[2]);
    ASSERT_EQ("Very High", result.labels[13]);
    ASSERT_EQ("No Income", result.labels[14]);
    ASSERT_EQ("Unknown", result.labels[15]);
    ASSERT_EQ("No Income", result.labels[16]);

    ASSERT_EQ(9, result.categories.size());
    ASSERT_EQ("No Income", result.categories.front());
    ASSERT_EQ("Unknown", result.categories.back());
}

TEST(TestBucketizer, QuantileFallbackWithFewDistinctValues) {
    auto values = std::vector<std::optional<double>>{5000.0,  25000.0, 25000.0, 0.0,
                                                     std::nullopt, 20000.0, 150000.0};

    auto bucketizer = QuantileBucketizer{};
    auto result = bucketizer.assign(values);

    ASSERT_EQ(BucketingPath::fallback, result.path);
    ASSERT_TRUE(result.edges.empty());
    ASSERT_EQ((std::vector<std::string>{"Very Low", "Low", "Low", "No Income", "Unknown",
                                        "Very Low", "Very High"}),
              result.labels);
    ASSERT_EQ("Unknown", result.categories.back());
    ASSERT_EQ("fallback", to_string(result.path));
}

TEST(TestBucketizer, QuantileWithoutPositiveValues) {
    auto values = std::vector<std::optional<double>>{0.0, std::nullopt, -10.0, std::nan("")};

    auto result = QuantileBucketizer{}.assign(values);

    ASSERT_EQ(BucketingPath::quantile, result.path);
    ASSERT_EQ((std::vector<std::string>{"No Income", "Unknown", "No Income", "Unknown"}),
              result.labels);
}

TEST(TestBucketizer, QuantileEdgesCollapseDuplicates) {
    auto options = QuantileBucketOptions{};
    options.quantiles = 2;
    options.labels = {"Lower", "Upper"};
    auto bucketizer = QuantileBucketizer{options};

    auto edges = bucketizer.try_quantile_edges({1.0, 1.0, 1.0, 2.0});
    ASSERT_TRUE(edges.has_value());
    ASSERT_EQ((std::vector<double>{1.0, 2.0}), edges.value());

    ASSERT_FALSE(bucketizer.try_quantile_edges({3.0, 3.0}).has_value());
    ASSERT_FALSE(bucketizer.try_quantile_edges({}).has_value());

    auto result = bucketizer.assign({1.0, 1.0, 1.0, 2.0});
    ASSERT_EQ(BucketingPath::quantile, result.path);
    ASSERT_EQ((std::vector<std::string>{"Lower", "Lower", "Lower", "Upper"}), result.labels);
}

TEST(TestBucketizer, QuantileEdgesWithInfiniteValue) {
    auto infinity = std::numeric_limits<double>::infinity();
    auto values = std::vector<std::optional<double>>{1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, infinity};

    auto result = QuantileBucketizer{}.assign(values);

    ASSERT_EQ(BucketingPath::quantile, result.path);
    ASSERT_EQ(8u, result.edges.size());
    ASSERT_TRUE(std::none_of(result.edges.cbegin(), result.edges.cend(),
                             [](double edge) { return std::isnan(edge); }));
    ASSERT_EQ(7.0, result.edges[6]);
    ASSERT_TRUE(std::isinf(result.edges.back()));
    ASSERT_EQ("High", result.labels[6]);
    ASSERT_EQ("Very High", result.labels[7]);
}

TEST(TestBucketizer, QuantileEdgesWithVeryLargeValues) {
    auto options = QuantileBucketOptions{};
    options.quantiles = 4;
    options.labels = {"Q1", "Q2", "Q3", "Q4"};
    auto bucketizer = QuantileBucketizer{options};

    auto edges = bucketizer.try_quantile_edges({1.0, 2.0, 3.0, 1e300});
    ASSERT_TRUE(edges.has_value());
    ASSERT_EQ(5u, edges->size());
    ASSERT_DOUBLE_EQ(1.75, edges->at(1));
    ASSERT_DOUBLE_EQ(2.5, edges->at(2));
    ASSERT_TRUE(std::isfinite(edges->at(3)));
    ASSERT_EQ(1e300, edges->back());

    auto infinity = std::numeric_limits<double>::infinity();
    auto result = bucketizer.assign({1.0, 2.0, 3.0, infinity});
    ASSERT_TRUE(std::none_of(result.edges.cbegin(), result.edges.cend(),
                             [](double edge) { return std::isnan(edge); }));
    ASSERT_EQ((std::vector<std::string>{"Q1", "Q2", "Q3", "Q3"}), result.labels);
}

TEST(TestBucketizer, FallbackBandsAreRightInclusive) {
    auto bucketizer = QuantileBucketizer{};

    ASSERT_EQ("No Income", bucketizer.fallback(0.0));
    ASSERT_EQ("Very Low", bucketizer.fallback(20000.0));
    ASSERT_EQ("Low", bucketizer.fallback(20000.01));
    ASSERT_EQ("High", bucketizer.fallback(100000.0));
    ASSERT_EQ("Very High", bucketizer.fallback(1e9));
}

TEST(TestBucketizer, QuantileOptionsValidation) {
    auto options = QuantileBucketOptions{};
    options.quantiles = 0;
    options.labels.clear();
    ASSERT_THROW(QuantileBucketizer{options}, std::invalid_argument);

    options = QuantileBucketOptions{};
    options.quantiles = 3;
    ASSERT_THROW(QuantileBucketizer{options}, std::invalid_argument);

    options = QuantileBucketOptions{};
    options.fallback = {FallbackBand{.upper_edge = 10.0, .label = "Low"}};
    ASSERT_THROW(QuantileBucketizer{options}, std::invalid_argument);

    options = QuantileBucketOptions{};
    options.fallback = {FallbackBand{.upper_edge = 10.0, .label = "A"},
                        FallbackBand{.upper_edge = 5.0, .label = "B"},
                        FallbackBand{.upper_edge = std::numeric_limits<double>::infinity(),
                                     .label = "C"}};
    ASSERT_THROW(QuantileBucketizer{options}, std::invalid_argument);
}

TEST(TestBucketizer, AddBucketColumnsToTable) {
    auto table = core::DataTable{};
    table.add(std::make_unique<core::IntegerDataTableColumn>(
        "AGE", std::vector<int>{10, 30, 70, 0}, std::vector<bool>{false, false, false, true}));
    table.add(std::make_unique<core::StringDataTableColumn>(
        "INCOME", std::vector<std::string>{"5000", "n/a", "25000", "0"}));

    add_bucket_column(table, "AGE", "AGE_GROUP", FixedEdgeBucketizer{default_age_bands()});

    const auto &ages = dynamic_cast<const core::StringDataTableColumn &>(table.column("AGE_GROUP"));
    ASSERT_EQ("0-18", ages.value_unsafe(0));
    ASSERT_EQ("26-35", ages.value_unsafe(1));
    ASSERT_EQ("65+", ages.value_unsafe(2));
    ASSERT_EQ("Unknown", ages.value_unsafe(3));

    auto log = DiagnosticLog{};
    auto path = add_bucket_column(table, "INCOME", "INCOME_GROUP", QuantileBucketizer{}, log);
    ASSERT_EQ(BucketingPath::fallback, path);
    ASSERT_EQ(1, log.count(DiagnosticLevel::warning));

    const auto &incomes =
        dynamic_cast<const core::StringDataTableColumn &>(table.column("INCOME_GROUP"));
    ASSERT_EQ("Very Low", incomes.value_unsafe(0));
    ASSERT_EQ("Unknown", incomes.value_unsafe(1));
    ASSERT_EQ("Low", incomes.value_unsafe(2));
    ASSERT_EQ("No Income", incomes.value_unsafe(3));

    ASSERT_THROW(add_bucket_column(table, "MISSING", "OTHER",
                                   FixedEdgeBucketizer{default_age_bands()}),
                 MalformedInputError);
}
