#include "pch.h"

#include "SurveyStar.Core/column_numeric.h"
#include "SurveyStar/errors.h"
#include "SurveyStar/star_schema.h"

using namespace sstar;
using sstar::core::Code;

namespace {

core::DataTable create_raw_extract() {
    auto table = core::DataTable{};
    table.add(std::make_unique<core::IntegerDataTableColumn>("ID", std::vector<int>{1, 2, 3, 4}));
    table.add(std::make_unique<core::IntegerDataTableColumn>("SEX", std::vector<int>{1, 2, 3, 1}));
    table.add(std::make_unique<core::StringDataTableColumn>(
        "AREA", std::vector<std::string>{"urban", "rural", "urban", "urban"}));
    table.add(std::make_unique<core::DoubleDataTableColumn>(
        "WEIGHT", std::vector<double>{1.0, 2.0, 3.0, 4.0}));
    table.add(std::make_unique<core::IntegerDataTableColumn>("ACCESS",
                                                             std::vector<int>{1, 0, 1, 1}));
    return table;
}

CodebookIndex create_codebook() {
    auto defs = CodebookIndex::DefinitionMap{};
    defs.emplace("SEX", VariableDefinition{.description = "Respondent sex",
                                           .codes = {{"1", "Male"}, {"2", "Female"}}});
    defs.emplace("ACCESS", VariableDefinition{.description = "Has access",
                                              .codes = {{"0", "No"}, {"1", "Yes"}}});
    return CodebookIndex{std::move(defs)};
}

StarSchemaOptions create_options() {
    return StarSchemaOptions{.measures = {"WEIGHT", "ACCESS"}, .exclude = {"ID"}};
}

} // namespace

TEST(TestStarSchema, BuildFactAndDimensions) {
    auto log = DiagnosticLog{};
    auto builder = StarSchemaBuilder{create_options(), log};

    auto schema = builder.build(create_raw_extract(), create_codebook());

    ASSERT_EQ(4, schema.fact.num_rows());
    ASSERT_EQ((std::vector<std::string>{"SEX", "AREA", "WEIGHT", "ACCESS"}), schema.fact.names());
    ASSERT_EQ(2, schema.dimensions.size());
    ASSERT_EQ("SEX", schema.dimensions[0].variable());
    ASSERT_EQ("AREA", schema.dimensions[1].variable());

    auto sex = schema.dimension("sex");
    ASSERT_TRUE(sex.has_value());
    ASSERT_EQ(3, sex->get().size());
    ASSERT_EQ("Male", sex->get().label_of(Code{1}).value());
    ASSERT_EQ("Undefined code: 3", sex->get().label_of(Code{3}).value());

    auto area = schema.dimension("AREA");
    ASSERT_TRUE(area.has_value());
    ASSERT_FALSE(area->get().is_labelled());
    ASSERT_EQ(2, area->get().size());

    ASSERT_FALSE(schema.dimension("ACCESS").has_value());
    ASSERT_FALSE(schema.dimension("ID").has_value());
}

TEST(TestStarSchema, BuildRecordsDiagnostics) {
    auto log = DiagnosticLog{};
    auto builder = StarSchemaBuilder{create_options(), log};

    auto schema = builder.build(create_raw_extract(), create_codebook());

    ASSERT_EQ(2, log.count(DiagnosticLevel::warning));
    ASSERT_EQ(1, log.count(DiagnosticLevel::info));
    ASSERT_FALSE(log.has_errors());

    auto summary = schema.to_string();
    ASSERT_NE(std::string::npos, summary.find("2 dimension(s)"));
    ASSERT_NE(std::string::npos, summary.find("Respondent sex"));
    ASSERT_NE(std::string::npos, summary.find("no definition"));
}

TEST(TestStarSchema, MissingMeasureThrows) {
    auto log = DiagnosticLog{};
    auto options = create_options();
    options.measures.emplace("INCOME");
    auto builder = StarSchemaBuilder{options, log};

    ASSERT_THROW(builder.build(create_raw_extract(), create_codebook()), MissingMeasureError);
}

TEST(TestStarSchema, EmptyCodebookGivesUnlabelledDimensions) {
    auto log = DiagnosticLog{};
    auto builder = StarSchemaBuilder{create_options(), log};

    auto schema = builder.build(create_raw_extract(), CodebookIndex{});

    ASSERT_EQ(2, schema.dimensions.size());
    for (const auto &table : schema.dimensions) {
        ASSERT_FALSE(table.is_labelled());
        ASSERT_FALSE(table.description().has_value());
    }

    ASSERT_EQ(2, log.count(DiagnosticLevel::warning));
}

TEST(TestStarSchema, DefinitionWithoutCodesKeepsDescription) {
    auto raw = core::DataTable{};
    raw.add(std::make_unique<core::IntegerDataTableColumn>(
        "REGION", std::vector<int>{0, 0, 0}, std::vector<bool>{true, true, true}));
    raw.add(std::make_unique<core::DoubleDataTableColumn>("WEIGHT",
                                                          std::vector<double>{1.0, 2.0, 3.0}));
    raw.add(std::make_unique<core::IntegerDataTableColumn>("ACCESS", std::vector<int>{1, 0, 1}));

    auto defs = CodebookIndex::DefinitionMap{};
    defs.emplace("REGION", VariableDefinition{.description = "Region of residence", .codes = {}});
    auto log = DiagnosticLog{};
    auto builder = StarSchemaBuilder{StarSchemaOptions{.measures = {"WEIGHT", "ACCESS"}}, log};

    auto schema = builder.build(raw, CodebookIndex{std::move(defs)});

    ASSERT_EQ(1, schema.dimensions.size());
    const auto &region = schema.dimensions.front();
    ASSERT_TRUE(region.empty());
    ASSERT_FALSE(region.is_labelled());
    ASSERT_EQ("Region of residence", region.description().value());

    auto summary = schema.to_string();
    ASSERT_NE(std::string::npos, summary.find("Region of residence"));
    ASSERT_EQ(std::string::npos, summary.find("no definition"));
}
