#include "pch.h"

#include "SurveyStar.Core/column_numeric.h"
#include "SurveyStar.Input/csvparser.h"
#include "SurveyStar.Input/result_writer.h"
#include "SurveyStar/errors.h"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

using namespace sstar;
using sstar::core::Code;

namespace {

std::filesystem::path create_output_folder() {
    auto rnd = std::random_device()();
    return std::filesystem::path{::testing::TempDir()} / "sstar_results" / std::to_string(rnd);
}

DimensionTable create_access_table() {
    return DimensionTable{"ACCESS",
                          {DimensionEntry{.code = Code{1},
                                          .label = "Yes, regular",
                                          .description = "Has \"access\"",
                                          .declared = true},
                           DimensionEntry{.code = Code{2},
                                          .label = "No",
                                          .description = "Has \"access\"",
                                          .declared = true}}};
}

DimensionAnalysis create_sex_analysis() {
    auto analysis = DimensionAnalysis{.dimension = "SEX_GROUP", .labelled = true};
    analysis.result.statistics = {
        WeightedStatistic{.dimension_value = Code{2},
                          .percentage = 100.0,
                          .population_estimate = 10.0,
                          .label = "Female"},
        WeightedStatistic{.dimension_value = Code{1},
                          .percentage = 50.0,
                          .population_estimate = 20.0,
                          .label = "Male"}};

    analysis.summary = WeightedAggregator::summarize(analysis.result.statistics);
    return analysis;
}

} // namespace

TEST(TestResultWriter, DimensionCsvQuotesFields) {
    std::stringstream ss;
    input::write_dimension_csv(ss, create_access_table());

    auto expected = std::string{"ACCESS,ACCESS_value,ACCESS_desc\n"
                                "1,\"Yes, regular\",\"Has \"\"access\"\"\"\n"
                                "2,No,\"Has \"\"access\"\"\"\n"};
    ASSERT_EQ(expected, ss.str());
}

TEST(TestResultWriter, StatisticsCsv) {
    std::stringstream ss;
    input::write_statistics_csv(ss, create_sex_analysis());

    auto expected = std::string{"dimension_value,label,population_estimate,percentage\n"
                                "2,Female,10,100\n"
                                "1,Male,20,50\n"};
    ASSERT_EQ(expected, ss.str());
}

TEST(TestResultWriter, FactCsvWritesNullsAsEmpty) {
    auto fact = core::DataTable{};
    fact.add(std::make_unique<core::IntegerDataTableColumn>("SEX", std::vector<int>{1, 2},
                                                            std::vector<bool>{false, true}));
    fact.add(std::make_unique<core::DoubleDataTableColumn>("WEIGHT",
                                                           std::vector<double>{1.5, 2.0}));
    fact.add(std::make_unique<core::StringDataTableColumn>(
        "AREA", std::vector<std::string>{"urban, north", "rural"}));

    std::stringstream ss;
    input::write_fact_csv(ss, fact);

    ASSERT_EQ("SEX,WEIGHT,AREA\n1,1.5,\"urban, north\"\n,2,rural\n", ss.str());
}

TEST(TestResultWriter, MarkdownReport) {
    std::stringstream ss;
    input::write_markdown_report(ss, "Access Report", {create_sex_analysis()});

    auto report = ss.str();
    ASSERT_EQ(0, report.find("# Access Report\n"));
    ASSERT_NE(std::string::npos, report.find("## Overview"));
    ASSERT_NE(std::string::npos, report.find("## Sex Group Analysis"));
    ASSERT_NE(std::string::npos, report.find("### Key Findings"));
    ASSERT_NE(std::string::npos, report.find("- Highest access: 100.0% (Female)"));
    ASSERT_NE(std::string::npos, report.find("- Lowest access: 50.0% (Male)"));
    ASSERT_NE(std::string::npos, report.find("- Range: 50.0 percentage points"));
    ASSERT_NE(std::string::npos, report.find("| 1 | Male | 20 | 50.0 |"));
}

TEST(TestResultWriter, MarkdownReportEscapesTableCells) {
    auto analysis = DimensionAnalysis{.dimension = "REGION", .labelled = true};
    analysis.result.statistics = {
        WeightedStatistic{.dimension_value = Code{std::string{"n|e"}},
                          .percentage = 75.0,
                          .population_estimate = 40.0,
                          .label = "North | East\nCoast"}};

    analysis.summary = WeightedAggregator::summarize(analysis.result.statistics);

    std::stringstream ss;
    input::write_markdown_report(ss, "Access Report", {analysis});

    auto report = ss.str();
    ASSERT_NE(std::string::npos, report.find("| n\\|e | North \\| East Coast | 40 | 75.0 |\n"));
    ASSERT_EQ(std::string::npos, report.find("| North | East"));
}

TEST(TestResultWriter, MarkdownReportWithoutGroups) {
    std::stringstream ss;
    input::write_markdown_report(ss, "Empty", {DimensionAnalysis{.dimension = "AREA"}});

    ASSERT_NE(std::string::npos, ss.str().find("- No groups with data."));
}

TEST(TestResultWriter, FileWriterCreatesFiles) {
    auto folder = create_output_folder();
    {
        auto writer = input::ResultFileWriter{folder, "Access Report"};
        ASSERT_TRUE(std::filesystem::exists(folder));

        writer.write(create_access_table());
        writer.write(create_sex_analysis());
        writer.write_report({create_sex_analysis()});

        ASSERT_EQ(3, writer.files().size());
    }

    ASSERT_TRUE(std::filesystem::exists(folder / "dim_access.csv"));
    ASSERT_TRUE(std::filesystem::exists(folder / "sex_group_statistics.csv"));
    ASSERT_TRUE(std::filesystem::exists(folder / "analysis_report.md"));

    std::ifstream ifs{folder / "dim_access.csv"};
    std::string header;
    std::getline(ifs, header);
    ASSERT_EQ("ACCESS,ACCESS_value,ACCESS_desc", header);
    ifs.close();

    std::filesystem::remove_all(folder);
}

TEST(TestCsvParser, LoadTypedColumns) {
    auto folder = create_output_folder();
    std::filesystem::create_directories(folder);
    auto file_name = folder / "survey.csv";
    {
        std::ofstream ofs{file_name};
        ofs << "ID,Sex,AGE,AREA,IGNORED\n"
            << "1,1,34.5,urban,x\n"
            << "2,,19,rural,y\n"
            << "3,2,,urban,z\n";
    }

    auto info = input::FileInfo{
        .name = file_name,
        .columns = {{"AREA", "string"}, {"SEX", "integer"}, {"AGE", "double"}, {"ID", "integer"}}};

    auto table = input::load_datatable_from_csv(info);

    ASSERT_EQ(3, table.num_rows());
    ASSERT_EQ((std::vector<std::string>{"ID", "SEX", "AGE", "AREA"}), table.names());
    ASSERT_EQ("integer", table.column("SEX").type());
    ASSERT_TRUE(table.column("SEX").is_null(1));
    ASSERT_EQ("double", table.column("AGE").type());
    ASSERT_TRUE(table.column("AGE").is_null(2));
    ASSERT_EQ(34.5, std::any_cast<double>(table.column("AGE").value(0)));
    ASSERT_EQ("rural", std::any_cast<std::string>(table.column("AREA").value(1)));
    ASSERT_FALSE(table.contains("IGNORED"));

    std::filesystem::remove_all(folder);
}

TEST(TestCsvParser, LoadFailures) {
    auto folder = create_output_folder();
    std::filesystem::create_directories(folder);
    auto file_name = folder / "survey.csv";
    {
        std::ofstream ofs{file_name};
        ofs << "ID,SEX\n1,male\n";
    }

    auto info = input::FileInfo{.name = file_name, .columns = {{"ID", "integer"}, {"SEX", "integer"}}};
    ASSERT_THROW(input::load_datatable_from_csv(info), MalformedInputError);

    info.columns = {{"ID", "integer"}, {"REGION", "integer"}};
    ASSERT_THROW(input::load_datatable_from_csv(info), MalformedInputError);

    info.columns = {{"ID", "decimal"}};
    ASSERT_THROW(input::load_datatable_from_csv(info), MalformedInputError);

    std::filesystem::remove_all(folder);
}
