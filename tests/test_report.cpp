#include "ImputationSession.h"
#include "ReportEngine.h"
#include "RunReport.h"
#include "TestFixtures.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace MenderTest;

namespace {
bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}
} // namespace

TEST(ReportEngineTest, TablesEscapePipesAndLineBreaks) {
    ReportEngine report;
    report.addTable("Labels", {"Name", "Value"}, {{"a|b", "line\nbreak"}});
    EXPECT_EQ(report.markdown(),
              "## Labels\n\n| Name | Value |\n| --- | --- |\n| a\\|b | line<br>break |\n\n");
}

TEST(ReportEngineTest, TallTablesGetPreviewAndDetails) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 130; ++i) rows.push_back({std::to_string(i)});
    ReportEngine report;
    report.addTable("Tall", {"n"}, rows);

    const std::string& md = report.markdown();
    EXPECT_TRUE(contains(md, "120 of 130 rows"));
    EXPECT_TRUE(contains(md, "<details>"));
    EXPECT_TRUE(contains(md, "| 129 |"));
}

TEST(RunReportTest, SummarizesRunAndFallbacks) {
    RawDataset raw = studentRecords();
    raw.columns.push_back(textColumn("blank", std::vector<std::string>(8, ""),
                                     {0, 1, 2, 3, 4, 5, 6, 7}));

    AutoConfig config;
    config.datasetPath = "students.csv";
    config.continuousColumns = {"age", "grade"};
    config.trackConvergence = true;

    SessionOptions options;
    options.engine = config.engineOptions();
    const SessionResult result = ImputationSession(options).run(raw, config.continuousColumns, 1);
    const std::string md = RunReport::build(config, result, {"out/data_imputed.csv"}).markdown();

    EXPECT_TRUE(contains(md, "# Mender Imputation Report"));
    EXPECT_TRUE(contains(md, "Continuous columns: age, grade"));
    EXPECT_TRUE(contains(md, "Categorical columns: group, blank"));
    EXPECT_TRUE(contains(md, "| blank | 8 | 100.00 |"));
    EXPECT_TRUE(contains(md, "| 1 | blank | empty_training_set |"));
    EXPECT_TRUE(contains(md, "## Convergence Trace"));
    EXPECT_TRUE(contains(md, "- out/data_imputed.csv"));
}

TEST(RunReportTest, CompleteDataReportsNothingToImpute) {
    RawDataset raw;
    raw.columns.push_back(numericColumn("x", {1, 2}));
    AutoConfig config;
    config.datasetPath = "x.csv";

    const SessionResult result = ImputationSession(SessionOptions{}).run(raw, {}, 1);
    const std::string md = RunReport::build(config, result, {}).markdown();
    EXPECT_TRUE(contains(md, "No missing values were found"));
    EXPECT_FALSE(contains(md, "## Fallbacks"));
}

TEST(RunReportTest, FixedFormattingSnapsNegativeZero) {
    EXPECT_EQ(RunReport::toFixed(-0.00001, 2), "0.00");
    EXPECT_EQ(RunReport::toFixed(3.14159), "3.1416");
    EXPECT_EQ(RunReport::toFixed(std::nan("")), "n/a");
}
