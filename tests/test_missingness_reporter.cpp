#include "MissingnessReporter.h"
#include "TestFixtures.h"

#include <gtest/gtest.h>

using namespace MenderTest;

TEST(MissingnessReporterTest, SortsByPercentDescendingAndKeepsTieOrder) {
    const TypedDataset data({
        continuous("a", {1, 2, 3}, {0, 0, 1}),
        continuous("b", {1, 2, 3}),
        categorical("c", {"x", "y", "z"}, {1, 1, 0}),
        categorical("d", {"x", "y", "z"}, {0, 1, 0}),
    });

    const MissingnessTable table = MissingnessReporter::build(data);

    ASSERT_EQ(table.size(), 4u);
    EXPECT_EQ(table[0].variable, "c");
    EXPECT_EQ(table[0].missingCount, 2u);
    EXPECT_DOUBLE_EQ(table[0].missingPct, 66.67);
    EXPECT_EQ(table[1].variable, "a");
    EXPECT_EQ(table[2].variable, "d");
    EXPECT_DOUBLE_EQ(table[2].missingPct, 33.33);
    EXPECT_EQ(table[3].variable, "b");
    EXPECT_DOUBLE_EQ(table[3].missingPct, 0.0);
}

TEST(MissingnessReporterTest, RoundsToTwoDecimals) {
    EXPECT_DOUBLE_EQ(MissingnessReporter::roundPercent(1, 8), 12.5);
    EXPECT_DOUBLE_EQ(MissingnessReporter::roundPercent(2, 7), 28.57);
    EXPECT_DOUBLE_EQ(MissingnessReporter::roundPercent(7, 7), 100.0);
    EXPECT_DOUBLE_EQ(MissingnessReporter::roundPercent(0, 0), 0.0);
}

TEST(MissingnessReporterTest, ExactHalvesRoundToEven) {
    EXPECT_DOUBLE_EQ(MissingnessReporter::roundPercent(1, 800), 0.12);
    EXPECT_DOUBLE_EQ(MissingnessReporter::roundPercent(5, 800), 0.62);
}

TEST(MissingnessReporterTest, EmptyDatasetGivesEmptyTable) {
    EXPECT_TRUE(MissingnessReporter::build(TypedDataset{}).empty());
}
