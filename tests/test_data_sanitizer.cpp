#include "DataSanitizer.h"
#include "MenderExceptions.h"
#include "TestFixtures.h"

#include <gtest/gtest.h>
#include <limits>

using namespace MenderTest;

namespace {
const std::vector<ColumnRole> kNumericThenText = {ColumnRole::CONTINUOUS, ColumnRole::CATEGORICAL};
}

TEST(DataSanitizerTest, InfinitiesAndBlanksBecomeMissing) {
    RawDataset raw;
    raw.columns.push_back(numericColumn("x", {1.0, std::numeric_limits<double>::infinity(),
                                              -std::numeric_limits<double>::infinity(), 4.0}));
    raw.columns.push_back(textColumn("label", {"a", "   ", "inf", "-Infinity"}));

    const TypedDataset out = DataSanitizer::run(raw, kNumericThenText);

    EXPECT_EQ(out.columns()[0].missing, (MissingMask{0, 1, 1, 0}));
    EXPECT_EQ(out.columns()[1].missing, (MissingMask{0, 1, 1, 1}));
    EXPECT_DOUBLE_EQ(numbers(out, 0)[3], 4.0);
    EXPECT_EQ(labels(out, 1)[0], "a");
}

TEST(DataSanitizerTest, ContinuousTextIsParsedAndBadValuesDegrade) {
    RawDataset raw;
    raw.columns.push_back(textColumn("x", {" 3.5 ", "+2", "1e3", "abc", "12kg", ""}));
    raw.columns.push_back(textColumn("label", {"a", "b", "c", "d", "e", "f"}));

    const TypedDataset out = DataSanitizer::run(raw, kNumericThenText);

    const auto& x = numbers(out, 0);
    EXPECT_DOUBLE_EQ(x[0], 3.5);
    EXPECT_DOUBLE_EQ(x[1], 2.0);
    EXPECT_DOUBLE_EQ(x[2], 1000.0);
    EXPECT_EQ(out.columns()[0].missing, (MissingMask{0, 0, 0, 1, 1, 1}));
    EXPECT_EQ(out.columns()[1].missingCount(), 0u);
}

TEST(DataSanitizerTest, NaNDoubleIsMissingInBothRoles) {
    RawDataset raw;
    raw.columns.push_back(numericColumn("x", {1.0, std::numeric_limits<double>::quiet_NaN()}));
    raw.columns.push_back(numericColumn("code", {std::numeric_limits<double>::quiet_NaN(), 7.0}));

    const TypedDataset out = DataSanitizer::run(raw, kNumericThenText);

    EXPECT_EQ(out.columns()[0].missing, (MissingMask{0, 1}));
    EXPECT_EQ(out.columns()[1].missing, (MissingMask{1, 0}));
    EXPECT_EQ(labels(out, 1)[1], "7");
}

TEST(DataSanitizerTest, CategoricalTextIsKeptVerbatim) {
    RawDataset raw;
    raw.columns.push_back(textColumn("label", {" spaced ", "Mixed Case"}));

    const TypedDataset out = DataSanitizer::run(raw, std::vector<ColumnRole>{ColumnRole::CATEGORICAL});

    EXPECT_EQ(labels(out, 0)[0], " spaced ");
    EXPECT_EQ(labels(out, 0)[1], "Mixed Case");
}

TEST(DataSanitizerTest, InputIsNotModified) {
    const RawDataset raw = studentRecords();
    const RawDataset copy = raw;

    (void)DataSanitizer::run(raw, std::vector<std::string>{"age", "grade"});

    ASSERT_EQ(raw.colCount(), copy.colCount());
    for (size_t c = 0; c < raw.colCount(); ++c) {
        EXPECT_EQ(raw.columns[c].name, copy.columns[c].name);
        EXPECT_EQ(raw.columns[c].cells, copy.columns[c].cells);
    }
}

TEST(DataSanitizerTest, SanitizingTwiceIsStable) {
    const std::vector<std::string> continuousNames = {"age", "grade"};
    const TypedDataset once = DataSanitizer::run(studentRecords(), continuousNames);

    RawDataset again;
    for (const auto& col : once.columns()) {
        RawColumn raw{col.name, {}};
        for (size_t r = 0; r < once.rowCount(); ++r) {
            if (col.missing[r]) raw.cells.emplace_back(std::monostate{});
            else if (col.role == ColumnRole::CONTINUOUS) raw.cells.emplace_back(std::get<std::vector<double>>(col.values)[r]);
            else raw.cells.emplace_back(std::get<std::vector<std::string>>(col.values)[r]);
        }
        again.columns.push_back(std::move(raw));
    }

    EXPECT_EQ(DataSanitizer::run(again, continuousNames), once);
}

TEST(DataSanitizerTest, RejectsEmptyRaggedAndDuplicateInput) {
    EXPECT_THROW(DataSanitizer::run(RawDataset{}, std::vector<ColumnRole>{}), Mender::DataValidityException);

    RawDataset noRows;
    noRows.columns.push_back(RawColumn{"x", {}});
    EXPECT_THROW(DataSanitizer::run(noRows, std::vector<ColumnRole>{ColumnRole::CONTINUOUS}),
                 Mender::DataValidityException);

    RawDataset ragged;
    ragged.columns.push_back(numericColumn("x", {1, 2, 3}));
    ragged.columns.push_back(textColumn("y", {"a", "b"}));
    EXPECT_THROW(DataSanitizer::run(ragged, kNumericThenText), Mender::DataValidityException);

    RawDataset duplicate;
    duplicate.columns.push_back(numericColumn("x", {1, 2}));
    duplicate.columns.push_back(textColumn("x", {"a", "b"}));
    try {
        DataSanitizer::run(duplicate, kNumericThenText);
        FAIL() << "expected DataValidityException";
    } catch (const Mender::DataValidityException& e) {
        EXPECT_EQ(e.columns(), std::vector<std::string>{"x"});
    }
}

TEST(DataSanitizerTest, RoleCountMustMatchColumns) {
    EXPECT_THROW(DataSanitizer::run(studentRecords(), std::vector<ColumnRole>{ColumnRole::CONTINUOUS}),
                 Mender::DataValidityException);
}

TEST(DataSanitizerTest, ParseNumberRejectsPartialInput) {
    double v = 0.0;
    EXPECT_TRUE(DataSanitizer::parseNumber("  -4.25\t", v));
    EXPECT_DOUBLE_EQ(v, -4.25);
    EXPECT_FALSE(DataSanitizer::parseNumber("4.25.1", v));
    EXPECT_FALSE(DataSanitizer::parseNumber("+", v));
    EXPECT_FALSE(DataSanitizer::parseNumber("inf", v));
    EXPECT_TRUE(DataSanitizer::isInfinityToken(" INF "));
    EXPECT_FALSE(DataSanitizer::isInfinityToken("info"));
}
