#include "DataSanitizer.h"
#include "DatasetIO.h"
#include "ImputationSession.h"
#include "MenderExceptions.h"
#include "TestFixtures.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace MenderTest;
namespace fs = std::filesystem;

namespace {
class DatasetIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("mender_io_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) const {
        const fs::path path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path dir_;
};
} // namespace

TEST_F(DatasetIOTest, LoadsHeaderAndMapsNullTokensToMissing) {
    const std::string path = writeFile("in.csv",
        "\xEF\xBB\xBF" "age,grade,group\n"
        "19,3.1,a\n"
        "NA,3.4,\n"
        "25,,b,extra\n"
        "30\n");

    const RawDataset raw = DatasetIO::loadDelimited(path);

    ASSERT_EQ(raw.colCount(), 3u);
    ASSERT_EQ(raw.rowCount(), 4u);
    EXPECT_EQ(raw.columns[0].name, "age");
    EXPECT_EQ(raw.columns[0].cells[0], RawCell(std::string("19")));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(raw.columns[0].cells[1]));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(raw.columns[2].cells[1]));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(raw.columns[1].cells[2]));
    EXPECT_EQ(raw.columns[2].cells[2], RawCell(std::string("b")));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(raw.columns[1].cells[3]));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(raw.columns[2].cells[3]));
}

TEST_F(DatasetIOTest, MalformedRecordsAreSkipped) {
    const std::string path = writeFile("bad.csv", "x,y\n1,2\n3,\"open\n");
    const RawDataset raw = DatasetIO::loadDelimited(path);
    EXPECT_EQ(raw.rowCount(), 1u);
}

TEST_F(DatasetIOTest, LoaderErrors) {
    EXPECT_THROW(DatasetIO::loadDelimited((dir_ / "absent.csv").string()), Mender::IOException);
    EXPECT_THROW(DatasetIO::loadDelimited(writeFile("empty.csv", "")), Mender::DatasetException);
    EXPECT_THROW(DatasetIO::loadDelimited(writeFile("q.csv", "a\n"), '"'), Mender::DatasetException);
}

TEST_F(DatasetIOTest, WrittenDatasetLoadsBackToTheSameTypedData) {
    const TypedDataset original({
        continuous("score", {1.5, 0.1, -2e-7, 0}, {0, 0, 0, 1}),
        categorical("note", {"plain", "with,comma", " padded ", ""}, {0, 0, 0, 1}),
    });
    const std::string path = (dir_ / "round.csv").string();

    DatasetIO::writeDatasetCSV(original, path);
    const TypedDataset reloaded = DataSanitizer::run(DatasetIO::loadDelimited(path),
                                                     std::vector<std::string>{"score"});

    EXPECT_EQ(reloaded, original);
}

TEST_F(DatasetIOTest, ToRawKeepsTypesAndMissingCells) {
    const TypedDataset data({
        continuous("v", {2.5, 0}, {0, 1}),
        categorical("c", {"", "z"}, {1, 0}),
    });
    const RawDataset raw = DatasetIO::toRaw(data);
    EXPECT_EQ(raw.columns[0].cells[0], RawCell(2.5));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(raw.columns[0].cells[1]));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(raw.columns[1].cells[0]));
    EXPECT_EQ(raw.columns[1].cells[1], RawCell(std::string("z")));
    EXPECT_EQ(DatasetIO::cellText(data.columns()[0], 1), "");
}

TEST_F(DatasetIOTest, MissingnessCsvLayout) {
    const MissingnessTable table = {{"age", 2, 25.0}, {"grade", 0, 0.0}};
    const std::string path = (dir_ / "missingness.csv").string();
    DatasetIO::writeMissingnessCSV(table, path);
    EXPECT_EQ(readFile(path), "variable,missing_count,missing_pct\nage,2,25\ngrade,0,0\n");
}

TEST_F(DatasetIOTest, WriteResultsNamesFilesPerChain) {
    SessionOptions options;
    const ImputationSession session(options);

    const SessionResult single = session.run(studentRecords(), {"age", "grade"}, 1);
    const auto oneChain = DatasetIO::writeResults(single, (dir_ / "one").string());
    ASSERT_EQ(oneChain.size(), 3u);
    EXPECT_EQ(fs::path(oneChain[0]).filename().string(), "missingness.csv");
    EXPECT_EQ(fs::path(oneChain[1]).filename().string(), "data_original.csv");
    EXPECT_EQ(fs::path(oneChain[2]).filename().string(), "data_imputed.csv");

    const SessionResult multi = session.run(studentRecords(), {"age", "grade"}, 2);
    const auto twoChains = DatasetIO::writeResults(multi, (dir_ / "two").string());
    ASSERT_EQ(twoChains.size(), 4u);
    EXPECT_EQ(fs::path(twoChains[2]).filename().string(), "data_imputed_1.csv");
    EXPECT_EQ(fs::path(twoChains[3]).filename().string(), "data_imputed_2.csv");
    for (const auto& path : twoChains) EXPECT_TRUE(fs::exists(path)) << path;

    EXPECT_TRUE(DatasetIO::writeResults(single, (dir_ / "none").string(), "none").empty());
    EXPECT_FALSE(fs::exists(dir_ / "none"));
    EXPECT_THROW(DatasetIO::writeResults(single, (dir_ / "bad").string(), "xlsx"), Mender::ConfigurationException);
}
