#include "AutoConfig.h"
#include "MenderExceptions.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace {
AutoConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "mender");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return AutoConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

std::string writeConfig(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}
} // namespace

TEST(AutoConfigTest, DefaultsMatchEngineDefaults) {
    const AutoConfig config = parseArgs({"data.csv"});
    EXPECT_EQ(config.datasetPath, "data.csv");
    EXPECT_EQ(config.iterations, 3u);
    EXPECT_EQ(config.chains, 1u);
    EXPECT_EQ(config.seed, 42u);
    EXPECT_EQ(config.exportFormat, "csv");
    EXPECT_TRUE(config.continuousColumns.empty());

    const EngineOptions options = config.engineOptions();
    EXPECT_EQ(options.iterations, 3u);
    EXPECT_EQ(options.predictor.meanMatchCandidates, 5u);
    EXPECT_EQ(options.cancel, nullptr);
}

TEST(AutoConfigTest, FlagsUseDashedSpelling) {
    const AutoConfig config = parseArgs({"data.tsv", "--delimiter", "tab", "--continuous", "age, income",
                                         "--iterations", "5", "--chains", "4", "--seed", "7",
                                         "--mean-match-candidates", "0", "--ridge-lambda", "0.5",
                                         "--tree-max-depth", "3", "--parallel-chains", "no",
                                         "--track-convergence", "true", "--export", "NONE"});
    EXPECT_EQ(config.delimiter, '\t');
    EXPECT_EQ(config.continuousColumns, (std::vector<std::string>{"age", "income"}));
    EXPECT_EQ(config.iterations, 5u);
    EXPECT_EQ(config.chains, 4u);
    EXPECT_EQ(config.seed, 7u);
    EXPECT_EQ(config.meanMatchCandidates, 0u);
    EXPECT_DOUBLE_EQ(config.ridgeLambda, 0.5);
    EXPECT_EQ(config.treeMaxDepth, 3u);
    EXPECT_FALSE(config.parallelChains);
    EXPECT_TRUE(config.trackConvergence);
    EXPECT_EQ(config.exportFormat, "none");

    const EngineOptions options = config.engineOptions();
    EXPECT_EQ(options.chains, 4u);
    EXPECT_EQ(options.seed, 7u);
    EXPECT_DOUBLE_EQ(options.predictor.ridgeLambda, 0.5);
    EXPECT_FALSE(options.parallelChains);
}

TEST(AutoConfigTest, InvalidArgumentsThrow) {
    EXPECT_THROW(parseArgs({}), Mender::ConfigurationException);
    EXPECT_THROW(parseArgs({"--chains", "2"}), Mender::ConfigurationException);
    EXPECT_THROW(parseArgs({"d.csv", "--chains", "0"}), Mender::ConfigurationException);
    EXPECT_THROW(parseArgs({"d.csv", "--iterations", "-1"}), Mender::ConfigurationException);
    EXPECT_THROW(parseArgs({"d.csv", "--seed", "12abc"}), Mender::ConfigurationException);
    EXPECT_THROW(parseArgs({"d.csv", "--export", "xlsx"}), Mender::ConfigurationException);
    EXPECT_THROW(parseArgs({"d.csv", "--delimiter", "ab"}), Mender::ConfigurationException);
    EXPECT_THROW(parseArgs({"d.csv", "--unknown-flag", "1"}), Mender::ConfigurationException);
    EXPECT_THROW(parseArgs({"d.csv", "--verbose"}), Mender::ConfigurationException);
    EXPECT_THROW(parseArgs({"d.csv", "--verbose", "maybe"}), Mender::ConfigurationException);
}

TEST(AutoConfigTest, YamlAndJsonFilesOverrideDefaults) {
    const std::string yaml = writeConfig("mender_config_test.yaml",
        "# imputation settings\n"
        "continuous: age, income\n"
        "iterations: 6\n"
        "tree-min-leaf: 4\n"
        "output_dir: \"out dir\"\n");
    const AutoConfig fromYaml = AutoConfig::fromFile(yaml, parseArgs({"d.csv"}));
    EXPECT_EQ(fromYaml.continuousColumns, (std::vector<std::string>{"age", "income"}));
    EXPECT_EQ(fromYaml.iterations, 6u);
    EXPECT_EQ(fromYaml.treeMinLeaf, 4u);
    EXPECT_EQ(fromYaml.outputDir, "out dir");
    EXPECT_EQ(fromYaml.datasetPath, "d.csv");

    const std::string json = writeConfig("mender_config_test.json",
        "{\n"
        "  \"continuous\": [\"weight\", \"height\"],\n"
        "  \"chains\": 2,\n"
        "  \"verbose\": true\n"
        "}\n");
    const AutoConfig fromJson = AutoConfig::fromFile(json, parseArgs({"d.csv"}));
    EXPECT_EQ(fromJson.continuousColumns, (std::vector<std::string>{"weight", "height"}));
    EXPECT_EQ(fromJson.chains, 2u);
    EXPECT_TRUE(fromJson.verbose);

    std::filesystem::remove(yaml);
    std::filesystem::remove(json);
}

TEST(AutoConfigTest, ConfigFlagIsAppliedAfterOtherFlags) {
    const std::string path = writeConfig("mender_config_flag.yaml", "chains: 3\n");
    const AutoConfig config = parseArgs({"d.csv", "--chains", "2", "--config", path, "--seed", "9"});
    EXPECT_EQ(config.chains, 3u);
    EXPECT_EQ(config.seed, 9u);
    std::filesystem::remove(path);
}

TEST(AutoConfigTest, BadConfigFileReportsTheLine) {
    const std::string path = writeConfig("mender_config_bad.yaml", "iterations: 2\nchains: zero\n");
    try {
        AutoConfig::fromFile(path, parseArgs({"d.csv"}));
        FAIL() << "expected ConfigurationException";
    } catch (const Mender::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos) << e.what();
    }
    std::filesystem::remove(path);

    EXPECT_THROW(AutoConfig::fromFile("/nonexistent/mender.yaml", AutoConfig{}), Mender::ConfigurationException);
}
