#pragma once
#include "ChainedEquationsEngine.h"
#include <cstdint>
#include <string>
#include <vector>

struct AutoConfig {
    std::string datasetPath;
    std::string outputDir = "mender_output";
    std::string reportFile = "mender_report.md"; // empty disables the markdown report
    char delimiter = ',';

    // Columns modelled as continuous; every other column is categorical.
    std::vector<std::string> continuousColumns;

    size_t iterations = 3;
    size_t chains = 1;
    uint64_t seed = 42;
    size_t meanMatchCandidates = 5;
    double ridgeLambda = 1e-3;
    size_t treeMaxDepth = 6;
    size_t treeMinLeaf = 2;
    size_t treeMaxThresholds = 32;
    bool parallelChains = true;
    bool trackConvergence = false;

    std::string exportFormat = "csv";       // csv|parquet|none
    bool verbose = false;

    // Rank tolerance for the least-squares solver.
    double numericEpsilon = 1e-12;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] is the dataset path.
     * @post Returns a validated config object.
     * @throws Mender::ConfigurationException on invalid arguments or values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Mender::ConfigurationException on parse/validation failures.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);

    /**
     * @brief Validates merged configuration invariants and enum-like fields.
     * @throws Mender::ConfigurationException on invalid values.
     */
    void validate() const;

    EngineOptions engineOptions() const;

    static std::string usage();
};
