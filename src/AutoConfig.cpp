#include "AutoConfig.h"
#include "CommonUtils.h"
#include "MenderExceptions.h"
#include <fstream>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Mender::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Mender::MenderException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Mender::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}' || c == '[' || c == ']')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Flags and file keys share one spelling: "--tree-max-depth" and "tree_max_depth".
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    while (!key.empty() && key.front() == '-') key.erase(key.begin());
    std::string out = CommonUtils::toLower(key);
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    const std::string v = CommonUtils::trim(value);
    if (!v.empty() && v.front() == '-') {
        throw Mender::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    unsigned long long parsed = parseNumericStrict<unsigned long long>(
        v,
        key,
        "Invalid integer for ",
        [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
    if (parsed < minValue) {
        throw Mender::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<size_t>::max())) {
        throw Mender::ConfigurationException("Value for " + key + " exceeds size range");
    }
    return static_cast<size_t>(parsed);
}

uint64_t parseUIntStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::trim(value);
    if (!v.empty() && v.front() == '-') {
        throw Mender::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    return static_cast<uint64_t>(parseNumericStrict<unsigned long long>(
        v,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& s, size_t* pos) { return std::stoull(s, pos); }));
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        CommonUtils::trim(value),
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Mender::ConfigurationException("Value for " + key + " must be >= " + CommonUtils::formatDouble(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Mender::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

void assignKeyValue(AutoConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        const std::string v = value == "\\t" || CommonUtils::toLower(value) == "tab" ? "\t" : value;
        if (v.size() != 1) throw Mender::ConfigurationException("delimiter expects a single character");
        config.delimiter = v[0];
        return;
    }
    if (key == "continuous") {
        config.continuousColumns = CommonUtils::splitList(value);
        return;
    }
    if (key == "seed") {
        config.seed = parseUIntStrict(value, key);
        return;
    }

    struct SizeRule {
        size_t AutoConfig::*member;
        size_t minValue;
    };
    struct DoubleRule {
        double AutoConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string AutoConfig::*> rawStringFields = {
        {"dataset", &AutoConfig::datasetPath},
        {"output_dir", &AutoConfig::outputDir},
        {"report", &AutoConfig::reportFile}
    };
    static const std::unordered_map<std::string, std::string AutoConfig::*> lowerStringFields = {
        {"export", &AutoConfig::exportFormat}
    };
    static const std::unordered_map<std::string, bool AutoConfig::*> boolFields = {
        {"parallel_chains", &AutoConfig::parallelChains},
        {"track_convergence", &AutoConfig::trackConvergence},
        {"verbose", &AutoConfig::verbose}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"iterations", {&AutoConfig::iterations, 1}},
        {"chains", {&AutoConfig::chains, 1}},
        {"mean_match_candidates", {&AutoConfig::meanMatchCandidates, 0}},
        {"tree_max_depth", {&AutoConfig::treeMaxDepth, 1}},
        {"tree_min_leaf", {&AutoConfig::treeMinLeaf, 1}},
        {"tree_max_thresholds", {&AutoConfig::treeMaxThresholds, 1}}
    };
    static const std::unordered_map<std::string, DoubleRule> doubleFields = {
        {"ridge_lambda", {&AutoConfig::ridgeLambda, 0.0}},
        {"numeric_epsilon", {&AutoConfig::numericEpsilon, 0.0}}
    };

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(CommonUtils::trim(value));
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = parseSizeStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    throw Mender::ConfigurationException("Unknown option: " + key);
}
}

std::string AutoConfig::usage() {
    return "Usage: mender <dataset.csv> [--config path] [--output-dir dir] [--delimiter ,] "
           "[--continuous col1,col2] [--iterations N>=1] [--chains N>=1] [--seed N] "
           "[--mean-match-candidates N>=0] [--ridge-lambda >=0] [--tree-max-depth N>=1] "
           "[--tree-min-leaf N>=1] [--tree-max-thresholds N>=1] [--parallel-chains true|false] "
           "[--track-convergence true|false] [--export csv|parquet|none] [--report file.md] "
           "[--numeric-epsilon (0,1)] [--verbose true|false]";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        throw Mender::ConfigurationException(usage());
    }

    AutoConfig config;
    config.datasetPath = argv[1];

    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Mender::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Mender::ConfigurationException(arg + " expects a value");
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            configPath = value;
            continue;
        }
        assignKeyValue(config, normalizeConfigKey(arg), value);
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        if (config.datasetPath.empty()) config.datasetPath = argv[1];
    }

    config.validate();

    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Mender::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        // JSON arrays arrive as "a", "b" once the brackets are stripped.
        if (key == "continuous") {
            std::string joined;
            for (std::string item : CommonUtils::splitList(line.substr(sep + 1))) {
                if (!item.empty() && item.front() == '"') item.erase(item.begin());
                if (!item.empty() && item.back() == '"') item.pop_back();
                if (!joined.empty()) joined += ",";
                joined += item;
            }
            value = joined;
        }

        try {
            assignKeyValue(config, key, value);
        } catch (const Mender::MenderException& ex) {
            throw Mender::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void AutoConfig::validate() const {
    if (datasetPath.empty()) {
        throw Mender::ConfigurationException("dataset path is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(exportFormat, {"none", "csv", "parquet"})) {
        throw Mender::ConfigurationException("export must be one of: none, csv, parquet");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
        throw Mender::ConfigurationException("delimiter cannot be a quote or line break");
    }
    if (iterations < 1) throw Mender::ConfigurationException("iterations must be >= 1");
    if (chains < 1) throw Mender::ConfigurationException("chains must be >= 1");
    if (treeMaxDepth < 1) throw Mender::ConfigurationException("tree_max_depth must be >= 1");
    if (treeMinLeaf < 1) throw Mender::ConfigurationException("tree_min_leaf must be >= 1");
    if (treeMaxThresholds < 1) throw Mender::ConfigurationException("tree_max_thresholds must be >= 1");
    if (!(ridgeLambda >= 0.0) || !std::isfinite(ridgeLambda)) {
        throw Mender::ConfigurationException("ridge_lambda must be a finite value >= 0");
    }
    if (!(numericEpsilon > 0.0) || numericEpsilon >= 1.0) {
        throw Mender::ConfigurationException("numeric_epsilon must be within (0,1)");
    }
    if (outputDir.empty() && exportFormat != "none") {
        throw Mender::ConfigurationException("output_dir is required unless export is none");
    }
}

EngineOptions AutoConfig::engineOptions() const {
    EngineOptions options;
    options.iterations = iterations;
    options.chains = chains;
    options.seed = seed;
    options.predictor.meanMatchCandidates = meanMatchCandidates;
    options.predictor.ridgeLambda = ridgeLambda;
    options.predictor.treeMaxDepth = treeMaxDepth;
    options.predictor.treeMinLeaf = treeMinLeaf;
    options.predictor.treeMaxThresholds = treeMaxThresholds;
    options.parallelChains = parallelChains;
    options.trackConvergence = trackConvergence;
    options.verbose = verbose;
    return options;
}
