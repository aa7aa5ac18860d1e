#pragma once
#include "ChainedEquationsEngine.h"
#include "MissingnessReporter.h"
#include "Statistics.h"
#include "TypedDataset.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

struct SessionOptions {
    EngineOptions engine;
};

/**
 * @brief Row-aligned before/after view of one column that had missing cells.
 * @details before is the sanitized column (MISSING per its mask), after is the
 * completed column of chain 0. Both use the same row indexing.
 */
struct ColumnComparison {
    std::string column;
    ColumnRole role = ColumnRole::CONTINUOUS;
    TypedColumn before;
    TypedColumn after;
    std::vector<size_t> imputedRows;

    // Continuous: observed values before, completed values after.
    ColumnStats statsBefore;
    ColumnStats statsAfter;
    // Categorical: label counts over observed cells before, all cells after.
    std::map<std::string, size_t> labelsBefore;
    std::map<std::string, size_t> labelsAfter;
};

struct SessionResult {
    MissingnessTable missingness;
    TypedDataset sanitizedOriginal;
    std::vector<ColumnRole> roles;
    std::vector<TypedDataset> completedDatasets;
    std::vector<ColumnComparison> comparisons;
    EngineReport engineReport;

    /// True when the sanitized dataset had no MISSING cell and the engine was skipped.
    bool nothingToImpute() const noexcept { return completedDatasets.empty(); }
};

/**
 * @brief One request/response imputation cycle: classify, sanitize, report, impute.
 * @details Performs no I/O; loaders and writers attach around run().
 */
class ImputationSession {
public:
    explicit ImputationSession(SessionOptions options) : options_(std::move(options)) {}

    /**
     * @brief Runs the full cycle with the given number of chains.
     * @post completedDatasets is empty iff the sanitized dataset has no MISSING cell,
     *       otherwise it holds exactly chains datasets in chain order.
     * @throws Mender::DataValidityException for empty input, duplicate names or
     *         unknown continuous column names.
     * @throws Mender::ConfigurationException when chains is zero.
     */
    SessionResult run(const RawDataset& raw, const std::vector<std::string>& continuousColumnNames, size_t chains) const;

    const SessionOptions& options() const noexcept { return options_; }

    static std::vector<ColumnComparison> compareColumns(const TypedDataset& original, const TypedDataset& completed);

private:
    SessionOptions options_;
};
