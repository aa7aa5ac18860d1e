#pragma once
#include "ColumnPredictor.h"
#include "TypedDataset.h"
#include <atomic>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct EngineOptions {
    size_t iterations = 3;
    size_t chains = 1;
    uint64_t seed = 42;
    PredictorOptions predictor;
    bool parallelChains = true;
    bool trackConvergence = false;
    bool verbose = false;
    // Polled between column passes and between chains; nullptr disables cancellation.
    const std::atomic<bool>* cancel = nullptr;
};

enum class FallbackKind {
    EMPTY_TRAINING_SET,
    DEGENERATE_COLUMN,
    NO_PREDICTORS,
    SINGULAR_DESIGN
};

const char* fallbackKindName(FallbackKind kind) noexcept;

struct FallbackNote {
    size_t chain = 0;
    std::string column;
    FallbackKind kind = FallbackKind::EMPTY_TRAINING_SET;
    std::string detail;
};

/**
 * @brief Summary of the imputed cells of one column after one iteration.
 * @details Continuous columns fill mean/stddev, categorical columns fill topLabel/topShare.
 */
struct ConvergencePoint {
    size_t chain = 0;
    size_t iteration = 0;
    std::string column;
    ColumnRole role = ColumnRole::CONTINUOUS;
    double mean = 0.0;
    double stddev = 0.0;
    std::string topLabel;
    double topShare = 0.0;
};

struct EngineReport {
    size_t chains = 0;
    size_t iterations = 0;
    std::vector<std::string> imputedColumns;
    std::vector<FallbackNote> fallbacks;
    std::vector<ConvergencePoint> convergence;
};

/**
 * @brief Multiple imputation by chained equations over a sanitized dataset.
 * @details Each chain seeds its own generator with seed + chainIndex, initializes
 * MISSING cells by random draws from the observed values of their column, then
 * refits one predictor per incomplete column for the configured number of
 * passes. Chains are independent and may run in parallel.
 */
class ChainedEquationsEngine {
public:
    explicit ChainedEquationsEngine(EngineOptions options) : options_(std::move(options)) {}

    /**
     * @brief Produces one completed dataset per chain, in chain order.
     * @post every returned dataset has no MISSING cells; cells that were observed
     *       in data are unchanged; column order, names and roles are preserved.
     * @throws Mender::DataValidityException for an empty dataset or a continuous
     *         column with non-numeric storage or non-finite observed values.
     * @throws Mender::ConfigurationException when iterations or chains is zero.
     * @throws Mender::CancelledException when the cancel flag is observed.
     */
    std::vector<TypedDataset> run(const TypedDataset& data, EngineReport* report = nullptr) const;

    const EngineOptions& options() const noexcept { return options_; }

private:
    EngineOptions options_;
};
