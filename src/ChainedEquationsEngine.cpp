#include "ChainedEquationsEngine.h"
#include "CommonUtils.h"
#include "MenderExceptions.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <map>
#include <numeric>
#include <random>
#include <set>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;

const char* const kUnknownLabel = "Unknown";

struct ColumnPlan {
    size_t col = 0;
    std::vector<size_t> observedRows;
    std::vector<size_t> missingRows;
    // Sorted distinct observed labels of a categorical target; class code = position.
    StrVec classes;
    bool modelled = true;
};

struct ChainTrace {
    std::vector<FallbackNote> fallbacks;
    std::vector<ConvergencePoint> convergence;
    std::vector<std::string> log;
};

void checkCancelled(const EngineOptions& options, const std::string& where) {
    if (options.cancel != nullptr && options.cancel->load()) {
        throw Mender::CancelledException("imputation stopped " + where);
    }
}

void validateInput(const TypedDataset& data) {
    if (data.colCount() == 0 || data.rowCount() == 0) {
        throw Mender::DataValidityException("cannot impute an empty dataset");
    }

    std::vector<std::string> badStorage;
    std::vector<std::string> nonFinite;
    for (const auto& col : data.columns()) {
        if (col.role == ColumnRole::CATEGORICAL) {
            if (!std::holds_alternative<StrVec>(col.values)) badStorage.push_back(col.name);
            continue;
        }
        const auto* values = std::get_if<NumVec>(&col.values);
        if (values == nullptr) {
            badStorage.push_back(col.name);
            continue;
        }
        for (size_t r = 0; r < values->size(); ++r) {
            if (!col.missing[r] && !std::isfinite((*values)[r])) {
                nonFinite.push_back(col.name);
                break;
            }
        }
    }
    if (!badStorage.empty()) {
        throw Mender::DataValidityException("column storage does not match its role", badStorage);
    }
    if (!nonFinite.empty()) {
        throw Mender::DataValidityException("continuous columns hold non-finite observed values", nonFinite);
    }
}

std::vector<ColumnPlan> planColumns(const TypedDataset& data) {
    std::vector<ColumnPlan> plans;
    for (size_t c = 0; c < data.colCount(); ++c) {
        const auto& col = data.columns()[c];
        if (!col.hasMissing()) continue;

        ColumnPlan plan;
        plan.col = c;
        for (size_t r = 0; r < data.rowCount(); ++r) {
            (col.missing[r] ? plan.missingRows : plan.observedRows).push_back(r);
        }
        if (col.role == ColumnRole::CATEGORICAL) {
            const auto& values = std::get<StrVec>(col.values);
            std::set<std::string> labels;
            for (size_t r : plan.observedRows) labels.insert(values[r]);
            plan.classes.assign(labels.begin(), labels.end());
        }
        plans.push_back(std::move(plan));
    }
    return plans;
}

size_t distinctObserved(const TypedColumn& col, const ColumnPlan& plan) {
    if (col.role == ColumnRole::CATEGORICAL) return plan.classes.size();
    const auto& values = std::get<NumVec>(col.values);
    std::set<double> seen;
    for (size_t r : plan.observedRows) {
        seen.insert(values[r]);
        if (seen.size() > 1) break;
    }
    return seen.size();
}

template <typename T>
void fillRows(std::vector<T>& values, const std::vector<size_t>& rows, const T& value) {
    for (size_t r : rows) values[r] = value;
}

template <typename T>
void drawFromObserved(std::vector<T>& values, const ColumnPlan& plan, std::mt19937_64& rng) {
    std::uniform_int_distribution<size_t> pick(0, plan.observedRows.size() - 1);
    for (size_t r : plan.missingRows) values[r] = values[plan.observedRows[pick(rng)]];
}

double observedMean(const NumVec& values, const std::vector<size_t>& rows) {
    double sum = 0.0;
    for (size_t r : rows) sum += values[r];
    return sum / static_cast<double>(rows.size());
}

// Most frequent observed label; ties resolve to the lexicographically smallest.
std::string observedMode(const StrVec& values, const std::vector<size_t>& rows) {
    std::map<std::string, size_t> counts;
    for (size_t r : rows) counts[values[r]]++;
    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        if (it->second > best->second) best = it;
    }
    return best->first;
}

/**
 * @brief Row-major features from every column except target.
 * @details Continuous columns contribute their raw current values; categorical
 * columns contribute one indicator per level after the first (levels sorted).
 */
FeatureMatrix buildFeatures(const TypedDataset& working, size_t target, const std::vector<StrVec>& levels) {
    const size_t n = working.rowCount();
    size_t width = 0;
    for (size_t c = 0; c < working.colCount(); ++c) {
        if (c == target) continue;
        width += working.columns()[c].role == ColumnRole::CONTINUOUS ? 1 : (levels[c].empty() ? 0 : levels[c].size() - 1);
    }

    FeatureMatrix X(n);
    for (auto& row : X) row.reserve(width);
    for (size_t c = 0; c < working.colCount(); ++c) {
        if (c == target) continue;
        const auto& col = working.columns()[c];
        if (col.role == ColumnRole::CONTINUOUS) {
            const auto& values = std::get<NumVec>(col.values);
            for (size_t r = 0; r < n; ++r) X[r].push_back(values[r]);
            continue;
        }
        const auto& values = std::get<StrVec>(col.values);
        const auto& lv = levels[c];
        if (lv.size() < 2) continue;
        for (size_t r = 0; r < n; ++r) {
            const auto code = static_cast<size_t>(std::lower_bound(lv.begin(), lv.end(), values[r]) - lv.begin());
            for (size_t l = 1; l < lv.size(); ++l) X[r].push_back(code == l ? 1.0 : 0.0);
        }
    }
    return X;
}

std::vector<StrVec> categoricalLevels(const TypedDataset& working) {
    std::vector<StrVec> levels(working.colCount());
    for (size_t c = 0; c < working.colCount(); ++c) {
        const auto& col = working.columns()[c];
        if (col.role != ColumnRole::CATEGORICAL) continue;
        const auto& values = std::get<StrVec>(col.values);
        std::set<std::string> distinct(values.begin(), values.end());
        levels[c].assign(distinct.begin(), distinct.end());
    }
    return levels;
}

ConvergencePoint summarizeImputed(const TypedColumn& col, const ColumnPlan& plan, size_t chain, size_t iteration) {
    ConvergencePoint point;
    point.chain = chain;
    point.iteration = iteration;
    point.column = col.name;
    point.role = col.role;
    if (plan.missingRows.empty()) return point;

    if (col.role == ColumnRole::CONTINUOUS) {
        const auto& values = std::get<NumVec>(col.values);
        point.mean = observedMean(values, plan.missingRows);
        double ss = 0.0;
        for (size_t r : plan.missingRows) ss += (values[r] - point.mean) * (values[r] - point.mean);
        point.stddev = std::sqrt(ss / static_cast<double>(plan.missingRows.size()));
    } else {
        const auto& values = std::get<StrVec>(col.values);
        std::map<std::string, size_t> counts;
        for (size_t r : plan.missingRows) counts[values[r]]++;
        size_t best = 0;
        for (const auto& [label, count] : counts) {
            if (count > best) {
                best = count;
                point.topLabel = label;
            }
        }
        point.topShare = static_cast<double>(best) / static_cast<double>(plan.missingRows.size());
    }
    return point;
}

void note(ChainTrace& trace, const EngineOptions& options, size_t chain, const TypedColumn& col,
          FallbackKind kind, std::string detail) {
    if (options.verbose) {
        trace.log.push_back("[Mender][Engine] chain " + std::to_string(chain) + " column '" + col.name +
                            "': " + fallbackKindName(kind) + " (" + detail + ")");
    }
    trace.fallbacks.push_back({chain, col.name, kind, std::move(detail)});
}

/**
 * @brief Applies the degenerate-case rules that need no model.
 * @return false when the column is settled and skipped by the iteration passes.
 */
bool settleDegenerateColumn(TypedDataset& working, ColumnPlan& plan, size_t chain,
                            const EngineOptions& options, ChainTrace& trace) {
    auto& col = working.columns()[plan.col];
    if (plan.observedRows.empty()) {
        note(trace, options, chain, col, FallbackKind::EMPTY_TRAINING_SET,
             col.role == ColumnRole::CONTINUOUS ? "filled with 0" : std::string("filled with '") + kUnknownLabel + "'");
        return false;
    }
    if (distinctObserved(col, plan) == 1) {
        if (col.role == ColumnRole::CONTINUOUS) {
            auto& values = std::get<NumVec>(col.values);
            const double only = values[plan.observedRows.front()];
            fillRows(values, plan.missingRows, only);
            note(trace, options, chain, col, FallbackKind::DEGENERATE_COLUMN, "single value " + CommonUtils::formatDouble(only));
        } else {
            auto& values = std::get<StrVec>(col.values);
            fillRows(values, plan.missingRows, plan.classes.front());
            note(trace, options, chain, col, FallbackKind::DEGENERATE_COLUMN, "single label '" + plan.classes.front() + "'");
        }
        return false;
    }
    if (working.colCount() == 1) {
        if (col.role == ColumnRole::CONTINUOUS) {
            auto& values = std::get<NumVec>(col.values);
            const double mean = observedMean(values, plan.observedRows);
            fillRows(values, plan.missingRows, mean);
            note(trace, options, chain, col, FallbackKind::NO_PREDICTORS, "filled with mean " + CommonUtils::formatDouble(mean));
        } else {
            auto& values = std::get<StrVec>(col.values);
            const std::string mode = observedMode(values, plan.observedRows);
            fillRows(values, plan.missingRows, mode);
            note(trace, options, chain, col, FallbackKind::NO_PREDICTORS, "filled with mode '" + mode + "'");
        }
        return false;
    }
    return true;
}

void imputeColumn(TypedDataset& working, const ColumnPlan& plan, const std::vector<StrVec>& levels,
                  size_t chain, const EngineOptions& options, std::mt19937_64& rng,
                  std::set<size_t>& singularNoted, ChainTrace& trace) {
    auto& col = working.columns()[plan.col];
    const FeatureMatrix X = buildFeatures(working, plan.col, levels);
    auto predictor = makePredictor(col.role, options.predictor);

    if (col.role == ColumnRole::CONTINUOUS) {
        auto& values = std::get<NumVec>(col.values);
        NumVec y;
        y.reserve(plan.observedRows.size());
        for (size_t r : plan.observedRows) y.push_back(values[r]);

        predictor->fit(X, plan.observedRows, y);
        const NumVec predicted = predictor->predict(X, plan.missingRows, rng);
        for (size_t i = 0; i < plan.missingRows.size(); ++i) values[plan.missingRows[i]] = predicted[i];

        const auto* regressor = dynamic_cast<const ContinuousRegressor*>(predictor.get());
        if (regressor != nullptr && regressor->usedMeanFallback() && singularNoted.insert(plan.col).second) {
            note(trace, options, chain, col, FallbackKind::SINGULAR_DESIGN, "least squares failed, predicting the mean");
        }
        return;
    }

    auto& values = std::get<StrVec>(col.values);
    NumVec y;
    y.reserve(plan.observedRows.size());
    for (size_t r : plan.observedRows) {
        const auto code = std::lower_bound(plan.classes.begin(), plan.classes.end(), values[r]) - plan.classes.begin();
        y.push_back(static_cast<double>(code));
    }

    predictor->fit(X, plan.observedRows, y);
    const NumVec predicted = predictor->predict(X, plan.missingRows, rng);
    for (size_t i = 0; i < plan.missingRows.size(); ++i) {
        values[plan.missingRows[i]] = plan.classes[static_cast<size_t>(predicted[i])];
    }
}

TypedDataset runChain(const TypedDataset& data, size_t chain, const EngineOptions& options, ChainTrace& trace) {
    std::mt19937_64 rng(options.seed + chain);
    TypedDataset working = data;
    std::vector<ColumnPlan> plans = planColumns(working);

    for (const auto& plan : plans) {
        auto& col = working.columns()[plan.col];
        if (col.role == ColumnRole::CONTINUOUS) {
            auto& values = std::get<NumVec>(col.values);
            if (plan.observedRows.empty()) fillRows(values, plan.missingRows, 0.0);
            else drawFromObserved(values, plan, rng);
        } else {
            auto& values = std::get<StrVec>(col.values);
            if (plan.observedRows.empty()) fillRows(values, plan.missingRows, std::string(kUnknownLabel));
            else drawFromObserved(values, plan, rng);
        }
        std::fill(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(0));
    }

    for (auto& plan : plans) {
        plan.modelled = settleDegenerateColumn(working, plan, chain, options, trace);
    }

    // Imputed labels always come from observed labels, so the encoding is fixed for the chain.
    const std::vector<StrVec> levels = categoricalLevels(working);
    std::set<size_t> singularNoted;

    for (size_t iter = 1; iter <= options.iterations; ++iter) {
        for (const auto& plan : plans) {
            if (!plan.modelled) continue;
            checkCancelled(options, "before column '" + working.columns()[plan.col].name + "' in chain " + std::to_string(chain));
            imputeColumn(working, plan, levels, chain, options, rng, singularNoted, trace);
            if (options.verbose) {
                const auto& col = working.columns()[plan.col];
                trace.log.push_back("[Mender][Engine] chain " + std::to_string(chain) + " iteration " +
                                    std::to_string(iter) + "/" + std::to_string(options.iterations) + ": '" +
                                    col.name + "' <- " + (col.role == ColumnRole::CONTINUOUS ? "ridge+pmm" : "cart") +
                                    " (" + std::to_string(plan.missingRows.size()) + " cells)");
            }
        }
        if (options.trackConvergence) {
            for (const auto& plan : plans) {
                trace.convergence.push_back(summarizeImputed(working.columns()[plan.col], plan, chain, iter));
            }
        }
    }
    return working;
}
} // namespace

const char* fallbackKindName(FallbackKind kind) noexcept {
    switch (kind) {
        case FallbackKind::EMPTY_TRAINING_SET: return "empty_training_set";
        case FallbackKind::DEGENERATE_COLUMN: return "degenerate_column";
        case FallbackKind::NO_PREDICTORS: return "no_predictors";
        case FallbackKind::SINGULAR_DESIGN: return "singular_design";
    }
    return "unknown";
}

std::vector<TypedDataset> ChainedEquationsEngine::run(const TypedDataset& data, EngineReport* report) const {
    if (options_.iterations == 0) throw Mender::ConfigurationException("iterations must be >= 1");
    if (options_.chains == 0) throw Mender::ConfigurationException("chains must be >= 1");
    validateInput(data);

    const size_t chains = options_.chains;
    std::vector<TypedDataset> completed(chains);
    std::vector<ChainTrace> traces(chains);
    std::vector<std::exception_ptr> failures(chains);
    const bool parallel = options_.parallelChains && chains > 1;

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic) if(parallel)
    #endif
    for (size_t chain = 0; chain < chains; ++chain) {
        // Exceptions cannot leave an OpenMP region; they are rethrown below in chain order.
        try {
            checkCancelled(options_, "before chain " + std::to_string(chain));
            completed[chain] = runChain(data, chain, options_, traces[chain]);
        } catch (...) {
            failures[chain] = std::current_exception();
        }
    }
    (void)parallel;

    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }

    if (options_.verbose) {
        for (const auto& trace : traces) {
            for (const auto& line : trace.log) std::cout << line << "\n";
        }
    }

    if (report != nullptr) {
        report->chains = chains;
        report->iterations = options_.iterations;
        report->imputedColumns.clear();
        for (size_t c : data.columnsWithMissing()) report->imputedColumns.push_back(data.columns()[c].name);
        report->fallbacks.clear();
        report->convergence.clear();
        for (auto& trace : traces) {
            report->fallbacks.insert(report->fallbacks.end(), trace.fallbacks.begin(), trace.fallbacks.end());
            report->convergence.insert(report->convergence.end(), trace.convergence.begin(), trace.convergence.end());
        }
    }
    return completed;
}
