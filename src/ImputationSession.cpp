#include "ImputationSession.h"
#include "DataSanitizer.h"
#include "MenderExceptions.h"
#include "SchemaClassifier.h"


namespace {
std::map<std::string, size_t> countLabels(const TypedColumn& col, bool observedOnly) {
    std::map<std::string, size_t> counts;
    const auto& values = std::get<std::vector<std::string>>(col.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (observedOnly && col.missing[r]) continue;
        counts[values[r]]++;
    }
    return counts;
}

std::vector<double> observedValues(const TypedColumn& col) {
    std::vector<double> out;
    const auto& values = std::get<std::vector<double>>(col.values);
    out.reserve(values.size());
    for (size_t r = 0; r < values.size(); ++r) {
        if (!col.missing[r]) out.push_back(values[r]);
    }
    return out;
}
} // namespace

std::vector<ColumnComparison> ImputationSession::compareColumns(const TypedDataset& original, const TypedDataset& completed) {
    std::vector<ColumnComparison> out;
    for (size_t c : original.columnsWithMissing()) {
        const TypedColumn& before = original.columns()[c];
        const TypedColumn& after = completed.columns().at(c);

        ColumnComparison cmp;
        cmp.column = before.name;
        cmp.role = before.role;
        cmp.before = before;
        cmp.after = after;
        for (size_t r = 0; r < before.missing.size(); ++r) {
            if (before.missing[r]) cmp.imputedRows.push_back(r);
        }
        if (before.role == ColumnRole::CONTINUOUS) {
            cmp.statsBefore = Statistics::calculateStats(observedValues(before));
            cmp.statsAfter = Statistics::calculateStats(std::get<std::vector<double>>(after.values));
        } else {
            cmp.labelsBefore = countLabels(before, true);
            cmp.labelsAfter = countLabels(after, false);
        }
        out.push_back(std::move(cmp));
    }
    return out;
}

SessionResult ImputationSession::run(const RawDataset& raw,
                                     const std::vector<std::string>& continuousColumnNames,
                                     size_t chains) const {
    if (chains == 0) throw Mender::ConfigurationException("chains must be >= 1");

    std::vector<std::string> names;
    names.reserve(raw.colCount());
    for (const auto& col : raw.columns) names.push_back(col.name);

    SessionResult result;
    result.roles = SchemaClassifier::classify(names, continuousColumnNames);
    result.sanitizedOriginal = DataSanitizer::run(raw, result.roles);
    result.missingness = MissingnessReporter::build(result.sanitizedOriginal);

    if (result.sanitizedOriginal.totalMissing() == 0) return result;

    EngineOptions engineOptions = options_.engine;
    engineOptions.chains = chains;
    const ChainedEquationsEngine engine(engineOptions);
    result.completedDatasets = engine.run(result.sanitizedOriginal, &result.engineReport);
    result.comparisons = compareColumns(result.sanitizedOriginal, result.completedDatasets.front());
    return result;
}
