#include "RunReport.h"
#include "SchemaClassifier.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {
std::string joinOrNone(const std::vector<std::string>& items) {
    if (items.empty()) return "(none)";
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

void addParameters(ReportEngine& report, const AutoConfig& config, const SessionResult& result) {
    const auto& data = result.sanitizedOriginal;
    report.addTable("Run Parameters", {"Parameter", "Value"}, {
        {"dataset", config.datasetPath},
        {"rows", std::to_string(data.rowCount())},
        {"columns", std::to_string(data.colCount())},
        {"missing cells", std::to_string(data.totalMissing())},
        {"iterations", std::to_string(config.iterations)},
        {"chains", std::to_string(config.chains)},
        {"seed", std::to_string(config.seed)},
        {"mean match candidates", std::to_string(config.meanMatchCandidates)},
        {"ridge lambda", RunReport::toFixed(config.ridgeLambda, 6)},
        {"tree max depth", std::to_string(config.treeMaxDepth)},
        {"tree min leaf", std::to_string(config.treeMinLeaf)}
    });

    const std::vector<std::string> names = data.columnNames();
    report.addParagraph("Continuous columns: " +
                        joinOrNone(SchemaClassifier::namesWithRole(names, result.roles, ColumnRole::CONTINUOUS)));
    report.addParagraph("Categorical columns: " +
                        joinOrNone(SchemaClassifier::namesWithRole(names, result.roles, ColumnRole::CATEGORICAL)));
}

void addMissingness(ReportEngine& report, const MissingnessTable& table) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(table.size());
    for (const auto& row : table) {
        rows.push_back({row.variable, std::to_string(row.missingCount), RunReport::toFixed(row.missingPct, 2)});
    }
    report.addTable("Missingness", {"Variable", "Missing", "Missing %"}, rows);
}

void addFallbacks(ReportEngine& report, const EngineReport& engine) {
    if (engine.fallbacks.empty()) {
        report.addHeading("Fallbacks");
        report.addParagraph("Every incomplete column was modelled.");
        return;
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& note : engine.fallbacks) {
        rows.push_back({std::to_string(note.chain + 1), note.column, fallbackKindName(note.kind), note.detail});
    }
    report.addTable("Fallbacks", {"Chain", "Column", "Condition", "Action"}, rows);
}

void addComparisons(ReportEngine& report, const std::vector<ColumnComparison>& comparisons) {
    std::vector<std::vector<std::string>> continuousRows;
    std::vector<std::vector<std::string>> categoricalRows;
    for (const auto& cmp : comparisons) {
        if (cmp.role == ColumnRole::CONTINUOUS) {
            continuousRows.push_back({
                cmp.column,
                std::to_string(cmp.imputedRows.size()),
                RunReport::toFixed(cmp.statsBefore.mean),
                RunReport::toFixed(cmp.statsAfter.mean),
                RunReport::toFixed(cmp.statsBefore.median),
                RunReport::toFixed(cmp.statsAfter.median),
                RunReport::toFixed(cmp.statsBefore.stddev),
                RunReport::toFixed(cmp.statsAfter.stddev),
                RunReport::toFixed(cmp.statsAfter.min) + " .. " + RunReport::toFixed(cmp.statsAfter.max)
            });
            continue;
        }
        for (const auto& [label, after] : cmp.labelsAfter) {
            const auto it = cmp.labelsBefore.find(label);
            const size_t before = it == cmp.labelsBefore.end() ? 0 : it->second;
            categoricalRows.push_back({cmp.column, label, std::to_string(before), std::to_string(after)});
        }
    }
    if (!continuousRows.empty()) {
        report.addTable("Continuous Columns (chain 1)",
                        {"Column", "Imputed", "Mean before", "Mean after", "Median before", "Median after",
                         "StdDev before", "StdDev after", "Range after"},
                        continuousRows);
    }
    if (!categoricalRows.empty()) {
        report.addTable("Categorical Label Counts (chain 1)", {"Column", "Label", "Observed", "Completed"}, categoricalRows);
    }
}

void addConvergence(ReportEngine& report, const EngineReport& engine) {
    if (engine.convergence.empty()) return;
    std::vector<std::vector<std::string>> rows;
    rows.reserve(engine.convergence.size());
    for (const auto& p : engine.convergence) {
        if (p.role == ColumnRole::CONTINUOUS) {
            rows.push_back({std::to_string(p.chain + 1), std::to_string(p.iteration), p.column,
                            "mean " + RunReport::toFixed(p.mean) + ", sd " + RunReport::toFixed(p.stddev)});
        } else {
            rows.push_back({std::to_string(p.chain + 1), std::to_string(p.iteration), p.column,
                            "'" + p.topLabel + "' " + RunReport::toFixed(p.topShare * 100.0, 1) + "%"});
        }
    }
    report.addTable("Convergence Trace", {"Chain", "Iteration", "Column", "Imputed cells"}, rows);
}
} // namespace

namespace RunReport {

std::string toFixed(double v, int prec) {
    if (!std::isfinite(v)) return "n/a";
    const double zeroSnap = 0.5 * std::pow(10.0, -std::max(0, prec));
    if (std::abs(v) < zeroSnap) v = 0.0;
    std::ostringstream os;
    os << std::fixed << std::setprecision(prec) << v;
    return os.str();
}

ReportEngine build(const AutoConfig& config,
                   const SessionResult& result,
                   const std::vector<std::string>& writtenFiles) {
    ReportEngine report;
    report.addTitle("Mender Imputation Report");
    addParameters(report, config, result);
    addMissingness(report, result.missingness);

    if (result.nothingToImpute()) {
        report.addParagraph("No missing values were found; no completed datasets were produced.");
    } else {
        addFallbacks(report, result.engineReport);
        addComparisons(report, result.comparisons);
        addConvergence(report, result.engineReport);
    }

    if (!writtenFiles.empty()) {
        report.addHeading("Output Files");
        report.addBulletList(writtenFiles);
    }
    return report;
}

} // namespace RunReport
