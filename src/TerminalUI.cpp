#include "TerminalUI.h"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace {
const std::string kRule(92, '=');

// Restores the caller's cout formatting when a table is done.
class CoutFormatGuard {
public:
    CoutFormatGuard() : flags_(std::cout.flags()), precision_(std::cout.precision()) {}
    ~CoutFormatGuard() {
        std::cout.flags(flags_);
        std::cout.precision(precision_);
    }

private:
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
};

std::string fixed2(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << v;
    return os.str();
}
}

void TerminalUI::printMissingnessTable(const MissingnessTable& table) {
    const CoutFormatGuard guard;
    size_t maxNameLen = 15;
    for (const auto& row : table) maxNameLen = std::max(maxNameLen, row.variable.length());

    int w = static_cast<int>(maxNameLen) + 2;
    std::cout << "\n=================================== MISSINGNESS SUMMARY ===================================\n";
    std::cout << std::left
              << std::setw(w) << "Variable"
              << std::setw(12) << "Missing"
              << std::setw(12) << "Missing %" << "\n";
    std::cout << std::string(w + 24, '-') << "\n";

    for (const auto& row : table) {
        std::cout << std::left << std::setw(w) << row.variable
                  << std::right << std::setw(10) << row.missingCount << "  "
                  << std::setw(10) << fixed2(row.missingPct) << "\n";
    }
    std::cout << kRule << "\n";
}

void TerminalUI::printComparisonTable(const std::vector<ColumnComparison>& comparisons) {
    if (comparisons.empty()) return;
    const CoutFormatGuard guard;

    size_t maxNameLen = 15;
    for (const auto& cmp : comparisons) maxNameLen = std::max(maxNameLen, cmp.column.length());
    int w = static_cast<int>(maxNameLen) + 2;

    std::cout << "\n================================ BEFORE / AFTER (CHAIN 1) =================================\n";
    std::cout << std::left
              << std::setw(w) << "Column"
              << std::setw(13) << "Role"
              << std::setw(10) << "Imputed"
              << "Summary\n";
    std::cout << std::string(w + 50, '-') << "\n";

    for (const auto& cmp : comparisons) {
        std::cout << std::left << std::setw(w) << cmp.column
                  << std::setw(13) << columnRoleName(cmp.role)
                  << std::setw(10) << cmp.imputedRows.size();
        if (cmp.role == ColumnRole::CONTINUOUS) {
            std::cout << "mean " << fixed2(cmp.statsBefore.mean) << " -> " << fixed2(cmp.statsAfter.mean)
                      << " | sd " << fixed2(cmp.statsBefore.stddev) << " -> " << fixed2(cmp.statsAfter.stddev) << "\n";
        } else {
            std::cout << cmp.labelsBefore.size() << " observed label(s), "
                      << cmp.labelsAfter.size() << " after imputation\n";
        }
    }
    std::cout << kRule << "\n";
}

void TerminalUI::printRunSummary(const SessionResult& result, const std::vector<std::string>& writtenFiles) {
    const auto& data = result.sanitizedOriginal;
    std::cout << "\n[Mender] Sanitized dataset: " << data.rowCount() << " rows x " << data.colCount()
              << " columns, " << data.totalMissing() << " missing cell(s).\n";

    if (result.nothingToImpute()) {
        std::cout << "[Mender] Nothing to impute.\n";
    } else {
        std::cout << "[Mender] Produced " << result.completedDatasets.size() << " completed dataset(s) over "
                  << result.engineReport.iterations << " iteration(s).\n";
        if (!result.engineReport.fallbacks.empty()) {
            std::cout << "[Mender] Fallbacks applied:\n";
            for (const auto& note : result.engineReport.fallbacks) {
                std::cout << "        - chain " << (note.chain + 1) << ", '" << note.column << "': "
                          << fallbackKindName(note.kind) << " (" << note.detail << ")\n";
            }
        }
    }

    for (const auto& path : writtenFiles) {
        std::cout << "[Mender] Wrote " << path << "\n";
    }
}
