#include "MissingnessReporter.h"

#include <algorithm>
#include <cmath>

namespace MissingnessReporter {

double roundPercent(size_t missingCount, size_t rowCount) {
    if (rowCount == 0) return 0.0;
    const double pct = static_cast<double>(missingCount) / static_cast<double>(rowCount) * 100.0;
    // Halves go to the even neighbour under the default rounding mode.
    return std::nearbyint(pct * 100.0) / 100.0;
}

MissingnessTable build(const TypedDataset& data) {
    MissingnessTable table;
    table.reserve(data.colCount());
    for (const auto& col : data.columns()) {
        MissingnessRow row;
        row.variable = col.name;
        row.missingCount = col.missingCount();
        row.missingPct = roundPercent(row.missingCount, data.rowCount());
        table.push_back(std::move(row));
    }
    std::stable_sort(table.begin(), table.end(), [](const MissingnessRow& a, const MissingnessRow& b) {
        return a.missingPct > b.missingPct;
    });
    return table;
}

} // namespace MissingnessReporter
