#pragma once
#include "TypedDataset.h"
#include <string>
#include <vector>

struct MissingnessRow {
    std::string variable;
    size_t missingCount = 0;
    double missingPct = 0.0;
};

using MissingnessTable = std::vector<MissingnessRow>;

namespace MissingnessReporter {

/**
 * @brief Per-column missing count and percentage of the row count.
 * @post One row per column, sorted by missingPct descending; ties keep column order.
 * @post missingPct == round(missingCount / rowCount * 100, 2); 0 when rowCount is 0.
 */
MissingnessTable build(const TypedDataset& data);

double roundPercent(size_t missingCount, size_t rowCount);

} // namespace MissingnessReporter
