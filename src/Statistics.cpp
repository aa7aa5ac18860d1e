#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    std::vector<double> sorted;
    sorted.reserve(col.size());
    std::copy_if(col.begin(), col.end(), std::back_inserter(sorted), [](double v) { return std::isfinite(v); });

    ColumnStats stats;
    if (sorted.empty()) return stats;
    std::sort(sorted.begin(), sorted.end());

    const size_t n = sorted.size();
    stats.count = n;
    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.median = (n % 2 == 1) ? sorted[n / 2] : 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
    stats.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(n);

    if (n > 1) {
        double ss = 0.0;
        for (double v : sorted) ss += (v - stats.mean) * (v - stats.mean);
        stats.stddev = std::sqrt(ss / static_cast<double>(n - 1));
    }
    return stats;
}
