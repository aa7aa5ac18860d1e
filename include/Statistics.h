#pragma once

#include <cstddef>
#include <vector>

/// Summary of the finite entries of a numeric column; stddev uses the n-1 denominator.
struct ColumnStats {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

namespace Statistics {
/// Non-finite entries are ignored; zero-initialized stats when nothing is finite.
ColumnStats calculateStats(const std::vector<double>& col);
}
