#include "ColumnPredictor.h"
#include "MathUtils.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace {
constexpr double kScaleFloor = 1e-12;
constexpr double kMinSplitGain = 1e-12;

void checkTrainingShape(const FeatureMatrix& X, const std::vector<size_t>& rows, const std::vector<double>& y) {
    if (rows.size() != y.size()) throw std::invalid_argument("training rows and targets differ in length");
    if (rows.empty()) throw std::invalid_argument("cannot fit a column predictor without training rows");
    for (size_t r : rows) {
        if (r >= X.size()) throw std::invalid_argument("training row index outside the feature matrix");
    }
}

std::pair<double, double> meanAndScale(const std::vector<double>& values) {
    if (values.empty()) return {0.0, 1.0};
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    double var = 0.0;
    for (double v : values) {
        const double d = v - mean;
        var += d * d;
    }
    double stddev = std::sqrt(var / static_cast<double>(std::max<size_t>(1, values.size() - 1)));
    if (stddev < kScaleFloor) stddev = 1.0;
    return {mean, stddev};
}

double gini(const std::vector<size_t>& counts, size_t total) {
    if (total == 0) return 0.0;
    double sumSq = 0.0;
    for (size_t c : counts) {
        const double p = static_cast<double>(c) / static_cast<double>(total);
        sumSq += p * p;
    }
    return 1.0 - sumSq;
}
} // namespace

void ContinuousRegressor::fit(const FeatureMatrix& X, const std::vector<size_t>& rows, const std::vector<double>& y) {
    checkTrainingShape(X, rows, y);

    const size_t n = rows.size();
    const size_t p = X[rows.front()].size();

    featureMean_.assign(p, 0.0);
    featureScale_.assign(p, 1.0);
    std::vector<double> column(n, 0.0);
    for (size_t j = 0; j < p; ++j) {
        for (size_t i = 0; i < n; ++i) column[i] = X[rows[i]][j];
        const auto [mean, scale] = meanAndScale(column);
        featureMean_[j] = mean;
        featureScale_[j] = scale;
    }
    const auto [yMean, yScale] = meanAndScale(y);
    targetMean_ = yMean;
    targetScale_ = yScale;

    const bool ridge = options_.ridgeLambda > 0.0;
    const size_t extraRows = ridge ? p : 0;
    MathUtils::Matrix design(n + extraRows, p + 1);
    MathUtils::Matrix target(n + extraRows, 1);
    for (size_t i = 0; i < n; ++i) {
        const auto& x = X[rows[i]];
        design.at(i, 0) = 1.0;
        for (size_t j = 0; j < p; ++j) {
            design.at(i, j + 1) = (x[j] - featureMean_[j]) / featureScale_[j];
        }
        target.at(i, 0) = (y[i] - targetMean_) / targetScale_;
    }
    if (ridge) {
        const double penalty = std::sqrt(options_.ridgeLambda * static_cast<double>(n));
        for (size_t j = 0; j < p; ++j) {
            design.at(n + j, j + 1) = penalty;
        }
    }

    beta_ = MathUtils::multipleLinearRegression(design, target);
    meanFallback_ = beta_.size() != p + 1;
    if (meanFallback_) beta_.assign(p + 1, 0.0);

    std::vector<std::pair<double, double>> donors;
    donors.reserve(n);
    for (size_t i = 0; i < n; ++i) donors.emplace_back(predictRow(X[rows[i]]), y[i]);
    std::sort(donors.begin(), donors.end());
    donorFitted_.clear();
    donorValues_.clear();
    donorFitted_.reserve(n);
    donorValues_.reserve(n);
    for (const auto& d : donors) {
        donorFitted_.push_back(d.first);
        donorValues_.push_back(d.second);
    }
}

double ContinuousRegressor::predictRow(const std::vector<double>& x) const {
    double s = beta_.empty() ? 0.0 : beta_[0];
    for (size_t j = 0; j < x.size() && (j + 1) < beta_.size(); ++j) {
        s += beta_[j + 1] * (x[j] - featureMean_[j]) / featureScale_[j];
    }
    return s * targetScale_ + targetMean_;
}

std::vector<double> ContinuousRegressor::predict(const FeatureMatrix& X,
                                                 const std::vector<size_t>& rows,
                                                 std::mt19937_64& rng) const {
    if (beta_.empty()) throw std::logic_error("ContinuousRegressor::predict called before fit");

    std::vector<double> out;
    out.reserve(rows.size());
    const size_t donorCount = donorFitted_.size();
    const size_t k = std::min(options_.meanMatchCandidates, donorCount);
    for (size_t row : rows) {
        const double estimate = predictRow(X.at(row));
        if (k == 0 || meanFallback_) {
            out.push_back(estimate);
            continue;
        }

        // Window [lo, hi) of the k donors whose fitted values are closest to the estimate.
        size_t lo = static_cast<size_t>(std::lower_bound(donorFitted_.begin(), donorFitted_.end(), estimate) - donorFitted_.begin());
        size_t hi = lo;
        while (hi - lo < k) {
            if (lo == 0) {
                ++hi;
            } else if (hi == donorCount) {
                --lo;
            } else if (estimate - donorFitted_[lo - 1] <= donorFitted_[hi] - estimate) {
                --lo;
            } else {
                ++hi;
            }
        }
        // Donors tied with the farthest candidate join the pool.
        const double reach = std::max(std::abs(estimate - donorFitted_[lo]), std::abs(donorFitted_[hi - 1] - estimate));
        while (lo > 0 && estimate - donorFitted_[lo - 1] <= reach) --lo;
        while (hi < donorCount && donorFitted_[hi] - estimate <= reach) ++hi;

        std::uniform_int_distribution<size_t> pick(0, hi - lo - 1);
        out.push_back(donorValues_[lo + pick(rng)]);
    }
    return out;
}

void CategoricalClassifier::fit(const FeatureMatrix& X, const std::vector<size_t>& rows, const std::vector<double>& y) {
    checkTrainingShape(X, rows, y);

    rows_ = rows;
    codes_.assign(y.size(), 0);
    classCount_ = 0;
    for (size_t i = 0; i < y.size(); ++i) {
        if (!std::isfinite(y[i]) || y[i] < 0.0 || std::floor(y[i]) != y[i]) {
            throw std::invalid_argument("class codes must be non-negative integers");
        }
        codes_[i] = static_cast<size_t>(y[i]);
        classCount_ = std::max(classCount_, codes_[i] + 1);
    }

    nodes_.clear();
    depth_ = 0;
    std::vector<size_t> sampleIdx(rows_.size());
    std::iota(sampleIdx.begin(), sampleIdx.end(), 0);
    grow(X, sampleIdx, 0, sampleIdx.size(), 0);
}

size_t CategoricalClassifier::grow(const FeatureMatrix& X,
                                   std::vector<size_t>& sampleIdx,
                                   size_t begin,
                                   size_t end,
                                   size_t depth) {
    Node node;
    node.classCounts.assign(classCount_, 0);
    for (size_t i = begin; i < end; ++i) node.classCounts[codes_[sampleIdx[i]]]++;

    const size_t idx = nodes_.size();
    nodes_.push_back(node);
    depth_ = std::max(depth_, depth);

    const size_t n = end - begin;
    const size_t p = X[rows_[sampleIdx[begin]]].size();
    const size_t minLeaf = std::max<size_t>(1, options_.treeMinLeaf);
    const size_t presentClasses = static_cast<size_t>(
        std::count_if(node.classCounts.begin(), node.classCounts.end(), [](size_t c) { return c > 0; }));
    if (presentClasses <= 1 || depth >= options_.treeMaxDepth || n < 2 * minLeaf || p == 0) {
        return idx;
    }

    const double parentGini = gini(node.classCounts, n);
    double bestGain = kMinSplitGain;
    int bestFeature = -1;
    double bestThreshold = 0.0;

    std::vector<std::pair<double, size_t>> vals(n);
    std::vector<size_t> leftCounts(classCount_);
    std::vector<size_t> rightCounts(classCount_);
    for (size_t f = 0; f < p; ++f) {
        for (size_t i = 0; i < n; ++i) {
            const size_t s = sampleIdx[begin + i];
            vals[i] = {X[rows_[s]][f], codes_[s]};
        }
        std::sort(vals.begin(), vals.end());

        size_t boundaries = 0;
        for (size_t i = minLeaf; i + minLeaf <= n; ++i) {
            if (vals[i - 1].first < vals[i].first) ++boundaries;
        }
        if (boundaries == 0) continue;
        const size_t maxThresholds = std::max<size_t>(1, options_.treeMaxThresholds);
        const size_t stride = (boundaries + maxThresholds - 1) / maxThresholds;

        std::fill(leftCounts.begin(), leftCounts.end(), 0);
        rightCounts = node.classCounts;
        size_t ordinal = 0;
        for (size_t i = 1; i < n; ++i) {
            leftCounts[vals[i - 1].second]++;
            rightCounts[vals[i - 1].second]--;
            if (i < minLeaf || n - i < minLeaf) continue;
            if (!(vals[i - 1].first < vals[i].first)) continue;
            if (ordinal++ % stride != 0) continue;

            const double weighted = (static_cast<double>(i) * gini(leftCounts, i) +
                                     static_cast<double>(n - i) * gini(rightCounts, n - i)) / static_cast<double>(n);
            const double gain = parentGini - weighted;
            if (gain > bestGain) {
                bestGain = gain;
                bestFeature = static_cast<int>(f);
                bestThreshold = 0.5 * (vals[i - 1].first + vals[i].first);
            }
        }
    }
    if (bestFeature < 0) return idx;

    const auto feature = static_cast<size_t>(bestFeature);
    const auto midIt = std::stable_partition(sampleIdx.begin() + static_cast<std::ptrdiff_t>(begin),
                                             sampleIdx.begin() + static_cast<std::ptrdiff_t>(end),
                                             [&](size_t s) { return X[rows_[s]][feature] <= bestThreshold; });
    const size_t mid = static_cast<size_t>(midIt - sampleIdx.begin());
    if (mid == begin || mid == end) return idx;

    const size_t left = grow(X, sampleIdx, begin, mid, depth + 1);
    const size_t right = grow(X, sampleIdx, mid, end, depth + 1);
    nodes_[idx].feature = bestFeature;
    nodes_[idx].threshold = bestThreshold;
    nodes_[idx].left = left;
    nodes_[idx].right = right;
    return idx;
}

const CategoricalClassifier::Node& CategoricalClassifier::leafFor(const std::vector<double>& x) const {
    size_t idx = 0;
    while (nodes_[idx].feature >= 0) {
        const auto f = static_cast<size_t>(nodes_[idx].feature);
        idx = (f < x.size() && x[f] <= nodes_[idx].threshold) ? nodes_[idx].left : nodes_[idx].right;
    }
    return nodes_[idx];
}

std::vector<double> CategoricalClassifier::predict(const FeatureMatrix& X,
                                                   const std::vector<size_t>& rows,
                                                   std::mt19937_64& rng) const {
    if (nodes_.empty()) throw std::logic_error("CategoricalClassifier::predict called before fit");

    std::vector<double> out;
    out.reserve(rows.size());
    for (size_t row : rows) {
        const Node& leaf = leafFor(X.at(row));
        const size_t total = std::accumulate(leaf.classCounts.begin(), leaf.classCounts.end(), static_cast<size_t>(0));
        std::uniform_int_distribution<size_t> draw(0, total - 1);
        size_t ticket = draw(rng);
        size_t code = 0;
        for (; code < leaf.classCounts.size(); ++code) {
            if (ticket < leaf.classCounts[code]) break;
            ticket -= leaf.classCounts[code];
        }
        out.push_back(static_cast<double>(code));
    }
    return out;
}

std::unique_ptr<ColumnPredictor> makePredictor(ColumnRole role, const PredictorOptions& options) {
    if (role == ColumnRole::CONTINUOUS) return std::make_unique<ContinuousRegressor>(options);
    return std::make_unique<CategoricalClassifier>(options);
}
