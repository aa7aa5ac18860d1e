#pragma once
#include "TypedDataset.h"
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

/// Row-major feature matrix with one row per dataset row.
using FeatureMatrix = std::vector<std::vector<double>>;

struct PredictorOptions {
    // Predictive mean matching pool size; 0 returns raw regression estimates.
    size_t meanMatchCandidates = 5;
    // Ridge penalty on standardized coefficients (intercept is never penalized).
    double ridgeLambda = 1e-3;
    size_t treeMaxDepth = 6;
    size_t treeMinLeaf = 2;
    // Upper bound on split thresholds evaluated per feature and node.
    size_t treeMaxThresholds = 32;
};

/**
 * @brief Model for one target column, fitted on its observed rows and applied to its missing rows.
 * @details Targets are doubles: real values for continuous columns, class codes
 * (0..K-1) for categorical columns. Instances live for one column pass only.
 */
class ColumnPredictor {
public:
    virtual ~ColumnPredictor() = default;

    virtual ColumnRole role() const noexcept = 0;
    virtual const char* modelName() const noexcept = 0;

    /**
     * @brief Fits the model on X[rows[i]] -> y[i].
     * @pre rows.size() == y.size() and rows is non-empty.
     * @throws std::invalid_argument on size mismatch or empty training set.
     */
    virtual void fit(const FeatureMatrix& X, const std::vector<size_t>& rows, const std::vector<double>& y) = 0;

    /**
     * @brief Predicts one value per requested row; randomized steps draw from rng.
     * @pre fit() has been called.
     */
    virtual std::vector<double> predict(const FeatureMatrix& X,
                                        const std::vector<size_t>& rows,
                                        std::mt19937_64& rng) const = 0;
};

/**
 * @brief Ridge linear regression followed by predictive mean matching.
 */
class ContinuousRegressor : public ColumnPredictor {
public:
    explicit ContinuousRegressor(const PredictorOptions& options) : options_(options) {}

    ColumnRole role() const noexcept override { return ColumnRole::CONTINUOUS; }
    const char* modelName() const noexcept override { return "ridge+pmm"; }

    void fit(const FeatureMatrix& X, const std::vector<size_t>& rows, const std::vector<double>& y) override;
    std::vector<double> predict(const FeatureMatrix& X,
                                const std::vector<size_t>& rows,
                                std::mt19937_64& rng) const override;

    /// True when least squares failed and the model predicts the training mean.
    bool usedMeanFallback() const noexcept { return meanFallback_; }
    const std::vector<double>& coefficients() const noexcept { return beta_; }

private:
    double predictRow(const std::vector<double>& x) const;

    PredictorOptions options_;
    std::vector<double> featureMean_;
    std::vector<double> featureScale_;
    double targetMean_ = 0.0;
    double targetScale_ = 1.0;
    std::vector<double> beta_;
    bool meanFallback_ = false;

    // Observed targets ordered by their fitted value, for mean matching.
    std::vector<double> donorFitted_;
    std::vector<double> donorValues_;
};

/**
 * @brief CART classification tree (Gini impurity); predictions sample the leaf class distribution.
 */
class CategoricalClassifier : public ColumnPredictor {
public:
    explicit CategoricalClassifier(const PredictorOptions& options) : options_(options) {}

    ColumnRole role() const noexcept override { return ColumnRole::CATEGORICAL; }
    const char* modelName() const noexcept override { return "cart"; }

    void fit(const FeatureMatrix& X, const std::vector<size_t>& rows, const std::vector<double>& y) override;
    std::vector<double> predict(const FeatureMatrix& X,
                                const std::vector<size_t>& rows,
                                std::mt19937_64& rng) const override;

    size_t nodeCount() const noexcept { return nodes_.size(); }
    size_t depth() const noexcept { return depth_; }

private:
    struct Node {
        int feature = -1;
        double threshold = 0.0;
        size_t left = 0;
        size_t right = 0;
        std::vector<size_t> classCounts;
    };

    size_t grow(const FeatureMatrix& X, std::vector<size_t>& sampleIdx, size_t begin, size_t end, size_t depth);
    const Node& leafFor(const std::vector<double>& x) const;

    PredictorOptions options_;
    std::vector<size_t> rows_;
    std::vector<size_t> codes_;
    size_t classCount_ = 0;
    size_t depth_ = 0;
    std::vector<Node> nodes_;
};

std::unique_ptr<ColumnPredictor> makePredictor(ColumnRole role, const PredictorOptions& options);
