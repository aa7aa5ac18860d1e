#include "MathUtils.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {
// Process-wide so that OpenMP worker threads see the value set by the caller.
std::atomic<double>& epsilonSetting() {
    static std::atomic<double> eps{1e-12};
    return eps;
}

bool solveUpperTriangular(const MathUtils::Matrix& R,
                          size_t n,
                          const std::vector<double>& b,
                          std::vector<double>& x) {
    if (b.size() < n) return false;
    x.assign(n, 0.0);
    for (size_t i = n; i-- > 0;) {
        double rhs = b[i];
        for (size_t j = i + 1; j < n; ++j) {
            rhs -= R.data[i][j] * x[j];
        }
        const double diag = R.data[i][i];
        if (std::abs(diag) <= epsilonSetting().load()) return false;
        x[i] = rhs / diag;
    }
    return true;
}
} // namespace

void MathUtils::setNumericEpsilon(double eps) {
    epsilonSetting().store(std::max(0.0, eps));
}

double MathUtils::numericEpsilon() {
    return epsilonSetting().load();
}

/**
 * Householder reflections zero the sub-diagonal of each column in turn.
 * Every reflector is applied to rhs immediately instead of being accumulated into Q.
 */
void MathUtils::Matrix::householderReduce(std::vector<double>& rhs) {
    const size_t m = rows;
    const size_t n = cols;
    const double eps = epsilonSetting().load();
    if (m == 0) return;

    for (size_t k = 0; k < n && k + 1 < m; ++k) {
        std::vector<double> u(m - k);
        double normX = 0.0;
        for (size_t i = k; i < m; ++i) {
            u[i - k] = data[i][k];
            normX += u[i - k] * u[i - k];
        }
        normX = std::sqrt(normX);
        if (normX <= eps) continue;

        // Choose sign to avoid cancellation in Householder vector u
        const double alpha = (data[k][k] > 0 ? -1.0 : 1.0) * normX;
        u[0] -= alpha;

        double normU = 0.0;
        for (double val : u) normU += val * val;
        normU = std::sqrt(normU);
        if (normU <= eps) continue;
        for (double& val : u) val /= normU;

        // R = (I - 2uu^T) R, restricted to rows k..m and columns k..n
        for (size_t j = k; j < n; ++j) {
            double dot = 0.0;
            for (size_t i = k; i < m; ++i) dot += u[i - k] * data[i][j];
            for (size_t i = k; i < m; ++i) data[i][j] -= 2.0 * u[i - k] * dot;
        }

        double dot = 0.0;
        for (size_t i = k; i < m; ++i) dot += u[i - k] * rhs[i];
        for (size_t i = k; i < m; ++i) rhs[i] -= 2.0 * u[i - k] * dot;
    }
}

std::vector<double> MathUtils::multipleLinearRegression(const Matrix& X, const Matrix& Y) {
    if (X.rows != Y.rows) throw std::invalid_argument("X and Y row dimensions must match for MLR.");
    if (Y.cols != 1) throw std::invalid_argument("MLR expects a single target column.");
    if (X.cols == 0 || X.rows < X.cols) return std::vector<double>(); // Underdetermined

    Matrix R = X;
    std::vector<double> qty(Y.rows, 0.0);
    for (size_t i = 0; i < Y.rows; ++i) qty[i] = Y.data[i][0];
    R.householderReduce(qty);

    // Check condition number / rank deficiency
    double maxDiag = 0.0;
    double minDiag = std::numeric_limits<double>::max();
    for (size_t i = 0; i < X.cols; ++i) {
        const double val = std::abs(R.data[i][i]);
        maxDiag = std::max(maxDiag, val);
        minDiag = std::min(minDiag, val);
    }

    const double rankTol = std::max(epsilonSetting().load(),
                                    std::numeric_limits<double>::epsilon() * std::max(1.0, maxDiag) * static_cast<double>(X.cols));
    if (minDiag <= rankTol) {
        return std::vector<double>(); // Singular or ill-conditioned matrix
    }

    std::vector<double> beta;
    if (!solveUpperTriangular(R, X.cols, qty, beta)) {
        return std::vector<double>();
    }
    for (double b : beta) {
        if (!std::isfinite(b)) return std::vector<double>();
    }
    return beta;
}
