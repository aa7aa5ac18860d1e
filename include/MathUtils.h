#pragma once
#include <cstddef>
#include <vector>

class MathUtils {
public:
    // Dense row-major matrix for least-squares problems
    struct Matrix {
        std::vector<std::vector<double>> data;
        size_t rows;
        size_t cols;

        Matrix(size_t r, size_t c) : data(r, std::vector<double>(c, 0.0)), rows(r), cols(c) {}

        double& at(size_t r, size_t c) { return data[r][c]; }
        double at(size_t r, size_t c) const { return data[r][c]; }

        /**
         * @brief Householder QR triangularization applied in place to this matrix and to rhs.
         * @details On return the upper cols x cols block is R and rhs holds Q^T * rhs.
         * Q itself is never formed, so memory stays O(rows * cols).
         * @pre rhs.size() == rows.
         */
        void householderReduce(std::vector<double>& rhs);
    };

    /**
     * @brief Solves multiple linear regression coefficients from design matrix X and target Y.
     * @pre X.rows == Y.rows and Y.cols == 1.
     * @post Returns empty vector for underdetermined or ill-conditioned problems.
     * @throws std::invalid_argument when row dimensions mismatch.
     */
    static std::vector<double> multipleLinearRegression(const Matrix& X, const Matrix& Y);

    static void setNumericEpsilon(double eps);
    static double numericEpsilon();
};
