#pragma once

#include <cstddef>
#include <optional>
#include <vector>

class MathUtils {
public:
    /**
     * @brief Two-tailed p-value P(|T| > |t|) for Student's t with df degrees of freedom.
     * @pre df > 0. Fractional df (Welch-Satterthwaite) is supported.
     * @post Returns 1.0 for df <= 0 or non-finite input.
     */
    static double getPValueFromT(double t, double df);

    /**
     * @brief Two-tailed normal p-value P(|Z| > |z|).
     */
    static double getPValueFromZ(double z);

    /**
     * @brief Inverse of the standard normal CDF.
     * @pre 0 < p < 1.
     * @post Returns -inf / +inf at the open bounds.
     */
    static double normalQuantile(double p);

    struct Matrix {
        std::vector<std::vector<double>> data;
        size_t rows;
        size_t cols;

        Matrix(size_t r, size_t c) : data(r, std::vector<double>(c, 0.0)), rows(r), cols(c) {}

        double& at(size_t r, size_t c) { return data[r][c]; }
        double at(size_t r, size_t c) const { return data[r][c]; }

        /**
         * @brief Lower-triangular L with L L^T equal to this symmetric matrix.
         * @post Returns std::nullopt when a pivot falls below a tolerance relative to the largest diagonal.
         * @throws std::invalid_argument when matrix is not square.
         */
        std::optional<Matrix> cholesky() const;
    };

    /**
     * @brief Solves min ||y - X b|| through the normal equations (X^T X) b = X^T y,
     * factoring X^T X with cholesky().
     * No intercept column is added; callers pass centered data.
     * @pre X.rows == y.size().
     * @post Returns std::nullopt when X^T X is singular or X has fewer rows than columns.
     * @throws std::invalid_argument when row dimensions mismatch.
     */
    static std::optional<std::vector<double>> ordinaryLeastSquares(const Matrix& X, const std::vector<double>& y);
};
