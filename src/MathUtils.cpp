#include "MathUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kNumericEpsilon = 1e-12;
constexpr double kVeryLargeTStatisticCutoff = 1e10;
constexpr double kSqrtTwoPi = 2.5066282746310002;

double clamp01(double v) {
    if (v < 0.0) return 0.0;
    if (v > 1.0) return 1.0;
    return v;
}

std::pair<double, bool> betaContinuedFraction(double a, double b, double x) {
    const int maxIter = std::clamp<int>(400 + static_cast<int>(std::ceil((a + b) * 0.75)), 400, 2000);
    constexpr double eps = 3e-14;
    constexpr double fpmin = 1e-300;

    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < fpmin) d = fpmin;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= maxIter; ++m) {
        const int m2 = 2 * m;

        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < fpmin) d = fpmin;
        c = 1.0 + aa / c;
        if (std::abs(c) < fpmin) c = fpmin;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < fpmin) d = fpmin;
        c = 1.0 + aa / c;
        if (std::abs(c) < fpmin) c = fpmin;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;

        if (std::abs(del - 1.0) <= eps) {
            return {h, true};
        }
    }
    return {h, false};
}

// Regularized incomplete beta function I_x(a, b) using continued fractions (Lentz's method)
double betainc(double a, double b, double x) {
    if (x < 0.0 || x > 1.0) return NAN;
    if (x == 0.0) return 0.0;
    if (x == 1.0) return 1.0;

    if (a <= 0.0 || b <= 0.0 || !std::isfinite(a) || !std::isfinite(b)) return NAN;

    const double lnBeta = std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
    const double bt = std::exp(a * std::log(x) + b * std::log(1.0 - x) - lnBeta);

    // The continued fraction converges fastest below the mean of the distribution.
    if (x < (a + 1.0) / (a + b + 2.0)) {
        const auto [cf, converged] = betaContinuedFraction(a, b, x);
        if (!converged || !std::isfinite(cf)) return NAN;
        return clamp01(bt * cf / a);
    }
    const auto [cf, converged] = betaContinuedFraction(b, a, 1.0 - x);
    if (!converged || !std::isfinite(cf)) return NAN;
    return clamp01(1.0 - bt * cf / b);
}
} // namespace

double MathUtils::getPValueFromT(double t, double df) {
    if (!(df > 0.0) || !std::isfinite(df)) return 1.0;
    if (std::isnan(t)) return 1.0;
    const double tAbs = std::abs(t);

    // Handle very large t (numerically safe fallback)
    if (!std::isfinite(tAbs) || tAbs > kVeryLargeTStatisticCutoff) return 0.0;

    const double x = df / (df + tAbs * tAbs);
    const double p = betainc(df / 2.0, 0.5, x); // two-tailed
    return std::isfinite(p) ? p : 1.0;
}

double MathUtils::getPValueFromZ(double z) {
    if (std::isnan(z)) return 1.0;
    return std::erfc(std::abs(z) / std::sqrt(2.0));
}

// Acklam's rational approximation followed by one Halley refinement step.
double MathUtils::normalQuantile(double p) {
    if (p <= 0.0) return -std::numeric_limits<double>::infinity();
    if (p >= 1.0) return std::numeric_limits<double>::infinity();

    static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
                               1.383577518672690e+02, -3.066479806614716e+01, 2.506628277459239e+00};
    static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
                               6.680131188771972e+01, -1.328068155288572e+01};
    static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
                               -2.549732539343734e+00, 4.374664141464968e+00, 2.938163982698783e+00};
    static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
                               3.754408661907416e+00};
    constexpr double pLow = 0.02425;

    double x;
    if (p < pLow) {
        const double q = std::sqrt(-2.0 * std::log(p));
        x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    } else if (p <= 1.0 - pLow) {
        const double q = p - 0.5;
        const double r = q * q;
        x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
            (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
    } else {
        const double q = std::sqrt(-2.0 * std::log(1.0 - p));
        x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }

    const double e = 0.5 * std::erfc(-x / std::sqrt(2.0)) - p;
    const double u = e * kSqrtTwoPi * std::exp(x * x / 2.0);
    return x - u / (1.0 + x * u / 2.0);
}

std::optional<MathUtils::Matrix> MathUtils::Matrix::cholesky() const {
    if (rows != cols) throw std::invalid_argument("Cholesky factorization needs a square matrix.");
    const size_t n = rows;
    Matrix lower(n, n);
    if (n == 0) return lower;

    double maxDiag = 0.0;
    for (size_t i = 0; i < n; ++i) maxDiag = std::max(maxDiag, at(i, i));
    if (!(maxDiag > kNumericEpsilon)) return std::nullopt;
    const double pivotTolerance = kNumericEpsilon * maxDiag;

    for (size_t j = 0; j < n; ++j) {
        double pivot = at(j, j);
        for (size_t k = 0; k < j; ++k) pivot -= lower.at(j, k) * lower.at(j, k);
        if (!(pivot > pivotTolerance)) return std::nullopt;
        const double ljj = std::sqrt(pivot);
        lower.at(j, j) = ljj;

        for (size_t i = j + 1; i < n; ++i) {
            double sum = at(i, j);
            for (size_t k = 0; k < j; ++k) sum -= lower.at(i, k) * lower.at(j, k);
            lower.at(i, j) = sum / ljj;
        }
    }
    return lower;
}

std::optional<std::vector<double>> MathUtils::ordinaryLeastSquares(const Matrix& X, const std::vector<double>& y) {
    if (X.rows != y.size()) throw std::invalid_argument("X and y row dimensions must match for OLS.");
    const size_t k = X.cols;
    if (k == 0) return std::vector<double>();
    if (X.rows < k) return std::nullopt;

    // Upper triangle of X^T X, then mirrored.
    Matrix gram(k, k);
    std::vector<double> xty(k, 0.0);
    for (size_t r = 0; r < X.rows; ++r) {
        const auto& row = X.data[r];
        for (size_t i = 0; i < k; ++i) {
            xty[i] += row[i] * y[r];
            #ifdef USE_OPENMP
            #pragma omp simd
            #endif
            for (size_t j = i; j < k; ++j) {
                gram.data[i][j] += row[i] * row[j];
            }
        }
    }
    for (size_t i = 0; i < k; ++i) {
        for (size_t j = 0; j < i; ++j) gram.data[i][j] = gram.data[j][i];
    }

    const auto lower = gram.cholesky();
    if (!lower) return std::nullopt;

    // L w = X^T y, then L^T b = w.
    std::vector<double> w(k, 0.0);
    for (size_t i = 0; i < k; ++i) {
        double sum = xty[i];
        for (size_t j = 0; j < i; ++j) sum -= lower->at(i, j) * w[j];
        w[i] = sum / lower->at(i, i);
    }
    std::vector<double> beta(k, 0.0);
    for (size_t i = k; i-- > 0;) {
        double sum = w[i];
        for (size_t j = i + 1; j < k; ++j) sum -= lower->at(j, i) * beta[j];
        beta[i] = sum / lower->at(i, i);
        if (!std::isfinite(beta[i])) return std::nullopt;
    }
    return beta;
}
