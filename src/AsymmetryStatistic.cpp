#include "AsymmetryStatistic.h"
#include "Statistics.h"
#include <cmath>

namespace {
std::optional<double> tailMean(double a, const std::vector<double>& x, const std::vector<double>& ry, double dir) {
    double sum = 0.0;
    size_t n = 0;
    const double slope = std::abs(a);
    for (size_t k = 0; k < x.size(); ++k) {
        const double yk = slope * x[k] + ry[k];
        if (x[k] * dir > 0.0 && yk * dir < 0.0) {
            sum += x[k] * ry[k];
            ++n;
        }
    }
    if (n == 0) return std::nullopt;
    return sum / static_cast<double>(n);
}
}

std::optional<double> AsymmetryStatistic::leftRight(const Variable& x,
                                                    const Variable& y,
                                                    const std::vector<Variable>& z) const {
    const DataSet& data = residualizer_.data();
    const auto& xs = data.column(x);
    const auto& ys = data.column(y);

    const double vx = Statistics::variance(xs);
    if (!(vx > 0.0)) return std::nullopt;
    const double a = Statistics::covariance(xs, ys) / vx;

    std::vector<Variable> regressors;
    regressors.reserve(z.size() + 1);
    regressors.push_back(x);
    regressors.insert(regressors.end(), z.begin(), z.end());
    const std::vector<double> ry = residualizer_.residuals(y, regressors);

    const auto plus = tailMean(a, xs, ry, +1.0);
    const auto minus = tailMean(a, xs, ry, -1.0);
    if (!plus || !minus) return std::nullopt;
    return *plus - *minus;
}

bool AsymmetryStatistic::favors(const Variable& x, const Variable& y, const std::vector<Variable>& z) const {
    const auto value = leftRight(x, y, z);
    return value.has_value() && *value > 0.0;
}
