#pragma once

#include <cstddef>
#include <vector>

struct ColumnStats {
    double mean;
    double median;
    double variance;
    double stddev;
    double skewness;
    double kurtosis;
};

// Outcome of a two-sample Welch test. valid=false marks a degenerate input
// (fewer than two observations on a side, zero combined variance, non-finite t).
struct WelchResult {
    double tStatistic = 0.0;
    double degreesOfFreedom = 0.0;
    double pValue = 1.0;
    bool valid = false;
};

namespace Statistics {
ColumnStats calculateStats(const std::vector<double>& col);

double mean(const std::vector<double>& v);

// Sample variance (n - 1 denominator). Returns 0 for fewer than two values.
double variance(const std::vector<double>& v);

// Sample covariance (n - 1 denominator) over aligned vectors.
double covariance(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Welch's unequal-variance t-test for a difference in means, mean(b) - mean(a).
 * Degrees of freedom follow the Welch-Satterthwaite formula.
 * @post pValue is two-sided. Degenerate inputs return valid=false and pValue=1.
 */
WelchResult welchTest(const std::vector<double>& a, const std::vector<double>& b);
}
