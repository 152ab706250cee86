#include "Statistics.h"

#include "MathUtils.h"

#include <algorithm>
#include <cmath>

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats{0, 0, 0, 0, 0, 0};
    if (col.empty()) return stats;

    std::vector<double> finite;
    finite.reserve(col.size());
    for (double value : col) {
        if (std::isfinite(value)) {
            finite.push_back(value);
        }
    }
    if (finite.empty()) return stats;

    const size_t n = finite.size();

    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : finite) {
        ++count;
        double delta = value - mean;
        mean += delta / static_cast<double>(count);
        double delta2 = value - mean;
        m2 += delta * delta2;
    }
    stats.mean = mean;
    stats.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
    stats.stddev = std::sqrt(stats.variance);

    std::vector<double> medianWork = finite;
    size_t mid = n / 2;
    std::nth_element(medianWork.begin(), medianWork.begin() + mid, medianWork.end());
    double upper = medianWork[mid];
    if (n % 2 == 0) {
        std::nth_element(medianWork.begin(), medianWork.begin() + (mid - 1), medianWork.begin() + mid);
        stats.median = (medianWork[mid - 1] + upper) / 2.0;
    } else {
        stats.median = upper;
    }

    if (n > 2 && stats.stddev > 0) {
        double m3 = 0, m4 = 0;
        for (double val : finite) {
            double diff = val - stats.mean;
            double diff2 = diff * diff;
            m3 += diff2 * diff;
            m4 += diff2 * diff2;
        }

        const double nd = static_cast<double>(n);
        double term1 = nd / ((nd - 1.0) * (nd - 2.0));
        double stddev2 = stats.stddev * stats.stddev;
        double stddev3 = stddev2 * stats.stddev;
        stats.skewness = term1 * (m3 / stddev3);

        if (n > 3) {
            double termK1 = (nd * (nd + 1.0)) / ((nd - 1.0) * (nd - 2.0) * (nd - 3.0));
            double nMinus1 = (nd - 1.0);
            double termK2 = (3.0 * nMinus1 * nMinus1) / ((nd - 2.0) * (nd - 3.0));
            double stddev4 = stddev2 * stddev2;
            stats.kurtosis = termK1 * (m4 / stddev4) - termK2;
        }
    }

    return stats;
}

double Statistics::mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double sum = 0.0;
    for (double value : v) sum += value;
    return sum / static_cast<double>(v.size());
}

double Statistics::variance(const std::vector<double>& v) {
    return covariance(v, v);
}

double Statistics::covariance(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return 0.0;
    double mx = 0.0;
    double my = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mx += x[i];
        my += y[i];
    }
    mx /= static_cast<double>(n);
    my /= static_cast<double>(n);

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) sum += (x[i] - mx) * (y[i] - my);
    return sum / static_cast<double>(n - 1);
}

WelchResult Statistics::welchTest(const std::vector<double>& a, const std::vector<double>& b) {
    WelchResult out;
    if (a.size() < 2 || b.size() < 2) return out;

    const double na = static_cast<double>(a.size());
    const double nb = static_cast<double>(b.size());
    const double va = variance(a) / na;
    const double vb = variance(b) / nb;
    const double se2 = va + vb;
    if (!(se2 > 0.0) || !std::isfinite(se2)) return out;

    const double t = (mean(b) - mean(a)) / std::sqrt(se2);
    const double dfDenom = (va * va) / (na - 1.0) + (vb * vb) / (nb - 1.0);
    if (!(dfDenom > 0.0) || !std::isfinite(t)) return out;

    out.tStatistic = t;
    out.degreesOfFreedom = (se2 * se2) / dfDenom;
    out.pValue = MathUtils::getPValueFromT(t, out.degreesOfFreedom);
    out.valid = std::isfinite(out.pValue);
    if (!out.valid) out.pValue = 1.0;
    return out;
}
