#include "Preprocessor.h"
#include "CommonUtils.h"
#include "MathUtils.h"
#include "Statistics.h"
#include <algorithm>
#include <numeric>

PreprocessReport Preprocessor::run(DataSet& data, TransformMethod method) {
    PreprocessReport report;
    switch (method) {
        case TransformMethod::NONE:
            break;
        case TransformMethod::CENTER:
            report = center(data);
            break;
        case TransformMethod::NONPARANORMAL: {
            PreprocessReport scores = normalScores(data);
            report = center(data);
            report.tieCounts = std::move(scores.tieCounts);
            break;
        }
    }
    report.method = method;
    return report;
}

PreprocessReport Preprocessor::center(DataSet& data) {
    PreprocessReport report;
    report.method = TransformMethod::CENTER;
    for (const auto& v : data.getVariables()) {
        auto& col = data.mutableColumn(v.column);
        const double m = Statistics::mean(col);
        for (double& x : col) x -= m;
        report.removedMeans[v.name] = m;
    }
    return report;
}

PreprocessReport Preprocessor::normalScores(DataSet& data) {
    PreprocessReport report;
    report.method = TransformMethod::NONPARANORMAL;
    const size_t n = data.getRowCount();
    if (n == 0) return report;

    std::vector<size_t> order(n);
    std::vector<double> ranks(n);
    for (const auto& v : data.getVariables()) {
        auto& col = data.mutableColumn(v.column);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return col[a] < col[b]; });

        size_t ties = 0;
        size_t i = 0;
        while (i < n) {
            size_t j = i;
            while (j + 1 < n && col[order[j + 1]] == col[order[i]]) ++j;
            // 1-based average rank of the run [i, j]
            const double avg = (static_cast<double>(i + 1) + static_cast<double>(j + 1)) / 2.0;
            for (size_t k = i; k <= j; ++k) ranks[order[k]] = avg;
            if (j > i) ties += j - i + 1;
            i = j + 1;
        }

        const double denom = static_cast<double>(n) + 1.0;
        for (size_t r = 0; r < n; ++r) {
            col[r] = MathUtils::normalQuantile(ranks[r] / denom);
        }
        if (ties > 0) report.tieCounts[v.name] = ties;
    }
    return report;
}

TransformMethod Preprocessor::parseMethod(const std::string& name) {
    const std::string lower = CommonUtils::toLower(CommonUtils::trim(name));
    if (lower == "none") return TransformMethod::NONE;
    if (lower == "center") return TransformMethod::CENTER;
    if (lower == "nonparanormal") return TransformMethod::NONPARANORMAL;
    throw Skewcycle::ConfigurationException("transform must be one of none|center|nonparanormal, got '" + name + "'");
}
