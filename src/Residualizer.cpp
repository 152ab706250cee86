#include "Residualizer.h"
#include "MathUtils.h"
#include "SkewcycleExceptions.h"
#include <numeric>

std::vector<size_t> RowFilter::select(const DataSet& data) const {
    std::vector<size_t> rows;
    if (!column_) {
        rows.resize(data.getRowCount());
        std::iota(rows.begin(), rows.end(), 0);
        return rows;
    }
    const auto& col = data.getColumns().at(*column_);
    for (size_t r = 0; r < col.size(); ++r) {
        if (col[r] > 0.0) rows.push_back(r);
    }
    return rows;
}

std::vector<double> Residualizer::residuals(const Variable& target,
                                            const std::vector<Variable>& z,
                                            const RowFilter& filter) const {
    return residuals(target, z, filter.select(data_));
}

std::vector<double> Residualizer::residuals(const Variable& target,
                                            const std::vector<Variable>& z,
                                            const std::vector<size_t>& rows) const {
    const auto& y = data_.column(target);
    std::vector<double> out(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) out[i] = y[rows[i]];
    if (z.empty() || rows.empty()) return out;

    if (z.size() > rows.size()) {
        throw Skewcycle::NumericalException("Regressing " + target.name + " on " + std::to_string(z.size()) +
                                            " variables with only " + std::to_string(rows.size()) + " rows");
    }

    MathUtils::Matrix X(rows.size(), z.size());
    for (size_t j = 0; j < z.size(); ++j) {
        const auto& col = data_.column(z[j]);
        for (size_t i = 0; i < rows.size(); ++i) X.data[i][j] = col[rows[i]];
    }

    const auto beta = MathUtils::ordinaryLeastSquares(X, out);
    if (!beta) {
        throw Skewcycle::NumericalException("Singular design regressing " + target.name + " on " +
                                            std::to_string(z.size()) + " variables");
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        double fitted = 0.0;
        for (size_t j = 0; j < z.size(); ++j) fitted += X.data[i][j] * (*beta)[j];
        out[i] -= fitted;
    }
    return out;
}
