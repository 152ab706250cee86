#pragma once
#include "DataSet.h"
#include <optional>
#include <vector>

// Row selection for a regression: every row, or the rows where one column is strictly positive.
class RowFilter {
public:
    static RowFilter all() { return RowFilter(std::nullopt); }
    static RowFilter positive(const Variable& v) { return RowFilter(v.column); }

    bool selectsAll() const { return !column_.has_value(); }

    // Row indices kept by the filter, ascending.
    std::vector<size_t> select(const DataSet& data) const;

private:
    explicit RowFilter(std::optional<size_t> column) : column_(column) {}
    std::optional<size_t> column_;
};

class Residualizer {
public:
    explicit Residualizer(const DataSet& data) : data_(data) {}

    /**
     * @brief OLS residuals of target on z over the filtered rows, without an intercept.
     * @pre target is not in z; data are centered.
     * @post Result is aligned to filter.select(data). With empty z it is the selected values unchanged.
     *       A filter that selects no rows gives an empty vector.
     * @throws Skewcycle::NumericalException if the design is singular or z has more variables than rows.
     */
    std::vector<double> residuals(const Variable& target,
                                  const std::vector<Variable>& z,
                                  const RowFilter& filter = RowFilter::all()) const;

    std::vector<double> residuals(const Variable& target,
                                  const std::vector<Variable>& z,
                                  const std::vector<size_t>& rows) const;

    const DataSet& data() const { return data_; }

private:
    const DataSet& data_;
};
