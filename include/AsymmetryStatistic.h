#pragma once
#include "Residualizer.h"
#include <optional>
#include <vector>

/**
 * Skew-based directional score between two centered variables.
 *
 * With ry the residual of y on {x} + z and a = cov(x, y) / var(x),
 *   E(d) = mean of x_k * ry_k over rows where d * x_k > 0 and d * (|a| x_k + ry_k) < 0
 *   leftRight(x, y, z) = E(+1) - E(-1)
 * A positive value favors x -> y. leftRight(y, x, z') is computed on its own and is
 * not the negation of leftRight(x, y, z).
 */
class AsymmetryStatistic {
public:
    explicit AsymmetryStatistic(const Residualizer& residualizer) : residualizer_(residualizer) {}

    /**
     * @post Empty when var(x) is zero or either tail row set is empty.
     * @throws Skewcycle::NumericalException if regressing y on {x} + z is singular.
     */
    std::optional<double> leftRight(const Variable& x, const Variable& y, const std::vector<Variable>& z) const;

    // True only for an engaged, strictly positive leftRight. Undefined counts against x -> y.
    bool favors(const Variable& x, const Variable& y, const std::vector<Variable>& z) const;

private:
    const Residualizer& residualizer_;
};
