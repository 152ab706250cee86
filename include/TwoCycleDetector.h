#pragma once
#include "CausalGraph.h"
#include "Knowledge.h"
#include "Residualizer.h"
#include "Statistics.h"
#include <functional>
#include <vector>

/**
 * Decides whether an undirected edge X --- Y is better modeled as a mutual pair X <=> Y.
 *
 * For every conditioning subset Z (up to depth) of the candidate neighbors, both orderings
 * (X, Y) and (Y, X) must show a significant Welch difference between the residual-product
 * sample over all rows and over the rows where the ordering's first variable is positive.
 */
class TwoCycleDetector {
public:
    TwoCycleDetector(const Residualizer& residualizer,
                     const KnowledgeFilter& knowledge,
                     double alpha,
                     size_t depth,
                     bool verbose = false);

    /**
     * @brief Neighbors of X or Y usable for conditioning: protected-tier variables, neighbors
     * joined by an undirected edge or a mutual pair, and X and Y themselves are removed.
     */
    std::vector<Variable> candidateSet(const CausalGraph& graph, const Variable& x, const Variable& y) const;

    // Residual-product sample rA * rB / mean(rA^2) for ordering (a, b) over the filtered rows.
    std::vector<double> residualProducts(const Variable& a, const Variable& b,
                                         const std::vector<Variable>& z, const RowFilter& filter) const;

    // Welch test of the all-rows sample against the truncated sample for ordering (a, b).
    WelchResult orderingTest(const Variable& a, const Variable& b, const std::vector<Variable>& z) const;

    // Both orderings reject at alpha for this z. Singular designs do not confirm.
    bool confirms(const Variable& x, const Variable& y, const std::vector<Variable>& z) const;

    bool isTwoCycle(const CausalGraph& graph, const Variable& x, const Variable& y) const;

    /**
     * @brief Turns every eligible undirected edge that passes isTwoCycle into a mutual pair.
     * Eligible edges are undirected and untouched by knowledge in either direction.
     * @return Number of mutual pairs created.
     */
    size_t apply(CausalGraph& graph) const;

    /**
     * @brief Runs test over every subset of candidates with at most depth members, empty set first.
     * @post Returns false at the first subset the test rejects; later subsets are not visited.
     */
    static bool allSubsetsConfirm(const std::vector<Variable>& candidates,
                                  size_t depth,
                                  const std::function<bool(const std::vector<Variable>&)>& test);

private:
    const Residualizer& residualizer_;
    const KnowledgeFilter& knowledge_;
    double alpha_;
    size_t depth_;
    bool verbose_;
};
