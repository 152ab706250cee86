#pragma once
#include "AsymmetryStatistic.h"
#include "CausalGraph.h"
#include "Knowledge.h"
#include <set>
#include <vector>

struct OrientationReport {
    size_t rounds = 0;
    // Size of the changed set produced by each round, seeding sweep excluded.
    std::vector<size_t> changedSizes;
    // Evaluations skipped because a regression was singular.
    size_t inconclusive = 0;
    // True when a round left the changed set empty before the iteration bound.
    bool converged = false;
};

/**
 * Worklist fixpoint over edge directions.
 *
 * A seeding sweep evaluates every edge with empty conditioning sets. Then, for up to
 * maxIterations rounds, an undirected or bidirected edge is re-evaluated when either
 * endpoint changed in the previous round, and a directed edge when its head changed.
 * Conditioning sets are the endpoints' current parents minus the other endpoint and the
 * protected tier.
 */
class OrientationEngine {
public:
    OrientationEngine(const AsymmetryStatistic& statistic,
                      const KnowledgeFilter& knowledge,
                      size_t maxIterations,
                      bool verbose = false);

    OrientationReport run(CausalGraph& graph) const;

    /**
     * @brief Applies the transition rules to the pair {x, y}.
     * Knowledge decides first; otherwise cxy = leftRight(x, y | zy) > 0 and
     * cyx = leftRight(y, x | zx) > 0 pick the new state. cxy and cyx both true leaves the edge alone.
     * @post Endpoints whose incident edge changed are added to changed.
     * @return true if the edge changed.
     */
    bool orientEdge(CausalGraph& graph,
                    const Variable& x,
                    const Variable& y,
                    std::vector<Variable> zx,
                    std::vector<Variable> zy,
                    std::set<size_t>& changed,
                    OrientationReport& report) const;

private:
    const AsymmetryStatistic& statistic_;
    const KnowledgeFilter& knowledge_;
    size_t maxIterations_;
    bool verbose_;
};
