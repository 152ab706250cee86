#pragma once

#include "CausalGraph.h"
#include "DataSet.h"
#include "Knowledge.h"

#include <functional>
#include <memory>
#include <vector>

// Everything a skeleton collaborator may need. The score-oriented fields
// (penaltyDiscount, faithfulnessAssumed, symmetricFirstStep) are forwarded for
// caller-supplied searches; FastAdjacencySearch does not read them.
struct SkeletonRequest {
    const DataSet& data;
    const Knowledge& knowledge;
    double penaltyDiscount = 1.0;
    // FastAdjacencySearch reads this as the largest conditioning-set size; -1 is unbounded.
    int maxDegree = -1;
    bool faithfulnessAssumed = true;
    bool symmetricFirstStep = false;
    double alpha = 0.01;
    bool verbose = false;
};

using SkeletonSearch = std::function<std::unique_ptr<CausalGraph>(const SkeletonRequest&)>;

struct CiTestResult {
    double pValue = 1.0;
    double effect = 0.0;
    bool independent = false;
};

/**
 * Adjacency phase of PC: start complete, then for depth d = 0, 1, ... remove X --- Y once
 * some size-d subset of adj(X) \ {Y} or adj(Y) \ {X} renders them independent under a
 * Fisher-z partial-correlation test. The result is fully undirected.
 * The depth stops at request.maxDegree when it is not negative, so maxDegree 0 only
 * tests marginal independence.
 */
class FastAdjacencySearch {
public:
    static std::unique_ptr<CausalGraph> search(const SkeletonRequest& request);

    /**
     * @brief Fisher-z test of the partial correlation of x and y given cond.
     * @post Singular designs and too few rows report dependence.
     */
    static CiTestResult conditionalIndependenceTest(const DataSet& data,
                                                    const Variable& x,
                                                    const Variable& y,
                                                    const std::vector<Variable>& cond,
                                                    double alpha);
};
