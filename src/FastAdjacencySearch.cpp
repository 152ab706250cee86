#include "FastAdjacencySearch.h"

#include "MathUtils.h"
#include "Residualizer.h"
#include "SkewcycleExceptions.h"
#include "Statistics.h"
#include "SubsetGenerator.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace {
bool separatedBy(const DataSet& data,
                 const Variable& x,
                 const Variable& y,
                 const std::vector<Variable>& adj,
                 size_t level,
                 double alpha) {
    if (adj.size() < level) return false;
    SubsetGenerator gen(adj.size(), level);
    std::vector<size_t> choice;
    std::vector<Variable> cond;
    while (gen.next(choice)) {
        if (choice.size() != level) continue;
        cond.clear();
        for (size_t idx : choice) cond.push_back(adj[idx]);
        if (FastAdjacencySearch::conditionalIndependenceTest(data, x, y, cond, alpha).independent) return true;
    }
    return false;
}

std::vector<Variable> adjacentExcept(const CausalGraph& graph, const Variable& v, const Variable& other) {
    std::vector<Variable> adj = graph.getAdjacentNodes(v);
    adj.erase(std::remove(adj.begin(), adj.end(), other), adj.end());
    return adj;
}
}

CiTestResult FastAdjacencySearch::conditionalIndependenceTest(const DataSet& data,
                                                              const Variable& x,
                                                              const Variable& y,
                                                              const std::vector<Variable>& cond,
                                                              double alpha) {
    CiTestResult out;
    const size_t n = data.getRowCount();
    if (n <= cond.size() + 3) return out;

    // Step 1: regress out conditioning variables and correlate the residuals.
    Residualizer residualizer(data);
    std::vector<double> rx;
    std::vector<double> ry;
    try {
        rx = residualizer.residuals(x, cond);
        ry = residualizer.residuals(y, cond);
    } catch (const Skewcycle::NumericalException&) {
        return out;
    }

    const double vx = Statistics::variance(rx);
    const double vy = Statistics::variance(ry);
    if (!(vx > 0.0) || !(vy > 0.0)) return out;
    const double r = std::clamp(Statistics::covariance(rx, ry) / std::sqrt(vx * vy), -0.999999, 0.999999);
    out.effect = std::abs(r);

    // Step 2: Fisher z-transform approximates p-value for partial correlation.
    const double fisher = 0.5 * std::log((1.0 + r) / (1.0 - r));
    const double z = std::abs(fisher) * std::sqrt(static_cast<double>(n) - static_cast<double>(cond.size()) - 3.0);
    out.pValue = MathUtils::getPValueFromZ(z);
    out.independent = out.pValue > alpha;
    return out;
}

std::unique_ptr<CausalGraph> FastAdjacencySearch::search(const SkeletonRequest& request) {
    const auto& vars = request.data.getVariables();
    KnowledgeFilter knowledge(request.knowledge);

    auto graph = std::make_unique<CausalGraph>(vars);
    for (size_t i = 0; i < vars.size(); ++i) {
        for (size_t j = i + 1; j < vars.size(); ++j) {
            if (knowledge.forbidden(vars[i], vars[j])) continue;
            graph->setUndirected(vars[i], vars[j]);
        }
    }

    const size_t maxLevel = request.maxDegree < 0 ? vars.size() : static_cast<size_t>(request.maxDegree);
    for (size_t level = 0; level <= maxLevel; ++level) {
        bool enoughAdjacents = false;
        size_t removed = 0;
        for (const auto& e : graph->getEdges()) {
            const auto adjX = adjacentExcept(*graph, e.node1, e.node2);
            const auto adjY = adjacentExcept(*graph, e.node2, e.node1);
            if (adjX.size() < level && adjY.size() < level) continue;
            enoughAdjacents = true;

            if (separatedBy(request.data, e.node1, e.node2, adjX, level, request.alpha) ||
                (level > 0 && separatedBy(request.data, e.node1, e.node2, adjY, level, request.alpha))) {
                graph->removeEdge(e.node1, e.node2);
                ++removed;
            }
        }
        if (request.verbose) {
            std::cout << "[Skewcycle][Skeleton] Depth " << level << ": removed " << removed << " edge(s)\n";
        }
        if (!enoughAdjacents) break;
    }

    if (request.verbose) {
        std::cout << "[Skewcycle][Skeleton] " << graph->getNumEdges() << " edge(s) in skeleton over "
                  << vars.size() << " variable(s)\n";
    }
    return graph;
}
