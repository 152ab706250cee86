#include "OrientationEngine.h"
#include "SkewcycleExceptions.h"
#include <algorithm>
#include <iostream>

OrientationEngine::OrientationEngine(const AsymmetryStatistic& statistic,
                                     const KnowledgeFilter& knowledge,
                                     size_t maxIterations,
                                     bool verbose)
    : statistic_(statistic), knowledge_(knowledge), maxIterations_(maxIterations), verbose_(verbose) {}

bool OrientationEngine::orientEdge(CausalGraph& graph,
                                   const Variable& x,
                                   const Variable& y,
                                   std::vector<Variable> zx,
                                   std::vector<Variable> zy,
                                   std::set<size_t>& changed,
                                   OrientationReport& report) const {
    if (knowledge_.forbidden(x, y)) return false;

    if (knowledge_.orients(x, y) || knowledge_.orients(y, x)) {
        const Variable& tail = knowledge_.orients(x, y) ? x : y;
        const Variable& head = knowledge_.orients(x, y) ? y : x;
        if (graph.isDirected(tail, head)) return false;
        graph.setDirected(tail, head);
        changed.insert(head.column);
        return true;
    }

    zx.erase(std::remove(zx.begin(), zx.end(), y), zx.end());
    zy.erase(std::remove(zy.begin(), zy.end(), x), zy.end());
    knowledge_.removeProtected(zx);
    knowledge_.removeProtected(zy);

    bool cxy = false;
    bool cyx = false;
    try {
        cxy = statistic_.favors(x, y, zy);
        cyx = statistic_.favors(y, x, zx);
    } catch (const Skewcycle::NumericalException& e) {
        ++report.inconclusive;
        std::cerr << "[Skewcycle][Warning] Leaving " << x.name << " - " << y.name << " unchanged: " << e.what() << "\n";
        return false;
    }

    if (cxy && !cyx && !graph.isDirected(x, y)) {
        graph.setDirected(x, y);
        changed.insert(y.column);
    } else if (cyx && !cxy && !graph.isDirected(y, x)) {
        graph.setDirected(y, x);
        changed.insert(x.column);
    } else if (!cxy && !cyx && !graph.isBidirected(x, y)) {
        graph.setBidirected(x, y);
        changed.insert(x.column);
        changed.insert(y.column);
    } else if (!cxy && !cyx && !graph.isUndirected(x, y)) {
        graph.setUndirected(x, y);
        changed.insert(x.column);
        changed.insert(y.column);
    } else {
        return false;
    }
    return true;
}

OrientationReport OrientationEngine::run(CausalGraph& graph) const {
    OrientationReport report;

    std::set<size_t> current;
    std::set<size_t> next;
    for (const auto& v : graph.getNodes()) next.insert(v.column);

    for (const auto& e : graph.getEdges()) {
        orientEdge(graph, e.node1, e.node2, {}, {}, next, report);
    }

    for (size_t round = 0; round < maxIterations_; ++round) {
        current.swap(next);
        next.clear();

        for (const auto& e : graph.getEdges()) {
            if (e.type == EdgeType::TwoCycle) continue;
            if (e.type == EdgeType::Directed) {
                if (!current.count(e.node2.column)) continue;
            } else if (!current.count(e.node1.column) && !current.count(e.node2.column)) {
                continue;
            }
            orientEdge(graph, e.node1, e.node2, graph.getParents(e.node1), graph.getParents(e.node2), next, report);
        }

        ++report.rounds;
        report.changedSizes.push_back(next.size());
        if (verbose_) {
            std::cout << "[Skewcycle][Orient] Round " << report.rounds << ": " << next.size() << " variable(s) changed\n";
        }
        if (next.empty()) {
            report.converged = true;
            break;
        }
    }

    if (verbose_ && !report.converged) {
        std::cout << "[Skewcycle][Orient] Stopped at the iteration bound with " << next.size()
                  << " variable(s) still changing\n";
    }
    return report;
}
