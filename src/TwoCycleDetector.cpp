#include "TwoCycleDetector.h"
#include "SkewcycleExceptions.h"
#include "SubsetGenerator.h"
#include <algorithm>
#include <iostream>
#include <set>
#ifdef USE_OPENMP
#include <omp.h>
#endif

TwoCycleDetector::TwoCycleDetector(const Residualizer& residualizer,
                                   const KnowledgeFilter& knowledge,
                                   double alpha,
                                   size_t depth,
                                   bool verbose)
    : residualizer_(residualizer), knowledge_(knowledge), alpha_(alpha), depth_(depth), verbose_(verbose) {}

std::vector<Variable> TwoCycleDetector::candidateSet(const CausalGraph& graph,
                                                     const Variable& x,
                                                     const Variable& y) const {
    std::set<Variable> merged;
    for (const Variable* endpoint : {&x, &y}) {
        std::vector<Variable> adj = graph.getAdjacentNodes(*endpoint);
        knowledge_.removeProtected(adj);
        for (const auto& a : adj) {
            if (graph.getEdgeMultiplicity(a, *endpoint) == 2 || graph.isUndirected(a, *endpoint)) continue;
            merged.insert(a);
        }
    }
    merged.erase(x);
    merged.erase(y);
    return std::vector<Variable>(merged.begin(), merged.end());
}

std::vector<double> TwoCycleDetector::residualProducts(const Variable& a,
                                                       const Variable& b,
                                                       const std::vector<Variable>& z,
                                                       const RowFilter& filter) const {
    const std::vector<size_t> rows = filter.select(residualizer_.data());
    const std::vector<double> ra = residualizer_.residuals(a, z, rows);
    const std::vector<double> rb = residualizer_.residuals(b, z, rows);

    double eraa = 0.0;
    for (double r : ra) eraa += r * r;
    if (ra.empty()) return {};
    eraa /= static_cast<double>(ra.size());
    if (!(eraa > 0.0)) return {};

    std::vector<double> out(ra.size());
    for (size_t i = 0; i < ra.size(); ++i) out[i] = ra[i] * rb[i] / eraa;
    return out;
}

WelchResult TwoCycleDetector::orderingTest(const Variable& a, const Variable& b, const std::vector<Variable>& z) const {
    const std::vector<double> full = residualProducts(a, b, z, RowFilter::all());
    const std::vector<double> truncated = residualProducts(a, b, z, RowFilter::positive(a));
    return Statistics::welchTest(full, truncated);
}

bool TwoCycleDetector::confirms(const Variable& x, const Variable& y, const std::vector<Variable>& z) const {
    try {
        const WelchResult first = orderingTest(x, y, z);
        if (!first.valid || !(first.pValue < alpha_)) return false;
        const WelchResult second = orderingTest(y, x, z);
        return second.valid && second.pValue < alpha_;
    } catch (const Skewcycle::NumericalException& e) {
        if (verbose_) {
            std::cerr << "[Skewcycle][TwoCycle] " << x.name << " - " << y.name << " inconclusive: " << e.what() << "\n";
        }
        return false;
    }
}

bool TwoCycleDetector::allSubsetsConfirm(const std::vector<Variable>& candidates,
                                         size_t depth,
                                         const std::function<bool(const std::vector<Variable>&)>& test) {
    SubsetGenerator gen(candidates.size(), depth);
    std::vector<size_t> choice;
    std::vector<Variable> z;
    while (gen.next(choice)) {
        z.clear();
        for (size_t idx : choice) z.push_back(candidates[idx]);
        if (!test(z)) return false;
    }
    return true;
}

bool TwoCycleDetector::isTwoCycle(const CausalGraph& graph, const Variable& x, const Variable& y) const {
    const std::vector<Variable> candidates = candidateSet(graph, x, y);
    return allSubsetsConfirm(candidates, depth_, [&](const std::vector<Variable>& z) {
        return confirms(x, y, z);
    });
}

size_t TwoCycleDetector::apply(CausalGraph& graph) const {
    std::vector<Edge> eligible;
    for (const auto& e : graph.getEdges()) {
        if (e.type != EdgeType::Undirected) continue;
        if (knowledge_.forbidden(e.node1, e.node2)) continue;
        if (knowledge_.orients(e.node1, e.node2) || knowledge_.orients(e.node2, e.node1)) continue;
        eligible.push_back(e);
    }

    // Only undirected edges change below, and candidate sets never contain undirected or
    // mutual neighbors, so every decision can be taken against the graph as it stands now.
    std::vector<char> decisions(eligible.size(), 0);
    const CausalGraph& snapshot = graph;
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < eligible.size(); ++i) {
        decisions[i] = isTwoCycle(snapshot, eligible[i].node1, eligible[i].node2) ? 1 : 0;
    }

    size_t created = 0;
    for (size_t i = 0; i < eligible.size(); ++i) {
        if (!decisions[i]) continue;
        graph.setTwoCycle(eligible[i].node1, eligible[i].node2);
        ++created;
        if (verbose_) {
            std::cout << "[Skewcycle][TwoCycle] 2-cycle or confounder: " << eligible[i].node1.name << " <=> "
                      << eligible[i].node2.name << "\n";
        }
    }
    return created;
}
