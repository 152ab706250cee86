#include "SkewcycleSearch.h"
#include "AsymmetryStatistic.h"
#include "GraphIO.h"
#include "Residualizer.h"
#include "SkewcycleExceptions.h"
#include "Statistics.h"
#include "TwoCycleDetector.h"
#include <iomanip>
#include <iostream>

void SearchOptions::validate() const {
    if (!(twoCycleAlpha > 0.0 && twoCycleAlpha < 1.0)) {
        throw Skewcycle::ConfigurationException("two_cycle_alpha must be in (0,1)");
    }
    if (!(skeletonAlpha > 0.0 && skeletonAlpha < 1.0)) {
        throw Skewcycle::ConfigurationException("skeleton_alpha must be in (0,1)");
    }
    if (depth < 0) throw Skewcycle::ConfigurationException("depth must be >= 0");
    if (maxIterations < 0) throw Skewcycle::ConfigurationException("max_iterations must be >= 0");
    if (!(penaltyDiscount > 0.0)) throw Skewcycle::ConfigurationException("penalty_discount must be > 0");
    if (maxDegree < -1) throw Skewcycle::ConfigurationException("max_degree must be >= -1");
}

SkewcycleSearch::SkewcycleSearch(const DataSet& data, SearchOptions options) : data_(data), options_(options) {
    options_.validate();
}

void SkewcycleSearch::updateOptions(const SearchOptions& candidate) {
    candidate.validate();
    options_ = candidate;
}

void SkewcycleSearch::setTwoCycleAlpha(double alpha) {
    SearchOptions next = options_;
    next.twoCycleAlpha = alpha;
    updateOptions(next);
}

void SkewcycleSearch::setPenaltyDiscount(double penaltyDiscount) {
    SearchOptions next = options_;
    next.penaltyDiscount = penaltyDiscount;
    updateOptions(next);
}

void SkewcycleSearch::setDepth(int depth) {
    SearchOptions next = options_;
    next.depth = depth;
    updateOptions(next);
}

void SkewcycleSearch::setMaxIterations(int maxIterations) {
    SearchOptions next = options_;
    next.maxIterations = maxIterations;
    updateOptions(next);
}

void SkewcycleSearch::setMaxDegree(int maxDegree) {
    SearchOptions next = options_;
    next.maxDegree = maxDegree;
    updateOptions(next);
}

void SkewcycleSearch::setSkeletonAlpha(double alpha) {
    SearchOptions next = options_;
    next.skeletonAlpha = alpha;
    updateOptions(next);
}

void SkewcycleSearch::setFaithfulnessAssumed(bool faithfulnessAssumed) {
    options_.faithfulnessAssumed = faithfulnessAssumed;
}

void SkewcycleSearch::setSymmetricFirstStep(bool symmetricFirstStep) {
    options_.symmetricFirstStep = symmetricFirstStep;
}

void SkewcycleSearch::setVerbose(bool verbose) {
    options_.verbose = verbose;
}

std::unique_ptr<CausalGraph> SkewcycleSearch::buildSkeleton() const {
    if (initialGraph_) {
        auto graph = std::make_unique<CausalGraph>(*initialGraph_);
        graph->makeUndirected();
        graph->replaceNodes(data_.getVariables());
        for (const auto& v : data_.getVariables()) graph->addNode(v);
        return graph;
    }

    if (!skeleton_) throw Skewcycle::InvalidGraphException("No skeleton search configured");
    SkeletonRequest request{data_, knowledge_};
    request.penaltyDiscount = options_.penaltyDiscount;
    request.maxDegree = options_.maxDegree;
    request.faithfulnessAssumed = options_.faithfulnessAssumed;
    request.symmetricFirstStep = options_.symmetricFirstStep;
    request.alpha = options_.skeletonAlpha;
    request.verbose = options_.verbose;

    auto graph = skeleton_(request);
    if (!graph) throw Skewcycle::InvalidGraphException("Skeleton search returned no graph");
    return graph;
}

void SkewcycleSearch::applyKnowledge(CausalGraph& graph, const KnowledgeFilter& filter) const {
    for (const auto& e : graph.getEdges()) {
        const Variable& x = e.node1;
        const Variable& y = e.node2;
        if (filter.forbidden(x, y)) {
            graph.removeEdge(x, y);
        } else if (filter.orients(x, y)) {
            graph.setDirected(x, y);
        } else if (filter.orients(y, x)) {
            graph.setDirected(y, x);
        }
    }
}

std::unique_ptr<CausalGraph> SkewcycleSearch::search() {
    report_ = OrientationReport{};
    twoCycles_ = 0;

    if (options_.verbose) {
        for (const auto& v : data_.getVariables()) {
            const ColumnStats stats = Statistics::calculateStats(data_.column(v));
            std::cout << "[Skewcycle] Skewness of " << v.name << " = " << std::setprecision(4) << stats.skewness << "\n";
        }
    }

    std::unique_ptr<CausalGraph> graph = buildSkeleton();
    KnowledgeFilter filter(knowledge_);
    applyKnowledge(*graph, filter);

    Residualizer residualizer(data_);
    AsymmetryStatistic statistic(residualizer);
    OrientationEngine engine(statistic, filter, static_cast<size_t>(options_.maxIterations), options_.verbose);
    report_ = engine.run(*graph);

    if (options_.verbose) std::cout << "[Skewcycle][TwoCycle] Orienting 2-cycles or confounders\n";
    TwoCycleDetector detector(residualizer, filter, options_.twoCycleAlpha, static_cast<size_t>(options_.depth),
                              options_.verbose);
    twoCycles_ = detector.apply(*graph);

    if (options_.verbose) {
        std::cout << "[Skewcycle] Final graph:\n" << GraphIO::toString(*graph);
    }
    return graph;
}
