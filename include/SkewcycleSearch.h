#pragma once
#include "CausalGraph.h"
#include "DataSet.h"
#include "FastAdjacencySearch.h"
#include "Knowledge.h"
#include "OrientationEngine.h"
#include <memory>
#include <optional>

struct SearchOptions {
    double twoCycleAlpha = 0.05;
    double penaltyDiscount = 1.0;
    int depth = 1000;
    int maxIterations = 15;
    bool faithfulnessAssumed = true;
    bool symmetricFirstStep = false;
    int maxDegree = -1;
    double skeletonAlpha = 0.01;
    bool verbose = false;

    /**
     * @throws Skewcycle::ConfigurationException if an alpha is outside (0, 1), depth or
     *         maxIterations is negative, penaltyDiscount is not positive, or maxDegree < -1.
     */
    void validate() const;
};

/**
 * Skeleton, knowledge pre-orientation, orientation fixpoint and two-cycle pass over one
 * owned graph. The data set must outlive the search and should already be centered.
 */
class SkewcycleSearch {
public:
    explicit SkewcycleSearch(const DataSet& data, SearchOptions options = {});

    void setKnowledge(Knowledge knowledge) { knowledge_ = std::move(knowledge); }
    const Knowledge& getKnowledge() const { return knowledge_; }

    // Used instead of the skeleton search; it is made undirected and re-bound by name.
    void setInitialGraph(const CausalGraph& graph) { initialGraph_ = graph; }
    void setSkeletonSearch(SkeletonSearch search) { skeleton_ = std::move(search); }

    void setTwoCycleAlpha(double alpha);
    void setPenaltyDiscount(double penaltyDiscount);
    void setDepth(int depth);
    void setMaxIterations(int maxIterations);
    void setMaxDegree(int maxDegree);
    void setSkeletonAlpha(double alpha);
    void setFaithfulnessAssumed(bool faithfulnessAssumed);
    void setSymmetricFirstStep(bool symmetricFirstStep);
    void setVerbose(bool verbose);
    const SearchOptions& getOptions() const { return options_; }

    /**
     * @brief Runs the full search.
     * @throws Skewcycle::InvalidGraphException if the skeleton is missing or cannot be re-bound.
     */
    std::unique_ptr<CausalGraph> search();

    const OrientationReport& getOrientationReport() const { return report_; }
    size_t getTwoCycleCount() const { return twoCycles_; }

private:
    std::unique_ptr<CausalGraph> buildSkeleton() const;
    void applyKnowledge(CausalGraph& graph, const KnowledgeFilter& filter) const;
    void updateOptions(const SearchOptions& candidate);

    const DataSet& data_;
    SearchOptions options_;
    Knowledge knowledge_;
    std::optional<CausalGraph> initialGraph_;
    SkeletonSearch skeleton_ = &FastAdjacencySearch::search;
    OrientationReport report_;
    size_t twoCycles_ = 0;
};
