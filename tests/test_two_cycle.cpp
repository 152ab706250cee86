#include <gtest/gtest.h>
#include "TestData.h"
#include "TwoCycleDetector.h"

namespace {
const std::vector<Variable> kThree = {{"A", 0}, {"B", 1}, {"C", 2}};

CausalGraph undirectedPair(const DataSet& data) {
    CausalGraph g(data.getVariables());
    g.setUndirected(data.getVariable("X"), data.getVariable("Y"));
    return g;
}
}

TEST(TwoCycleDetectorTest, SubsetSearchStopsAtFirstRejection) {
    size_t calls = 0;
    const bool result = TwoCycleDetector::allSubsetsConfirm(kThree, 3, [&](const std::vector<Variable>&) {
        ++calls;
        return calls < 2;
    });
    EXPECT_FALSE(result);
    EXPECT_EQ(calls, 2u);
}

TEST(TwoCycleDetectorTest, SubsetSearchVisitsEverySubsetUpToDepth) {
    size_t calls = 0;
    std::vector<size_t> sizes;
    auto count = [&](const std::vector<Variable>& z) {
        ++calls;
        sizes.push_back(z.size());
        return true;
    };
    EXPECT_TRUE(TwoCycleDetector::allSubsetsConfirm(kThree, 3, count));
    EXPECT_EQ(calls, 8u);
    EXPECT_EQ(sizes.front(), 0u);

    calls = 0;
    EXPECT_TRUE(TwoCycleDetector::allSubsetsConfirm(kThree, 1, count));
    EXPECT_EQ(calls, 4u);

    calls = 0;
    EXPECT_TRUE(TwoCycleDetector::allSubsetsConfirm({}, 5, count));
    EXPECT_EQ(calls, 1u);
}

TEST(TwoCycleDetectorTest, CandidateSetSkipsUndirectedMutualAndProtectedNeighbors) {
    const std::vector<std::string> names = {"X", "Y", "A", "B", "C", "P", "D"};
    std::vector<std::vector<double>> cols(names.size(), std::vector<double>{1, -1, 2});
    const DataSet data(names, cols);
    const auto v = [&](const char* n) { return data.getVariable(n); };

    Knowledge k;
    k.addToTier(0, "X");
    k.addToTier(1, "P");
    KnowledgeFilter filter(k);
    Residualizer res(data);
    TwoCycleDetector detector(res, filter, 0.05, 2);

    CausalGraph g(data.getVariables());
    g.setUndirected(v("X"), v("Y"));
    g.setDirected(v("A"), v("X"));
    g.setUndirected(v("B"), v("X"));
    g.setTwoCycle(v("C"), v("Y"));
    g.setDirected(v("P"), v("Y"));
    g.setBidirected(v("D"), v("Y"));

    EXPECT_EQ(detector.candidateSet(g, v("X"), v("Y")), (std::vector<Variable>{v("A"), v("D")}));
}

TEST(TwoCycleDetectorTest, FeedbackPairBecomesMutual) {
    const DataSet data = TestData::reluFeedback(4000, 3);
    Residualizer res(data);
    Knowledge k;
    KnowledgeFilter filter(k);
    TwoCycleDetector detector(res, filter, 0.05, 2);
    const Variable& x = data.getVariable("X");
    const Variable& y = data.getVariable("Y");

    EXPECT_LT(detector.orderingTest(x, y, {}).pValue, 0.05);
    EXPECT_LT(detector.orderingTest(y, x, {}).pValue, 0.05);

    CausalGraph g = undirectedPair(data);
    EXPECT_EQ(detector.apply(g), 1u);
    EXPECT_TRUE(g.isTwoCycle(x, y));
    EXPECT_EQ(g.getEdgeMultiplicity(x, y), 2u);
}

TEST(TwoCycleDetectorTest, OneWayCauseIsNotMutual) {
    const DataSet data = TestData::skewedCause(2000, 7);
    Residualizer res(data);
    Knowledge k;
    KnowledgeFilter filter(k);
    TwoCycleDetector detector(res, filter, 0.05, 2);

    CausalGraph g = undirectedPair(data);
    EXPECT_FALSE(detector.isTwoCycle(g, data.getVariable("X"), data.getVariable("Y")));
    EXPECT_EQ(detector.apply(g), 0u);
    EXPECT_TRUE(g.isUndirected(data.getVariable("X"), data.getVariable("Y")));
}

TEST(TwoCycleDetectorTest, KnowledgeOrientedEdgesAreNotEligible) {
    const DataSet data = TestData::reluFeedback(4000, 3);
    Residualizer res(data);
    Knowledge k;
    k.setRequired("X", "Y");
    KnowledgeFilter filter(k);
    TwoCycleDetector detector(res, filter, 0.05, 2);

    CausalGraph g = undirectedPair(data);
    EXPECT_EQ(detector.apply(g), 0u);
    EXPECT_TRUE(g.isUndirected(data.getVariable("X"), data.getVariable("Y")));
}

TEST(TwoCycleDetectorTest, FeedbackPairSurvivesEveryConditioningSubset) {
    const DataSet data = TestData::reluFeedbackWithNoise(4000, 3);
    Residualizer res(data);
    Knowledge k;
    KnowledgeFilter filter(k);
    TwoCycleDetector detector(res, filter, 0.05, 2);
    const Variable& x = data.getVariable("X");
    const Variable& y = data.getVariable("Y");
    const Variable& w = data.getVariable("W");

    CausalGraph g = undirectedPair(data);
    g.setDirected(w, x);
    ASSERT_EQ(detector.candidateSet(g, x, y), std::vector<Variable>{w});
    EXPECT_TRUE(detector.confirms(x, y, {}));
    EXPECT_TRUE(detector.confirms(x, y, {w}));

    EXPECT_TRUE(detector.isTwoCycle(g, x, y));
    EXPECT_EQ(detector.apply(g), 1u);
    EXPECT_TRUE(g.isTwoCycle(x, y));
    EXPECT_TRUE(g.isDirected(w, x));
}

TEST(TwoCycleDetectorTest, OneFailingSubsetKeepsThePairUndirected) {
    const DataSet data = TestData::confoundedFeedback(4000, 5);
    Residualizer res(data);
    Knowledge k;
    KnowledgeFilter filter(k);
    TwoCycleDetector detector(res, filter, 0.05, 2);
    const Variable& x = data.getVariable("X");
    const Variable& y = data.getVariable("Y");
    const Variable& w = data.getVariable("W");

    CausalGraph g = undirectedPair(data);
    g.setDirected(w, x);
    EXPECT_FALSE(detector.confirms(x, y, {}));
    EXPECT_TRUE(detector.confirms(x, y, {w}));

    EXPECT_FALSE(detector.isTwoCycle(g, x, y));
    EXPECT_EQ(detector.apply(g), 0u);
    EXPECT_TRUE(g.isUndirected(x, y));
}

TEST(TwoCycleDetectorTest, SingularConditioningSetDoesNotConfirm) {
    const DataSet data = TestData::reluFeedbackWithNoise(4000, 3);
    Residualizer res(data);
    Knowledge k;
    KnowledgeFilter filter(k);
    const Variable& x = data.getVariable("X");
    const Variable& y = data.getVariable("Y");
    const Variable& w = data.getVariable("W");
    const Variable& v = data.getVariable("V");

    CausalGraph g = undirectedPair(data);
    g.setDirected(w, x);
    g.setDirected(v, y);

    TwoCycleDetector pairs(res, filter, 0.05, 2);
    EXPECT_FALSE(pairs.confirms(x, y, {w, v}));
    EXPECT_FALSE(pairs.isTwoCycle(g, x, y));

    // Singletons never reach the collinear pair.
    TwoCycleDetector singles(res, filter, 0.05, 1);
    EXPECT_TRUE(singles.isTwoCycle(g, x, y));
}
