#include <gtest/gtest.h>
#include "Residualizer.h"
#include "SkewcycleExceptions.h"

namespace {
DataSet smallData() {
    // y = 2 x - z exactly; w duplicates x.
    const std::vector<double> x = {1, -2, 3, -1, 0.5, -1.5};
    const std::vector<double> z = {0.5, 1, -1, -2, 2, -0.5};
    std::vector<double> y(x.size());
    for (size_t i = 0; i < x.size(); ++i) y[i] = 2.0 * x[i] - z[i];
    return DataSet({"X", "Z", "Y", "W"}, {x, z, y, x});
}
}

TEST(ResidualizerTest, EmptyConditioningSetReturnsSelectedValues) {
    const DataSet data = smallData();
    Residualizer res(data);
    const Variable& x = data.getVariable("X");

    const auto all = res.residuals(x, {});
    EXPECT_EQ(all, data.column(x));

    const auto positive = res.residuals(x, {}, RowFilter::positive(x));
    EXPECT_EQ(positive, (std::vector<double>{1, 3, 0.5}));
}

TEST(ResidualizerTest, RowFilterSelectsStrictlyPositiveRows) {
    const DataSet data = smallData();
    EXPECT_EQ(RowFilter::positive(data.getVariable("Z")).select(data), (std::vector<size_t>{0, 1, 4}));
    EXPECT_EQ(RowFilter::all().select(data).size(), data.getRowCount());
    EXPECT_TRUE(RowFilter::all().selectsAll());
    EXPECT_FALSE(RowFilter::positive(data.getVariable("Z")).selectsAll());
}

TEST(ResidualizerTest, ExactLinearFitLeavesZeroResiduals) {
    const DataSet data = smallData();
    Residualizer res(data);
    const auto r = res.residuals(data.getVariable("Y"), {data.getVariable("X"), data.getVariable("Z")});
    ASSERT_EQ(r.size(), data.getRowCount());
    for (double v : r) EXPECT_NEAR(v, 0.0, 1e-10);
}

TEST(ResidualizerTest, ResidualsAreAlignedToFilteredRows) {
    const DataSet data = smallData();
    Residualizer res(data);
    const Variable& x = data.getVariable("X");
    const auto r = res.residuals(data.getVariable("Y"), {x, data.getVariable("Z")}, RowFilter::positive(x));
    ASSERT_EQ(r.size(), 3u);
    for (double v : r) EXPECT_NEAR(v, 0.0, 1e-10);
}

TEST(ResidualizerTest, CollinearDesignThrowsNumericalException) {
    const DataSet data = smallData();
    Residualizer res(data);
    EXPECT_THROW(res.residuals(data.getVariable("Y"), {data.getVariable("X"), data.getVariable("W")}),
                 Skewcycle::NumericalException);
}

TEST(ResidualizerTest, MoreRegressorsThanRowsThrows) {
    DataSet data({"A", "B", "C"}, {{1, -1, -2}, {0.5, 2, 1}, {-1, 0.3, 2}});
    Residualizer res(data);
    const Variable& a = data.getVariable("A");
    // Only row 0 has A > 0.
    EXPECT_THROW(res.residuals(data.getVariable("C"), {a, data.getVariable("B")}, RowFilter::positive(a)),
                 Skewcycle::NumericalException);
}

TEST(ResidualizerTest, EmptySelectionGivesEmptyResiduals) {
    DataSet data({"A", "B"}, {{-1, -2, -3}, {1, 2, 3}});
    Residualizer res(data);
    const Variable& a = data.getVariable("A");
    EXPECT_TRUE(res.residuals(data.getVariable("B"), {a}, RowFilter::positive(a)).empty());
}

TEST(ResidualizerTest, TruncatedRowsAreNotRecentered) {
    // On the rows with X > 0, Y is constant; a fit with an intercept would leave zeros.
    DataSet data({"X", "Y"}, {{1, 2, 3, -1, -2, -3}, {1, 1, 1, -1, -1, -1}});
    Residualizer res(data);
    const Variable& x = data.getVariable("X");
    const auto r = res.residuals(data.getVariable("Y"), {x}, RowFilter::positive(x));
    ASSERT_EQ(r.size(), 3u);
    EXPECT_NEAR(r[0], 8.0 / 14.0, 1e-12);
    EXPECT_NEAR(r[1], 2.0 / 14.0, 1e-12);
    EXPECT_NEAR(r[2], -4.0 / 14.0, 1e-12);
}
