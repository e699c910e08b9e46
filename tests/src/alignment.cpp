#include <gtest/gtest.h>

#include <vector>
#include <limits>

#include "tskmeans/alignment.hpp"
#include "tskmeans/DistanceDtw.hpp"

TEST(Alignment, BandRadius) {
    EXPECT_EQ(tskmeans::internal::band_radius(1, 3, 2), 3);
    EXPECT_EQ(tskmeans::internal::band_radius(0, 5, 5), 0);
    EXPECT_EQ(tskmeans::internal::band_radius(0.5, 4, 4), 2);
    EXPECT_EQ(tskmeans::internal::band_radius(0.3, 10, 10), 3);

    // Never less than the difference in lengths.
    EXPECT_EQ(tskmeans::internal::band_radius(0, 5, 3), 2);
    EXPECT_EQ(tskmeans::internal::band_radius(0.1, 2, 10), 8);

    EXPECT_TRUE(tskmeans::internal::in_band(3, 5, 2));
    EXPECT_FALSE(tskmeans::internal::in_band(6, 3, 2));
}

TEST(Alignment, TieBreaking) {
    auto diag = tskmeans::internal::pick_minimum<double>(1, 1, 1);
    EXPECT_EQ(diag.first, 1);
    EXPECT_TRUE(diag.second == tskmeans::internal::Step::DIAGONAL);

    auto up = tskmeans::internal::pick_minimum<double>(2, 1, 1);
    EXPECT_TRUE(up.second == tskmeans::internal::Step::UP);

    auto left = tskmeans::internal::pick_minimum<double>(2, 2, 1);
    EXPECT_TRUE(left.second == tskmeans::internal::Step::LEFT);

    const double ninf = -std::numeric_limits<double>::infinity();
    auto maxed = tskmeans::internal::pick_maximum<double>(ninf, 3, 3);
    EXPECT_EQ(maxed.first, 3);
    EXPECT_TRUE(maxed.second == tskmeans::internal::Step::UP);

    auto maxed2 = tskmeans::internal::pick_maximum<double>(3, 3, 3);
    EXPECT_TRUE(maxed2.second == tskmeans::internal::Step::DIAGONAL);
}

TEST(Alignment, Validation) {
    EXPECT_NO_THROW(tskmeans::internal::check_window(0));
    EXPECT_NO_THROW(tskmeans::internal::check_window(1));
    EXPECT_THROW(tskmeans::internal::check_window(-0.1), tskmeans::InvalidParameter);
    EXPECT_THROW(tskmeans::internal::check_window(1.5), tskmeans::InvalidParameter);
    EXPECT_THROW(tskmeans::internal::check_window(std::numeric_limits<double>::quiet_NaN()), tskmeans::InvalidParameter);

    EXPECT_NO_THROW(tskmeans::internal::check_non_negative(0.0, "foo"));
    EXPECT_THROW(tskmeans::internal::check_non_negative(-1.0, "foo"), tskmeans::InvalidParameter);
    EXPECT_THROW(tskmeans::internal::check_non_negative(std::numeric_limits<double>::infinity(), "foo"), tskmeans::InvalidParameter);
}

TEST(Alignment, Backtrack) {
    // Manually filling a DTW table for x = [0, 1, 2] and y = [0, 2].
    tskmeans::TimeSeries<double> x(std::vector<double>{ 0, 1, 2 }), y(std::vector<double>{ 0, 2 });
    tskmeans::internal::AlignmentMatrix<double> matrix;
    auto cost = tskmeans::internal::fill_dtw(x.view(), y.view(), 1, matrix);
    EXPECT_EQ(cost, 1);

    EXPECT_EQ(matrix.cost(1, 1), 0);
    EXPECT_EQ(matrix.cost(1, 2), 4);
    EXPECT_EQ(matrix.cost(2, 1), 1);
    EXPECT_EQ(matrix.cost(2, 2), 1);
    EXPECT_EQ(matrix.cost(3, 1), 5);
    EXPECT_EQ(matrix.cost(3, 2), 1);
    EXPECT_TRUE(matrix.step(1, 2) == tskmeans::internal::Step::LEFT);
    EXPECT_TRUE(matrix.step(2, 1) == tskmeans::internal::Step::UP);

    // The diagonal is preferred over the equal-cost step from (2, 2).
    EXPECT_TRUE(matrix.step(3, 2) == tskmeans::internal::Step::DIAGONAL);

    tskmeans::AlignmentPath path;
    matrix.backtrack(path);
    tskmeans::AlignmentPath expected{ { 0, 0 }, { 1, 0 }, { 2, 1 } };
    EXPECT_EQ(path, expected);
}

TEST(Alignment, Banded) {
    // Cells outside of the band are never filled.
    tskmeans::TimeSeries<double> x(std::vector<double>{ 1, 2, 3, 4 }), y(std::vector<double>{ 4, 3, 2, 1 });
    tskmeans::internal::AlignmentMatrix<double> matrix;
    auto cost = tskmeans::internal::fill_dtw(x.view(), y.view(), 0.25, matrix);
    EXPECT_EQ(matrix.cost(4, 1), std::numeric_limits<double>::infinity());
    EXPECT_EQ(matrix.cost(1, 4), std::numeric_limits<double>::infinity());
    EXPECT_EQ(matrix.cost(3, 1), std::numeric_limits<double>::infinity());
    EXPECT_LT(matrix.cost(2, 1), std::numeric_limits<double>::infinity());

    tskmeans::internal::AlignmentMatrix<double> full;
    auto fullcost = tskmeans::internal::fill_dtw(x.view(), y.view(), 1, full);
    EXPECT_LE(fullcost, cost);
}
