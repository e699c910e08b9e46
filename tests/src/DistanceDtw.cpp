#include <gtest/gtest.h>

#include <vector>

#include "tskmeans/DistanceDtw.hpp"
#include "tskmeans/DistanceWdtw.hpp"
#include "tskmeans/DistanceEuclidean.hpp"
#include "tskmeans/derivative.hpp"

TEST(DistanceDtw, Basic) {
    tskmeans::TimeSeries<double> x(std::vector<double>{ 0, 1, 2 }), y(std::vector<double>{ 0, 2 });
    tskmeans::DistanceDtw<double> dist;
    EXPECT_EQ(dist.compute(x.view(), y.view()), 1);
    EXPECT_EQ(dist.compute(y.view(), x.view()), 1);
    EXPECT_EQ(dist.compute(x.view(), x.view()), 0);
    EXPECT_EQ(dist.inertia(2), 2);
    EXPECT_FALSE(dist.requires_equal_length());

    tskmeans::AlignmentPath path;
    EXPECT_EQ(dist.align(x.view(), y.view(), path), 1);
    tskmeans::AlignmentPath expected{ { 0, 0 }, { 1, 0 }, { 2, 1 } };
    EXPECT_EQ(path, expected);

    tskmeans::DistanceDtwOptions opt;
    opt.window = 0.5;
    EXPECT_EQ(tskmeans::DistanceDtw<double>(opt).get_options().window, 0.5);
}

TEST(DistanceDtw, Warping) {
    // A time-shifted copy has a small DTW distance but a large Euclidean distance.
    tskmeans::TimeSeries<double> x(std::vector<double>{ 0, 0, 1, 2, 1, 0, 0 }), y(std::vector<double>{ 0, 1, 2, 1, 0, 0, 0 });
    tskmeans::DistanceDtw<double> dist;
    EXPECT_EQ(dist.compute(x.view(), y.view()), 0);

    tskmeans::DistanceEuclidean<double> euc;
    EXPECT_GT(euc.compute(x.view(), y.view()), 0);
}

TEST(DistanceDtw, Window) {
    tskmeans::TimeSeries<double> x(std::vector<double>{ 1, 2, 3 }), y(std::vector<double>{ 2, 2, 5 });
    tskmeans::DistanceDtwOptions opt;
    opt.window = 0;
    tskmeans::DistanceDtw<double> dist(opt);

    // Same as the squared Euclidean distance.
    EXPECT_EQ(dist.compute(x.view(), y.view()), 5);

    tskmeans::AlignmentPath path;
    dist.align(x.view(), y.view(), path);
    tskmeans::AlignmentPath expected{ { 0, 0 }, { 1, 1 }, { 2, 2 } };
    EXPECT_EQ(path, expected);

    // Band is widened to the difference in lengths.
    tskmeans::TimeSeries<double> a(std::vector<double>{ 0, 1, 2 }), b(std::vector<double>{ 0, 2 });
    EXPECT_EQ(dist.compute(a.view(), b.view()), 1);

    // Band prevents the optimal warping.
    tskmeans::TimeSeries<double> c(std::vector<double>{ 0, 0, 1, 2, 1, 0, 0 }), d(std::vector<double>{ 0, 1, 2, 1, 0, 0, 0 });
    EXPECT_GT(dist.compute(c.view(), d.view()), 0);
}

TEST(DistanceDtw, Multichannel) {
    tskmeans::TimeSeries<double> x(std::vector<double>{ 0, 0, 1, 1 }, 2), y(std::vector<double>{ 0, 0, 3, 4 }, 2);
    tskmeans::DistanceDtwOptions opt;
    opt.window = 0;
    tskmeans::DistanceDtw<double> dist(opt);
    EXPECT_EQ(dist.compute(x.view(), y.view()), 13);

    tskmeans::TimeSeries<double> z(std::vector<double>{ 0, 0, 1, 1 });
    EXPECT_THROW(dist.compute(x.view(), z.view()), tskmeans::DimensionMismatch);
}

TEST(DistanceDtw, Errors) {
    tskmeans::DistanceDtwOptions opt;
    opt.window = -0.1;
    EXPECT_THROW(tskmeans::DistanceDtw<double>{opt}, tskmeans::InvalidParameter);
    opt.window = 1.1;
    EXPECT_THROW(tskmeans::DistanceDdtw<double>{opt}, tskmeans::InvalidParameter);
}

TEST(DistanceDdtw, Basic) {
    tskmeans::TimeSeries<double> x(std::vector<double>{ 1, 2, 4, 7 }), y(std::vector<double>{ 11, 12, 14, 17 });
    tskmeans::DistanceDdtw<double> dist;

    // Derivatives are invariant to shifts.
    EXPECT_EQ(dist.compute(x.view(), y.view()), 0);

    tskmeans::TimeSeries<double> z(std::vector<double>{ 0, 3, 1, 5, 2 });
    auto dx = tskmeans::derivative(x.view()), dz = tskmeans::derivative(z.view());
    tskmeans::DistanceDtw<double> ref;
    EXPECT_EQ(dist.compute(x.view(), z.view()), ref.compute(dx.view(), dz.view()));

    // Alignment paths refer to the original time points.
    tskmeans::AlignmentPath path;
    dist.align(x.view(), z.view(), path);
    EXPECT_EQ(path.front(), tskmeans::AlignmentPath::value_type(0, 0));
    EXPECT_EQ(path.back(), tskmeans::AlignmentPath::value_type(3, 4));
}

TEST(DistanceWdtw, Weights) {
    auto weights = tskmeans::internal::logistic_weights<double>(4, 2, 0);
    EXPECT_EQ(weights, std::vector<double>(4, 0.5));

    auto weights2 = tskmeans::internal::logistic_weights<double>(4, 4, 1);
    EXPECT_EQ(weights2.size(), 4);
    EXPECT_LT(weights2[0], weights2[1]);
    EXPECT_LT(weights2[1], weights2[3]);
    EXPECT_EQ(weights2[2], 0.5);
}

TEST(DistanceWdtw, Basic) {
    tskmeans::TimeSeries<double> x(std::vector<double>{ 0, 1, 2 }), y(std::vector<double>{ 0, 2 });

    // A zero 'g' gives a constant weight of 0.5.
    tskmeans::DistanceWdtwOptions opt;
    opt.g = 0;
    tskmeans::DistanceWdtw<double> dist(opt);
    EXPECT_EQ(dist.compute(x.view(), y.view()), 0.5);
    EXPECT_EQ(dist.compute(x.view(), x.view()), 0);

    tskmeans::DistanceWdtw<double> def;
    EXPECT_EQ(def.get_options().g, 0.05);
    EXPECT_GT(def.compute(x.view(), y.view()), 0);
    EXPECT_EQ(def.compute(x.view(), y.view()), def.compute(y.view(), x.view()));

    opt.g = -1;
    EXPECT_THROW(tskmeans::DistanceWdtw<double>{opt}, tskmeans::InvalidParameter);
}

TEST(DistanceWddtw, Basic) {
    tskmeans::TimeSeries<double> x(std::vector<double>{ 1, 2, 4, 7 }), z(std::vector<double>{ 0, 3, 1, 5, 2 });
    tskmeans::DistanceWdtwOptions opt;
    opt.g = 0;
    tskmeans::DistanceWddtw<double> dist(opt);
    tskmeans::DistanceDdtw<double> ref;
    EXPECT_DOUBLE_EQ(dist.compute(x.view(), z.view()), 0.5 * ref.compute(x.view(), z.view()));

    tskmeans::TimeSeries<double> y(std::vector<double>{ 11, 12, 14, 17 });
    EXPECT_EQ(dist.compute(x.view(), y.view()), 0);
}
