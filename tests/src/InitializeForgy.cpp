#include "TestCore.h"

#include <vector>

#ifdef CUSTOM_PARALLEL_TEST
// Must be before any tskmeans imports.
#include "custom_parallel.h"
#endif

#include "tskmeans/InitializeForgy.hpp"
#include "tskmeans/DistanceEuclidean.hpp"
#include "tskmeans/AverageMean.hpp"

class InitializeForgyTest : public TestCore, public ::testing::TestWithParam<std::tuple<std::tuple<int, int, int>, int> > {
protected:
    void SetUp() {
        assemble(std::get<0>(GetParam()));
    }
};

TEST_P(InitializeForgyTest, Basic) {
    auto ncenters = std::get<1>(GetParam());
    auto dataset = create_dataset();
    tskmeans::DistanceEuclidean<double> dist;
    tskmeans::AverageMean<int, double> mean;
    tskmeans::InitializeForgy<int, int, double> init;

    tskmeans::Rng rng(ncenters * 10 + nseries);
    std::vector<tskmeans::TimeSeries<double> > centers;
    EXPECT_EQ(init.run(dataset, ncenters, dist, mean, rng, centers), ncenters);
    ASSERT_EQ(centers.size(), ncenters);

    // Each center is a distinct series, in order of their indices.
    int last = -1;
    for (const auto& cen : centers) {
        int found = -1;
        for (int s = 0; s < nseries; ++s) {
            tskmeans::TimeSeries<double> current(dataset.get_series(s));
            if (current.values() == cen.values()) {
                found = s;
                break;
            }
        }
        EXPECT_GT(found, last);
        last = found;
    }

    // Same results with the same seed.
    tskmeans::Rng rng2(ncenters * 10 + nseries);
    std::vector<tskmeans::TimeSeries<double> > centers2;
    init.run(dataset, ncenters, dist, mean, rng2, centers2);
    for (int c = 0; c < ncenters; ++c) {
        EXPECT_EQ(centers[c].values(), centers2[c].values());
    }
}

INSTANTIATE_TEST_SUITE_P(
    InitializeForgy,
    InitializeForgyTest,
    ::testing::Combine(
        ::testing::Values(
            std::make_tuple(20, 5, 1),
            std::make_tuple(50, 10, 3)
        ),
        ::testing::Values(1, 5, 10) // number of clusters 
    )
);

TEST(InitializeForgy, All) {
    std::vector<tskmeans::TimeSeries<double> > series;
    for (int i = 0; i < 5; ++i) {
        series.emplace_back(std::vector<double>{ static_cast<double>(i), static_cast<double>(i) });
    }
    tskmeans::SimpleDataset<int, double> dataset(series);
    tskmeans::DistanceEuclidean<double> dist;
    tskmeans::AverageMean<int, double> mean;
    tskmeans::InitializeForgy<int, int, double> init;

    tskmeans::Rng rng(42);
    std::vector<tskmeans::TimeSeries<double> > centers;
    init.run(dataset, 5, dist, mean, rng, centers);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(centers[i].values(), series[i].values());
    }

    EXPECT_THROW(init.run(dataset, 6, dist, mean, rng, centers), tskmeans::InsufficientData);
}
