#include "TestCore.h"

#include <vector>
#include <memory>
#include <cstdint>

#ifdef CUSTOM_PARALLEL_TEST
// Must be before any tskmeans imports.
#include "custom_parallel.h"
#endif

#include "tskmeans/tskmeans.hpp"

class FitTest : public TestCore, public ::testing::Test {
protected:
    void SetUp() {
        assemble({ 60, 10, 2 });
    }

    static void check_model(const tskmeans::Model<int, int, double>& model, int k) {
        ASSERT_EQ(model.centers().size(), k);
        ASSERT_EQ(model.labels().size(), nseries);

        std::vector<int> sizes(k);
        for (auto l : model.labels()) {
            ASSERT_TRUE(l >= 0 && l < k);
            ++sizes[l];
        }
        EXPECT_EQ(model.details().sizes, sizes);
        EXPECT_GT(model.num_iterations(), 0);
        EXPECT_EQ(model.num_iterations(), model.details().iterations);
        EXPECT_EQ(model.inertia(), model.details().inertia);
    }
};

TEST_F(FitTest, FourSeries) {
    auto series = std::vector<tskmeans::TimeSeries<double> >{
        tskmeans::TimeSeries<double>(std::vector<double>{ 0, 0, 0 }),
        tskmeans::TimeSeries<double>(std::vector<double>{ 0, 0, 1 }),
        tskmeans::TimeSeries<double>(std::vector<double>{ 5, 5, 5 }),
        tskmeans::TimeSeries<double>(std::vector<double>{ 5, 5, 6 })
    };
    tskmeans::SimpleDataset<int, double> dataset(series);

    // Searching for a seed where the first and third series are chosen as the starting points.
    tskmeans::InitializeForgy<int, int, double> forgy;
    tskmeans::DistanceEuclidean<double> dist;
    tskmeans::AverageMean<int, double> mean;
    std::uint64_t seed = 0;
    for (; seed < 1000; ++seed) {
        tskmeans::Rng rng(seed);
        std::vector<tskmeans::TimeSeries<double> > centers;
        forgy.run(dataset, 2, dist, mean, rng, centers);
        if (centers[0].values() == series[0].values() && centers[1].values() == series[2].values()) {
            break;
        }
    }
    ASSERT_LT(seed, 1000);

    tskmeans::KmeansOptions opt;
    opt.num_centers = 2;
    opt.init_method = tskmeans::InitMethod::FORGY;
    opt.distance.method = tskmeans::DistanceMethod::EUCLIDEAN;
    opt.seed = seed;
    auto model = tskmeans::fit_kmeans(dataset, opt);

    EXPECT_EQ(model.labels(), std::vector<int>({ 0, 0, 1, 1 }));
    EXPECT_EQ(model.centers()[0].values(), std::vector<double>({ 0, 0, 0.5 }));
    EXPECT_EQ(model.centers()[1].values(), std::vector<double>({ 5, 5, 5.5 }));
    EXPECT_EQ(model.num_iterations(), 2);
    EXPECT_EQ(model.details().status, 0);
    EXPECT_DOUBLE_EQ(model.inertia(), 1);
    EXPECT_EQ(model.details().sizes, std::vector<int>({ 2, 2 }));
}

TEST_F(FitTest, KmeansRecovery) {
    auto sim = create_separated_series(4, false);
    tskmeans::SimpleDataset<int, double> dataset(sim.series);

    tskmeans::KmeansOptions opt;
    opt.num_centers = 4;
    opt.distance.method = tskmeans::DistanceMethod::EUCLIDEAN;
    auto model = tskmeans::fit_kmeans(dataset, opt);
    check_model(model, 4);
    EXPECT_TRUE(same_partition(model.labels(), sim.clusters));
    EXPECT_TRUE(model.details().converged());
}

TEST_F(FitTest, KmeansInitMethods) {
    auto dataset = create_dataset();
    for (auto init : { tskmeans::InitMethod::RANDOM, tskmeans::InitMethod::FORGY, tskmeans::InitMethod::KMEANSPP }) {
        tskmeans::KmeansOptions opt;
        opt.num_centers = 5;
        opt.init_method = init;
        opt.distance.method = tskmeans::DistanceMethod::EUCLIDEAN;
        auto model = tskmeans::fit_kmeans(dataset, opt);
        check_model(model, 5);

        // Reproducible with the same seed.
        auto again = tskmeans::fit_kmeans(dataset, opt);
        EXPECT_EQ(model.labels(), again.labels());
        EXPECT_EQ(model.inertia(), again.inertia());
    }
}

TEST_F(FitTest, KmeansDba) {
    auto sim = create_separated_series(3, true);
    tskmeans::SimpleDataset<int, double> dataset(sim.series);

    tskmeans::KmeansOptions opt;
    opt.num_centers = 3;
    opt.average_method = tskmeans::AverageMethod::DBA;
    opt.average_iterations = 5;
    auto model = tskmeans::fit_kmeans(dataset, opt);
    check_model(model, 3);
    EXPECT_TRUE(same_partition(model.labels(), sim.clusters));

    // Mean averaging is not possible with different lengths.
    opt.average_method = tskmeans::AverageMethod::MEAN;
    EXPECT_THROW(tskmeans::fit_kmeans(dataset, opt), tskmeans::DimensionMismatch);

    // Neither is the Euclidean distance.
    opt.average_method = tskmeans::AverageMethod::DBA;
    opt.distance.method = tskmeans::DistanceMethod::EUCLIDEAN;
    EXPECT_THROW(tskmeans::fit_kmeans(dataset, opt), tskmeans::DimensionMismatch);
}

TEST_F(FitTest, Kmedoids) {
    auto sim = create_separated_series(3, true);
    tskmeans::SimpleDataset<int, double> dataset(sim.series);

    for (auto dist : { tskmeans::DistanceMethod::DTW, tskmeans::DistanceMethod::MSM, tskmeans::DistanceMethod::TWE }) {
        tskmeans::KmedoidsOptions opt;
        opt.num_centers = 3;
        opt.distance.method = dist;
        auto model = tskmeans::fit_kmedoids(dataset, opt);
        check_model(model, 3);
        EXPECT_TRUE(same_partition(model.labels(), sim.clusters));

        // Each center is one of the series in its cluster.
        for (int c = 0; c < 3; ++c) {
            bool found = false;
            for (int s = 0; s < nseries; ++s) {
                if (model.labels()[s] == c && sim.series[s].values() == model.centers()[c].values()) {
                    found = true;
                    break;
                }
            }
            EXPECT_TRUE(found);
        }
    }
}

TEST_F(FitTest, Restarts) {
    auto dataset = create_dataset();

    tskmeans::KmedoidsOptions opt;
    opt.num_centers = 6;
    opt.init_method = tskmeans::InitMethod::RANDOM;
    opt.seed = 100;
    opt.num_init = 4;
    auto best = tskmeans::fit_kmedoids(dataset, opt);

    // The model with the lowest inertia is kept, with ties going to the earliest restart.
    opt.num_init = 1;
    double lowest = 0;
    std::vector<int> expected;
    for (int r = 0; r < 4; ++r) {
        opt.seed = 100 + r;
        auto current = tskmeans::fit_kmedoids(dataset, opt);
        if (r == 0 || current.inertia() < lowest) {
            lowest = current.inertia();
            expected = current.labels();
        }
    }
    EXPECT_EQ(best.inertia(), lowest);
    EXPECT_EQ(best.labels(), expected);
}

TEST_F(FitTest, Parallel) {
    auto dataset = create_dataset();

    tskmeans::KmeansOptions opt;
    opt.num_centers = 5;
    opt.average_method = tskmeans::AverageMethod::DBA;
    opt.num_init = 2;
    auto model = tskmeans::fit_kmeans(dataset, opt);

    opt.num_threads = 3;
    auto pmodel = tskmeans::fit_kmeans(dataset, opt);
    EXPECT_EQ(model.labels(), pmodel.labels());
    EXPECT_EQ(model.inertia(), pmodel.inertia());
    for (int c = 0; c < 5; ++c) {
        EXPECT_EQ(model.centers()[c].values(), pmodel.centers()[c].values());
    }
}

TEST_F(FitTest, Predict) {
    auto dataset = create_dataset();

    tskmeans::KmedoidsOptions opt;
    opt.num_centers = 4;
    opt.distance.method = tskmeans::DistanceMethod::WDTW;
    auto model = tskmeans::fit_kmedoids(dataset, opt);

    // Predictions on the training data are the same as the labels.
    EXPECT_EQ(model.predict(dataset), model.labels());
    EXPECT_EQ(model.score(dataset), -model.inertia());

    auto dist = model.transform(dataset);
    ASSERT_EQ(dist.size(), nseries * 4);
    for (int s = 0; s < nseries; ++s) {
        auto start = dist.begin() + s * 4;
        EXPECT_EQ(std::min_element(start, start + 4) - start, model.labels()[s]);
        EXPECT_EQ(dist[s * 4 + 2], model.distance().compute(dataset.get_series(s), model.centers()[2].view()));
    }

    // New data can have a different length, but not a different number of channels.
    std::vector<tskmeans::TimeSeries<double> > fresh;
    fresh.emplace_back(std::vector<double>(20 * nch, 1.0), nch);
    fresh.push_back(model.centers()[1]);
    tskmeans::SimpleDataset<int, double> fresh_dataset(fresh);
    auto predicted = model.predict(fresh_dataset);
    EXPECT_EQ(predicted.size(), 2);
    EXPECT_EQ(predicted[1], 1);

    std::vector<tskmeans::TimeSeries<double> > mismatch;
    mismatch.emplace_back(std::vector<double>(10 * (nch + 1)), nch + 1);
    tskmeans::SimpleDataset<int, double> mismatch_dataset(mismatch);
    EXPECT_THROW(model.predict(mismatch_dataset), tskmeans::DimensionMismatch);
    EXPECT_THROW(model.transform(mismatch_dataset), tskmeans::DimensionMismatch);
    EXPECT_THROW(model.score(mismatch_dataset), tskmeans::DimensionMismatch);
}

TEST_F(FitTest, PredictEuclidean) {
    auto dataset = create_dataset();

    tskmeans::KmeansOptions opt;
    opt.num_centers = 3;
    opt.distance.method = tskmeans::DistanceMethod::EUCLIDEAN;
    auto model = tskmeans::fit_kmeans(dataset, opt);
    EXPECT_EQ(model.predict(dataset), model.labels());
    EXPECT_DOUBLE_EQ(model.score(dataset), -model.inertia());

    std::vector<tskmeans::TimeSeries<double> > longer;
    longer.emplace_back(std::vector<double>((len + 1) * nch), nch);
    tskmeans::SimpleDataset<int, double> longer_dataset(longer);
    EXPECT_THROW(model.predict(longer_dataset), tskmeans::DimensionMismatch);
}

TEST_F(FitTest, Errors) {
    auto dataset = create_dataset();

    {
        tskmeans::KmeansOptions opt;
        opt.num_centers = 0;
        EXPECT_THROW(tskmeans::fit_kmeans(dataset, opt), tskmeans::InvalidParameter);
        opt.num_centers = nseries + 1;
        EXPECT_THROW(tskmeans::fit_kmeans(dataset, opt), tskmeans::InsufficientData);
    }

    {
        tskmeans::KmeansOptions opt;
        opt.num_init = 0;
        EXPECT_THROW(tskmeans::fit_kmeans(dataset, opt), tskmeans::InvalidParameter);
    }

    {
        tskmeans::KmeansOptions opt;
        opt.num_threads = 0;
        EXPECT_THROW(tskmeans::fit_kmeans(dataset, opt), tskmeans::InvalidParameter);
    }

    {
        tskmeans::KmeansOptions opt;
        opt.max_iterations = 0;
        EXPECT_THROW(tskmeans::fit_kmeans(dataset, opt), tskmeans::InvalidParameter);
    }

    {
        tskmeans::KmeansOptions opt;
        opt.average_method = tskmeans::AverageMethod::MEDOID;
        EXPECT_THROW(tskmeans::fit_kmeans(dataset, opt), tskmeans::InvalidParameter);
    }

    {
        tskmeans::KmeansOptions opt;
        opt.average_method = tskmeans::AverageMethod::DBA;
        opt.average_iterations = 0;
        EXPECT_THROW(tskmeans::fit_kmeans(dataset, opt), tskmeans::InvalidParameter);
    }

    {
        tskmeans::KmedoidsOptions opt;
        opt.distance.window = 2;
        EXPECT_THROW(tskmeans::fit_kmedoids(dataset, opt), tskmeans::InvalidParameter);
    }

    {
        std::vector<tskmeans::TimeSeries<double> > none;
        tskmeans::SimpleDataset<int, double> empty(none);
        tskmeans::KmedoidsOptions opt;
        opt.num_centers = 1;
        EXPECT_THROW(tskmeans::fit_kmedoids(empty, opt), tskmeans::InsufficientData);
    }

    {
        std::vector<tskmeans::TimeSeries<double> > series;
        series.emplace_back(std::vector<double>{ 1, 2, 3 });
        series.emplace_back(std::vector<double>{});
        series.emplace_back(std::vector<double>{ 4, 5 });
        tskmeans::SimpleDataset<int, double> with_empty(series);
        tskmeans::KmedoidsOptions opt;
        opt.num_centers = 2;
        EXPECT_THROW(tskmeans::fit_kmedoids(with_empty, opt), tskmeans::InsufficientData);
    }
}

class FirstValueDistance final : public tskmeans::Distance<double> {
public:
    double compute(const tskmeans::SeriesView<double>& x, const tskmeans::SeriesView<double>& y) const {
        return std::abs(x.data[0] - y.data[0]);
    }
};

TEST_F(FitTest, Compute) {
    auto dataset = create_dataset();
    tskmeans::InitializeKmeanspp<int, int, double> init;
    tskmeans::RefineLloyd<int, int, double> refine;
    tskmeans::DistanceLcss<double> dist;
    tskmeans::AverageMedoid<int, double> medoid;

    auto res = tskmeans::compute(dataset, init, refine, dist, medoid, 3, static_cast<tskmeans::Rng::result_type>(42));
    EXPECT_EQ(res.clusters.size(), nseries);
    EXPECT_EQ(res.centers.size(), 3);
    EXPECT_EQ(res.details.sizes.size(), 3);

    // Same as the overload with a user-supplied generator.
    tskmeans::Rng rng(42);
    std::vector<tskmeans::TimeSeries<double> > centers;
    std::vector<int> clusters(nseries);
    auto details = tskmeans::compute(dataset, init, refine, dist, medoid, 3, rng, centers, clusters.data());
    EXPECT_EQ(clusters, res.clusters);
    EXPECT_EQ(details.inertia, res.details.inertia);

    // Building a model from the results.
    tskmeans::Model<int, int, double> model(res, std::make_shared<tskmeans::DistanceLcss<double> >(), 1);
    EXPECT_EQ(model.predict(dataset), res.clusters);

    // DBA requires a distance with an alignment path.
    tskmeans::AverageDba<int, double> dba;
    FirstValueDistance first;
    EXPECT_THROW(tskmeans::compute(dataset, init, refine, first, dba, 3, static_cast<tskmeans::Rng::result_type>(42)), tskmeans::InvalidParameter);
}
