#ifndef TSKMEANS_TSKMEANS_HPP
#define TSKMEANS_TSKMEANS_HPP

#include <vector>
#include <memory>
#include <string>
#include <utility>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "TimeSeries.hpp"
#include "Dataset.hpp"
#include "SimpleDataset.hpp"
#include "Details.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include "Distance.hpp"
#include "DistanceEuclidean.hpp"
#include "DistanceDtw.hpp"
#include "DistanceWdtw.hpp"
#include "DistanceLcss.hpp"
#include "DistanceErp.hpp"
#include "DistanceMsm.hpp"
#include "DistanceTwe.hpp"
#include "derivative.hpp"

#include "Initialize.hpp"
#include "InitializeRandom.hpp"
#include "InitializeForgy.hpp"
#include "InitializeKmeanspp.hpp"
#include "InitializeNone.hpp"

#include "Average.hpp"
#include "AverageMean.hpp"
#include "AverageDba.hpp"
#include "AverageMedoid.hpp"

#include "Refine.hpp"
#include "RefineLloyd.hpp"
#include "assign.hpp"

#include "Options.hpp"
#include "create.hpp"

/** 
 * @file tskmeans.hpp
 * @brief Perform k-means and k-medoids clustering of time series.
 */

/**
 * @namespace tskmeans
 * @brief Perform k-means and k-medoids clustering of time series.
 */
namespace tskmeans {

/**
 * @cond
 */
namespace internal {

template<typename Index_, typename Float_>
void validate_series(const Dataset<Index_, Float_>& data, const std::size_t num_channels, const bool equal_length, const std::size_t expected_length) {
    const auto nobs = data.num_series();
    for (Index_ obs = 0; obs < nobs; ++obs) {
        const auto current = data.get_series(obs);
        if (current.length == 0) {
            throw InsufficientData("series " + std::to_string(obs) + " contains no observations");
        }
        if (current.num_channels != num_channels) {
            throw DimensionMismatch("series " + std::to_string(obs) + " has " + std::to_string(current.num_channels) + " channels, expected " + std::to_string(num_channels));
        }
        if (equal_length && current.length != expected_length) {
            throw DimensionMismatch("series " + std::to_string(obs) + " has length " + std::to_string(current.length) + ", expected " + std::to_string(expected_length));
        }
    }
}

template<typename Index_, typename Cluster_, typename Float_>
void validate(const Dataset<Index_, Float_>& data, const Cluster_ num_centers, const Distance<Float_>& distance, const Average<Index_, Float_>& average) {
    if (num_centers <= 0) {
        throw InvalidParameter("number of clusters should be positive");
    }

    const auto nobs = data.num_series();
    if (nobs == 0) {
        throw InsufficientData("dataset contains no series");
    }
    check_num_series(nobs, num_centers);

    const bool equal_length = distance.requires_equal_length() || average.requires_equal_length();
    validate_series(data, data.num_channels(), equal_length, data.get_series(0).length);
    average.validate(distance);
}

}
/**
 * @endcond
 */

/**
 * Run the full clustering procedure, i.e., initialization followed by refinement.
 * All inputs are validated before initialization.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @param data Dataset of time series. 
 * @param initialize Initialization method to use.
 * @param refine Refinement method to use.
 * @param distance Distance between series.
 * @param average Method for computing the cluster centers.
 * @param num_centers Number of cluster centers.
 * @param rng Pseudo-random number generator, used by `initialize`.
 * @param[out] centers On output, the final cluster centers.
 * @param[out] clusters Pointer to an array of length equal to the number of series (from `data.num_series()`).
 * On output, this will contain the 0-based cluster assignment for each series, where each entry is less than `num_centers`.
 *
 * @return Details of the clustering, including the size of each cluster and the status of the algorithm.
 */
template<typename Index_, typename Cluster_, typename Float_>
Details<Index_, Float_> compute(
    const Dataset<Index_, Float_>& data, 
    const Initialize<Index_, Cluster_, Float_>& initialize, 
    const Refine<Index_, Cluster_, Float_>& refine,
    const Distance<Float_>& distance,
    const Average<Index_, Float_>& average,
    const Cluster_ num_centers,
    Rng& rng,
    std::vector<TimeSeries<Float_> >& centers,
    Cluster_* const clusters)
{
    internal::validate(data, num_centers, distance, average);
    initialize.run(data, num_centers, distance, average, rng, centers);
    return refine.run(data, distance, average, centers, clusters);
}

/**
 * @brief Results of the clustering.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Cluster_, typename Float_>
struct Results {
    /**
     * A vector of length equal to the number of series, containing the 0-indexed cluster assignment for each series.
     * Each entry is less than the number of clusters.
     */
    std::vector<Cluster_> clusters;

    /**
     * A vector of length equal to the number of clusters, containing the center of each cluster.
     */
    std::vector<TimeSeries<Float_> > centers;

    /**
     * Further details from running the clustering.
     */
    Details<Index_, Float_> details;
};

/**
 * Overload of `compute()` that allocates and returns the cluster centers and assignments.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @param data Dataset of time series. 
 * @param initialize Initialization method to use.
 * @param refine Refinement method to use.
 * @param distance Distance between series.
 * @param average Method for computing the cluster centers.
 * @param num_centers Number of cluster centers.
 * @param seed Seed for the pseudo-random number generator.
 *
 * @return Results of the clustering, including the centers and cluster assignments.
 */
template<typename Index_, typename Cluster_, typename Float_>
Results<Index_, Cluster_, Float_> compute(
    const Dataset<Index_, Float_>& data, 
    const Initialize<Index_, Cluster_, Float_>& initialize, 
    const Refine<Index_, Cluster_, Float_>& refine,
    const Distance<Float_>& distance,
    const Average<Index_, Float_>& average,
    const Cluster_ num_centers,
    const typename Rng::result_type seed)
{
    Results<Index_, Cluster_, Float_> output;
    sanisizer::resize(output.clusters, data.num_series());
    Rng rng(seed);
    output.details = compute(data, initialize, refine, distance, average, num_centers, rng, output.centers, output.clusters.data());
    return output;
}

/**
 * @brief Fitted clustering model.
 *
 * This holds the cluster centers and the distance used for fitting, and can assign new series to the closest center.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Cluster_, typename Float_>
class Model {
public:
    /**
     * @param results Results of the clustering.
     * @param distance Distance used for the clustering.
     * @param num_threads Number of threads to use in `predict()`, `transform()` and `score()`.
     */
    Model(Results<Index_, Cluster_, Float_> results, std::shared_ptr<const Distance<Float_> > distance, const int num_threads) :
        my_results(std::move(results)), my_distance(std::move(distance)), my_num_threads(num_threads) {}

private:
    Results<Index_, Cluster_, Float_> my_results;
    std::shared_ptr<const Distance<Float_> > my_distance;
    int my_num_threads;

public:
    /**
     * @return Cluster centers.
     */
    const std::vector<TimeSeries<Float_> >& centers() const {
        return my_results.centers;
    }

    /**
     * @return Cluster assignment for each series in the training dataset.
     */
    const std::vector<Cluster_>& labels() const {
        return my_results.clusters;
    }

    /**
     * @return Details of the clustering.
     */
    const Details<Index_, Float_>& details() const {
        return my_results.details;
    }

    /**
     * @return Inertia of the training dataset.
     */
    Float_ inertia() const {
        return my_results.details.inertia;
    }

    /**
     * @return Number of iterations used for fitting.
     */
    int num_iterations() const {
        return my_results.details.iterations;
    }

    /**
     * @return Distance used for fitting.
     */
    const Distance<Float_>& distance() const {
        return *my_distance;
    }

private:
    void check(const Dataset<Index_, Float_>& data) const {
        const auto& first = my_results.centers.front();
        internal::validate_series(data, first.num_channels(), my_distance->requires_equal_length(), first.length());
    }

public:
    /**
     * @param data Dataset of time series, with the same number of channels as the training dataset.
     * @return Index of the closest center for each series, with ties broken in favor of the lower index.
     */
    std::vector<Cluster_> predict(const Dataset<Index_, Float_>& data) const {
        check(data);
        const auto nobs = data.num_series();
        auto output = sanisizer::create<std::vector<Cluster_> >(nobs);
        auto mindist = sanisizer::create<std::vector<Float_> >(nobs);
        internal::assign(data, *my_distance, my_results.centers, output.data(), mindist.data(), my_num_threads);
        return output;
    }

    /**
     * @param data Dataset of time series, with the same number of channels as the training dataset.
     * @return Row-major matrix of distances, where each row corresponds to a series and each column corresponds to a cluster center.
     */
    std::vector<Float_> transform(const Dataset<Index_, Float_>& data) const {
        check(data);
        return internal::compute_distances(data, *my_distance, my_results.centers, my_num_threads);
    }

    /**
     * @param data Dataset of time series, with the same number of channels as the training dataset.
     * @return Negative inertia of `data` after assigning each series to its closest center.
     */
    Float_ score(const Dataset<Index_, Float_>& data) const {
        check(data);
        const auto nobs = data.num_series();
        auto assigned = sanisizer::create<std::vector<Cluster_> >(nobs);
        auto mindist = sanisizer::create<std::vector<Float_> >(nobs);
        return -internal::assign(data, *my_distance, my_results.centers, assigned.data(), mindist.data(), my_num_threads);
    }
};

/**
 * @cond
 */
namespace internal {

inline void check_fit_options(const int num_centers, const int num_init, const int num_threads) {
    if (num_centers <= 0) {
        throw InvalidParameter("number of clusters should be positive");
    }
    if (num_init <= 0) {
        throw InvalidParameter("number of restarts should be positive");
    }
    if (num_threads <= 0) {
        throw InvalidParameter("number of threads should be positive");
    }
}

template<typename Index_, typename Cluster_, typename Float_>
Model<Index_, Cluster_, Float_> fit_with_restarts(
    const Dataset<Index_, Float_>& data,
    const Initialize<Index_, Cluster_, Float_>& initialize,
    const Refine<Index_, Cluster_, Float_>& refine,
    std::shared_ptr<const Distance<Float_> > distance,
    const Average<Index_, Float_>& average,
    const Cluster_ num_centers,
    const int num_init,
    const typename Rng::result_type seed,
    const int num_threads,
    const bool verbose)
{
    const auto level = progress_level(verbose);
    Results<Index_, Cluster_, Float_> best;
    for (int r = 0; r < num_init; ++r) {
        auto current = compute(data, initialize, refine, *distance, average, num_centers, seed + static_cast<typename Rng::result_type>(r));
        logger()->log(level, "restart {}: inertia {} after {} iterations", r + 1, current.details.inertia, current.details.iterations);
        if (r == 0 || current.details.inertia < best.details.inertia) {
            best = std::move(current);
        }
    }
    return Model<Index_, Cluster_, Float_>(std::move(best), std::move(distance), num_threads);
}

inline RefineLloydOptions lloyd_options(const int max_iterations, const double tolerance, const int num_threads, const bool verbose) {
    RefineLloydOptions ropt;
    ropt.max_iterations = max_iterations;
    ropt.tolerance = tolerance;
    ropt.num_threads = num_threads;
    ropt.verbose = verbose;
    return ropt;
}

}
/**
 * @endcond
 */

/**
 * Perform k-means clustering of time series, where each center is the mean or DBA barycenter of its cluster.
 *
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @param data Dataset of time series.
 * @param options Further options.
 *
 * @return The fitted model from the restart with the lowest inertia.
 */
template<typename Cluster_ = int, typename Index_, typename Float_>
Model<Index_, Cluster_, Float_> fit_kmeans(const Dataset<Index_, Float_>& data, const KmeansOptions& options) {
    internal::check_fit_options(options.num_centers, options.num_init, options.num_threads);
    if (options.average_method == AverageMethod::MEDOID) {
        throw InvalidParameter("k-means clustering requires mean or DBA averaging, use fit_kmedoids() for medoids");
    }

    auto distance = create_distance<Float_>(options.distance);
    auto initialize = create_initialize<Index_, Cluster_, Float_>(options.init_method, options.num_threads);
    auto average = create_average<Index_, Float_>(options.average_method, options.average_iterations, 1); // clusters are already processed in parallel by RefineLloyd.
    RefineLloyd<Index_, Cluster_, Float_> refine(internal::lloyd_options(options.max_iterations, options.tolerance, options.num_threads, options.verbose));

    return internal::fit_with_restarts(
        data,
        *initialize,
        refine,
        std::move(distance),
        *average,
        static_cast<Cluster_>(options.num_centers),
        options.num_init,
        options.seed,
        options.num_threads,
        options.verbose
    );
}

/**
 * Perform k-medoids clustering of time series, where each center is the medoid of its cluster.
 * This is more robust to outliers than `fit_kmeans()` and works with series of different lengths for any distance other than `DistanceMethod::EUCLIDEAN`.
 *
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @param data Dataset of time series.
 * @param options Further options.
 *
 * @return The fitted model from the restart with the lowest inertia.
 */
template<typename Cluster_ = int, typename Index_, typename Float_>
Model<Index_, Cluster_, Float_> fit_kmedoids(const Dataset<Index_, Float_>& data, const KmedoidsOptions& options) {
    internal::check_fit_options(options.num_centers, options.num_init, options.num_threads);

    auto distance = create_distance<Float_>(options.distance);
    auto initialize = create_initialize<Index_, Cluster_, Float_>(options.init_method, options.num_threads);
    auto average = create_average<Index_, Float_>(AverageMethod::MEDOID, 1, 1);
    RefineLloyd<Index_, Cluster_, Float_> refine(internal::lloyd_options(options.max_iterations, options.tolerance, options.num_threads, options.verbose));

    return internal::fit_with_restarts(
        data,
        *initialize,
        refine,
        std::move(distance),
        *average,
        static_cast<Cluster_>(options.num_centers),
        options.num_init,
        options.seed,
        options.num_threads,
        options.verbose
    );
}

}

#endif
