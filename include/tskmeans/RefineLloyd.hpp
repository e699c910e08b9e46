#ifndef TSKMEANS_REFINE_LLOYD_HPP
#define TSKMEANS_REFINE_LLOYD_HPP

#include <vector>
#include <algorithm>
#include <cmath>
#include <utility>

#include "sanisizer/sanisizer.hpp"

#include "Refine.hpp"
#include "Details.hpp"
#include "assign.hpp"
#include "replace_empty_clusters.hpp"
#include "parallelize.hpp"
#include "logging.hpp"
#include "errors.hpp"
#include "utils.hpp"

/**
 * @file RefineLloyd.hpp
 * @brief Implements the Lloyd algorithm for time series clustering.
 */

namespace tskmeans {

/**
 * @brief Options for `RefineLloyd`.
 */
struct RefineLloydOptions {
    /**
     * Maximum number of iterations.
     * More iterations increase the opportunity for convergence at the cost of more computational time.
     * This should be positive.
     */
    int max_iterations = 300;

    /**
     * Convergence threshold on the movement of the centers.
     * If the largest distance between any center and its previous value is less than this threshold, the algorithm is considered to have converged.
     * This should be non-negative.
     */
    double tolerance = 1e-6;

    /**
     * Number of threads to use.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;

    /**
     * Whether to report progress at each iteration at the info level, rather than at the debug level.
     * If true, failure to converge is also reported as a warning.
     */
    bool verbose = false;
};

/**
 * @brief Implements the Lloyd algorithm for time series clustering.
 *
 * Each iteration assigns every series to its closest center, and once all series are assigned, recomputes the center of each cluster with the supplied `Average`.
 * This is repeated until there are no reassignments, the centers move by less than `RefineLloydOptions::tolerance`, or the maximum number of iterations is reached.
 * In the last two cases, a final assignment is performed so that the reported clusters and inertia are consistent with the returned centers.
 *
 * If a cluster becomes empty, its center is replaced by the series that is farthest from the updated center of its own cluster.
 * Ties are broken in favor of the lower series index, and each series is only used to replace one empty cluster per iteration.
 * The same policy is applied after the final assignment, followed by another assignment, until no cluster is empty or every cluster has been given a chance to be refilled.
 *
 * In the `Details::status` returned by `run()`, the status code is either 0 (success) or 2 (maximum iterations reached without convergence).
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Lloyd, S. P. (1982).  
 * Least squares quantization in PCM.
 * _IEEE Transactions on Information Theory_ 28, 128-137.
 */
template<typename Index_, typename Cluster_, typename Float_>
class RefineLloyd final : public Refine<Index_, Cluster_, Float_> {
private:
    RefineLloydOptions my_options;

public:
    /**
     * @param options Further options to the Lloyd algorithm.
     */
    RefineLloyd(RefineLloydOptions options) : my_options(std::move(options)) {
        if (my_options.max_iterations <= 0) {
            throw InvalidParameter("maximum number of iterations should be positive");
        }
        if (!(my_options.tolerance >= 0)) {
            throw InvalidParameter("tolerance should be non-negative");
        }
        if (my_options.num_threads <= 0) {
            throw InvalidParameter("number of threads should be positive");
        }
    }

    /**
     * Default constructor. 
     */
    RefineLloyd() = default;

public:
    /**
     * @return Options for Lloyd clustering.
     */
    const RefineLloydOptions& get_options() const {
        return my_options;
    }

public:
    /**
     * @cond
     */
    Details<Index_, Float_> run(
        const Dataset<Index_, Float_>& data,
        const Distance<Float_>& distance,
        const Average<Index_, Float_>& average,
        std::vector<TimeSeries<Float_> >& centers,
        Cluster_* const clusters)
    const {
        const auto nobs = data.num_series();
        const Cluster_ ncenters = sanisizer::cast<Cluster_>(centers.size());
        const auto level = internal::progress_level(my_options.verbose);
        auto log = logger();

        auto copy = sanisizer::create<std::vector<Cluster_> >(nobs);
        auto mindist = sanisizer::create<std::vector<Float_> >(nobs);
        auto owndist = sanisizer::create<std::vector<Float_> >(nobs);
        auto members = sanisizer::create<std::vector<std::vector<Index_> > >(ncenters);
        std::vector<Index_> sizes;
        std::vector<TimeSeries<Float_> > previous;
        Float_ inertia = 0;

        bool needs_reassignment = true;
        I<decltype(my_options.max_iterations)> iter = 0;
        for (; iter < my_options.max_iterations; ++iter) {
            inertia = internal::assign(data, distance, centers, copy.data(), mindist.data(), my_options.num_threads);

            // Checking if it already converged.
            if (iter > 0) {
                Index_ changed = 0;
                for (Index_ obs = 0; obs < nobs; ++obs) {
                    if (copy[obs] != clusters[obs]) {
                        ++changed;
                    }
                }
                log->log(level, "iteration {}: inertia {}, {} labels changed", iter + 1, inertia, changed);
                if (changed == 0) {
                    needs_reassignment = false;
                    break;
                }
            } else {
                log->log(level, "iteration {}: inertia {}", iter + 1, inertia);
            }
            std::copy(copy.begin(), copy.end(), clusters);

            sizes = internal::compute_sizes(nobs, ncenters, clusters);
            for (auto& m : members) {
                m.clear();
            }
            for (Index_ obs = 0; obs < nobs; ++obs) {
                members[clusters[obs]].push_back(obs);
            }

            previous = centers;
            parallelize(my_options.num_threads, ncenters, [&](const int, const Cluster_ start, const Cluster_ length) -> void {
                for (Cluster_ cen = start, end = start + length; cen < end; ++cen) {
                    if (!members[cen].empty()) {
                        average.run(data, members[cen], distance, centers[cen]);
                    }
                }
            });

            // Empty clusters are refilled based on the distance of each series to its updated center.
            if (std::find(sizes.begin(), sizes.end(), 0) != sizes.end()) {
                parallelize(my_options.num_threads, nobs, [&](const int, const Index_ start, const Index_ length) -> void {
                    for (Index_ obs = start, end = start + length; obs < end; ++obs) {
                        owndist[obs] = distance.compute(data.get_series(obs), centers[clusters[obs]].view());
                    }
                });
                internal::replace_empty_clusters(data, sizes, owndist, centers);
            }

            Float_ shift = 0;
            for (Cluster_ cen = 0; cen < ncenters; ++cen) {
                shift = std::max(shift, distance.compute(centers[cen].view(), previous[cen].view()));
            }
            if (shift < my_options.tolerance) {
                log->log(level, "iteration {}: largest center shift {} is below the tolerance", iter + 1, shift);
                break;
            }
        }

        if (needs_reassignment) {
            inertia = internal::assign(data, distance, centers, clusters, mindist.data(), my_options.num_threads);
        }
        sizes = internal::compute_sizes(nobs, ncenters, clusters);

        // The final assignment can still leave clusters empty, in which case we refill and reassign.
        for (Cluster_ attempt = 0; attempt < ncenters; ++attempt) {
            if (internal::replace_empty_clusters(data, sizes, mindist, centers) == 0) {
                break;
            }
            inertia = internal::assign(data, distance, centers, clusters, mindist.data(), my_options.num_threads);
            sizes = internal::compute_sizes(nobs, ncenters, clusters);
        }

        int status = 0;
        if (iter == my_options.max_iterations) {
            status = 2;
            if (my_options.verbose) {
                log->warn("failed to converge within {} iterations", my_options.max_iterations);
            }
        } else {
            ++iter; // make it 1-based.
        }
        return Details<Index_, Float_>(std::move(sizes), iter, status, inertia);
    }
    /**
     * @endcond
     */
};

}

#endif
