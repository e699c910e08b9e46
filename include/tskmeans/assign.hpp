#ifndef TSKMEANS_ASSIGN_HPP
#define TSKMEANS_ASSIGN_HPP

#include <vector>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "Dataset.hpp"
#include "Distance.hpp"
#include "TimeSeries.hpp"
#include "parallelize.hpp"

/**
 * @file assign.hpp
 * @brief Assign series to their closest centers.
 */

namespace tskmeans {

/**
 * @cond
 */
namespace internal {

/*
 * Assigns each series to its closest center, breaking ties in favor of the
 * lower cluster index. The distance to the closest center is stored in
 * 'mindist', and the total inertia is returned.
 */
template<typename Index_, typename Cluster_, typename Float_>
Float_ assign(
    const Dataset<Index_, Float_>& data,
    const Distance<Float_>& distance,
    const std::vector<TimeSeries<Float_> >& centers,
    Cluster_* const clusters,
    Float_* const mindist,
    const int num_threads)
{
    const auto nobs = data.num_series();
    const Cluster_ ncenters = sanisizer::cast<Cluster_>(centers.size());

    parallelize(num_threads, nobs, [&](const int, const Index_ start, const Index_ length) -> void {
        for (Index_ obs = start, end = start + length; obs < end; ++obs) {
            const auto current = data.get_series(obs);
            Cluster_ best = 0;
            Float_ best_dist = distance.compute(current, centers[0].view());
            for (Cluster_ cen = 1; cen < ncenters; ++cen) {
                const auto candidate = distance.compute(current, centers[cen].view());
                if (candidate < best_dist) {
                    best = cen;
                    best_dist = candidate;
                }
            }
            clusters[obs] = best;
            mindist[obs] = best_dist;
        }
    });

    Float_ inertia = 0;
    for (Index_ obs = 0; obs < nobs; ++obs) {
        inertia += distance.inertia(mindist[obs]);
    }
    return inertia;
}

template<typename Index_, typename Cluster_>
std::vector<Index_> compute_sizes(const Index_ nobs, const Cluster_ ncenters, const Cluster_* const clusters) {
    auto sizes = sanisizer::create<std::vector<Index_> >(ncenters);
    for (Index_ obs = 0; obs < nobs; ++obs) {
        ++sizes[clusters[obs]];
    }
    return sizes;
}

/*
 * Distances from every series to every center, as a row-major matrix where
 * rows are series and columns are centers.
 */
template<typename Index_, typename Float_>
std::vector<Float_> compute_distances(
    const Dataset<Index_, Float_>& data,
    const Distance<Float_>& distance,
    const std::vector<TimeSeries<Float_> >& centers,
    const int num_threads)
{
    const auto nobs = data.num_series();
    const auto ncenters = centers.size();
    auto output = sanisizer::create<std::vector<Float_> >(sanisizer::product<typename std::vector<Float_>::size_type>(nobs, ncenters));

    parallelize(num_threads, nobs, [&](const int, const Index_ start, const Index_ length) -> void {
        for (Index_ obs = start, end = start + length; obs < end; ++obs) {
            const auto current = data.get_series(obs);
            for (std::size_t cen = 0; cen < ncenters; ++cen) {
                output[sanisizer::nd_offset<std::size_t>(cen, ncenters, obs)] = distance.compute(current, centers[cen].view());
            }
        }
    });

    return output;
}

}
/**
 * @endcond
 */

}

#endif
