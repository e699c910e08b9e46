#ifndef TSKMEANS_REPLACE_EMPTY_CLUSTERS_HPP
#define TSKMEANS_REPLACE_EMPTY_CLUSTERS_HPP

#include <vector>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "Dataset.hpp"
#include "TimeSeries.hpp"
#include "logging.hpp"

/**
 * @file replace_empty_clusters.hpp
 * @brief Refill the centers of empty clusters.
 */

namespace tskmeans {

/**
 * @cond
 */
namespace internal {

/*
 * Each empty cluster (in increasing order of cluster index) takes the series
 * that is farthest from its assigned center, as specified in 'mindist'. Ties
 * are broken in favor of the lower series index, and each series is used at
 * most once. Returns the number of replaced centers.
 */
template<typename Index_, typename Float_>
std::size_t replace_empty_clusters(
    const Dataset<Index_, Float_>& data,
    const std::vector<Index_>& sizes,
    const std::vector<Float_>& mindist,
    std::vector<TimeSeries<Float_> >& centers)
{
    const auto nobs = data.num_series();
    const auto ncenters = centers.size();
    std::vector<unsigned char> used;
    std::size_t replaced = 0;

    for (std::size_t cen = 0; cen < ncenters; ++cen) {
        if (sizes[cen]) {
            continue;
        }
        if (used.empty()) {
            sanisizer::resize(used, nobs);
        }

        bool found = false;
        Index_ chosen = 0;
        for (Index_ obs = 0; obs < nobs; ++obs) {
            if (used[obs]) {
                continue;
            }
            if (!found || mindist[obs] > mindist[chosen]) {
                chosen = obs;
                found = true;
            }
        }

        // Can't happen if there are at least as many series as clusters, but we check just in case.
        if (!found) {
            break;
        }

        used[chosen] = 1;
        centers[cen].assign(data.get_series(chosen));
        ++replaced;
        logger()->debug("cluster {} is empty, replacing its center with series {}", cen, chosen);
    }

    return replaced;
}

}
/**
 * @endcond
 */

}

#endif
