#ifndef TSKMEANS_INITIALIZE_RANDOM_HPP
#define TSKMEANS_INITIALIZE_RANDOM_HPP 

#include <vector>

#include "sanisizer/sanisizer.hpp"
#include "aarand/aarand.hpp"

#include "Initialize.hpp"
#include "assign.hpp"
#include "replace_empty_clusters.hpp"

/**
 * @file InitializeRandom.hpp
 * @brief Class for random initialization.
 */

namespace tskmeans {

/**
 * @cond
 */
namespace InitializeRandom_internal {

template<typename Index_, typename Cluster_, class Engine_>
std::vector<Cluster_> random_labels(const Index_ nobs, const Cluster_ ncenters, Engine_& eng) {
    auto labels = sanisizer::create<std::vector<Cluster_> >(nobs);
    for (auto& l : labels) {
        l = aarand::discrete_uniform(eng, ncenters);
    }
    return labels;
}

}
/**
 * @endcond
 */

/**
 * @brief Initialize by assigning each series to a random cluster.
 *
 * Each series is assigned to a cluster chosen uniformly at random.
 * The initial center of each cluster is then computed from its members with the supplied `Average`.
 * If a cluster has no members, its center is set to the series that is farthest from the center of its own cluster,
 * using the same procedure as for empty clusters in `RefineLloyd`.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Cluster_, typename Float_>
class InitializeRandom final : public Initialize<Index_, Cluster_, Float_> { 
public:
    /**
     * @cond
     */
    Cluster_ run(
        const Dataset<Index_, Float_>& data,
        const Cluster_ ncenters,
        const Distance<Float_>& distance,
        const Average<Index_, Float_>& average,
        Rng& rng,
        std::vector<TimeSeries<Float_> >& centers)
    const {
        const auto nobs = data.num_series();
        internal::check_num_series(nobs, ncenters);
        const auto labels = InitializeRandom_internal::random_labels(nobs, ncenters, rng);

        auto members = sanisizer::create<std::vector<std::vector<Index_> > >(ncenters);
        for (Index_ obs = 0; obs < nobs; ++obs) {
            members[labels[obs]].push_back(obs);
        }

        centers.clear();
        sanisizer::resize(centers, ncenters);
        for (Cluster_ cen = 0; cen < ncenters; ++cen) {
            if (!members[cen].empty()) {
                average.run(data, members[cen], distance, centers[cen]);
            }
        }

        const auto sizes = internal::compute_sizes(nobs, ncenters, labels.data());
        bool has_empty = false;
        for (auto s : sizes) {
            if (s == 0) {
                has_empty = true;
                break;
            }
        }

        if (has_empty) {
            auto owndist = sanisizer::create<std::vector<Float_> >(nobs);
            for (Index_ obs = 0; obs < nobs; ++obs) {
                owndist[obs] = distance.compute(data.get_series(obs), centers[labels[obs]].view());
            }
            internal::replace_empty_clusters(data, sizes, owndist, centers);
        }

        return ncenters;
    }
    /**
     * @endcond
     */
};

}

#endif
