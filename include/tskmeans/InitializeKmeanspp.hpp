#ifndef TSKMEANS_INITIALIZE_KMEANSPP_HPP
#define TSKMEANS_INITIALIZE_KMEANSPP_HPP

#include <vector>
#include <algorithm>
#include <utility>

#include "sanisizer/sanisizer.hpp"
#include "aarand/aarand.hpp"

#include "Initialize.hpp"
#include "parallelize.hpp"
#include "utils.hpp"

/**
 * @file InitializeKmeanspp.hpp
 * @brief Class for k-means++ initialization.
 */

namespace tskmeans {

/**
 * @brief Options for `InitializeKmeanspp`.
 */
struct InitializeKmeansppOptions {
    /** 
     * Number of threads to use.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;
};

/**
 * @cond
 */
namespace InitializeKmeanspp_internal {

template<typename Float_, typename Index_, class Engine_>
Index_ weighted_sample(const std::vector<Float_>& cumulative, const std::vector<Float_>& mindist, const Index_ nobs, Engine_& eng) {
    const auto total = cumulative.back();
    Index_ chosen_id = 0;

    do {
        const Float_ sampled_weight = total * aarand::standard_uniform<Float_>(eng);
        chosen_id = std::lower_bound(cumulative.begin(), cumulative.end(), sampled_weight) - cumulative.begin();

        // Looping to avoid choosing a series with zero weight. This can happen
        // with a 'sampled_weight' of zero when there are zeros at the start of
        // 'cumulative', or from limited precision in the comparisons.
    } while (chosen_id == nobs || mindist[chosen_id] == 0);

    return chosen_id;
}

template<typename Index_, typename Float_, typename Cluster_, class Engine_>
std::vector<Index_> run_kmeanspp(const Dataset<Index_, Float_>& data, const Cluster_ ncenters, const Distance<Float_>& distance, Engine_& eng, const int nthreads) {
    const auto nobs = data.num_series();
    auto mindist = sanisizer::create<std::vector<Float_> >(nobs, 1);

    auto cumulative = sanisizer::create<std::vector<Float_> >(nobs);
    sanisizer::can_ptrdiff<I<decltype(cumulative.begin())> >(nobs); // check that we can compute a ptrdiff for weighted_sample().

    std::vector<Index_> sofar;
    sofar.reserve(ncenters);

    for (Cluster_ cen = 0; cen < ncenters; ++cen) {
        if (!sofar.empty()) {
            const auto last = data.get_series(sofar.back());
            parallelize(nthreads, nobs, [&](const int, const Index_ start, const Index_ length) -> void {
                for (Index_ obs = start, end = start + length; obs < end; ++obs) {
                    if (mindist[obs] == 0) {
                        continue;
                    }
                    const Float_ d = distance.compute(data.get_series(obs), last);
                    const Float_ r2 = d * d;
                    if (cen == 1 || r2 < mindist[obs]) {
                        mindist[obs] = r2;
                    }
                }
            });
        }

        cumulative[0] = mindist[0];
        for (Index_ i = 1; i < nobs; ++i) {
            cumulative[i] = cumulative[i-1] + mindist[i];
        }

        const auto total = cumulative.back();
        if (total == 0) { // a.k.a. only duplicates left.
            break;
        }

        const auto chosen_id = weighted_sample(cumulative, mindist, nobs, eng);
        mindist[chosen_id] = 0;
        sofar.push_back(chosen_id);
    }

    // Filling the remaining centers with random choices from the unused series.
    const Index_ nchosen = sofar.size();
    const Index_ ntotal = ncenters;
    if (ntotal > nchosen) {
        auto unused = sanisizer::create<std::vector<unsigned char> >(nobs, 1);
        for (auto s : sofar) {
            unused[s] = 0;
        }
        std::vector<Index_> candidates;
        candidates.reserve(nobs - nchosen);
        for (Index_ obs = 0; obs < nobs; ++obs) {
            if (unused[obs]) {
                candidates.push_back(obs);
            }
        }

        const Index_ nremaining = ntotal - nchosen;
        auto extra = sanisizer::create<std::vector<Index_> >(nremaining);
        aarand::sample(static_cast<Index_>(candidates.size()), nremaining, extra.begin(), eng);
        for (auto e : extra) {
            sofar.push_back(candidates[e]);
        }
    }

    return sofar;
}

}
/**
 * @endcond
 */

/**
 * @brief **k-means++** initialization of Arthur and Vassilvitskii (2007).
 *
 * Selection of starting points is performed via iterations of weighted sampling, 
 * where the sampling probability for each series is proportional to the squared distance to the closest starting point that was chosen in any of the previous iterations.
 * The aim is to obtain well-separated starting points to encourage the formation of suitable clusters.
 * Any distance can be used here, not just the Euclidean distance.
 *
 * If only duplicates of the already-chosen series remain (i.e., all remaining weights are zero),
 * the remaining starting points are sampled uniformly from the series that have not yet been chosen.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Arthur, D. and Vassilvitskii, S. (2007).
 * k-means++: the advantages of careful seeding.
 * _Proceedings of the eighteenth annual ACM-SIAM symposium on Discrete algorithms_, 1027-1035.
 */
template<typename Index_, typename Cluster_, typename Float_>
class InitializeKmeanspp final : public Initialize<Index_, Cluster_, Float_> {
private:
    InitializeKmeansppOptions my_options;

public:
    /**
     * @param options Options for k-means++ initialization.
     */
    InitializeKmeanspp(InitializeKmeansppOptions options) : my_options(std::move(options)) {}

    /**
     * Default constructor.
     */
    InitializeKmeanspp() = default;

public:
    /**
     * @return Options for k-means++ initialization.
     */
    const InitializeKmeansppOptions& get_options() const {
        return my_options;
    }

public:
    /**
     * @cond
     */
    Cluster_ run(
        const Dataset<Index_, Float_>& data,
        const Cluster_ ncenters,
        const Distance<Float_>& distance,
        const Average<Index_, Float_>&,
        Rng& rng,
        std::vector<TimeSeries<Float_> >& centers)
    const {
        internal::check_num_series(data.num_series(), ncenters);
        const auto sofar = InitializeKmeanspp_internal::run_kmeanspp(data, ncenters, distance, rng, my_options.num_threads);
        internal::copy_into_centers(data, sofar, centers);
        return sofar.size();
    }
    /**
     * @endcond
     */
};

}

#endif
