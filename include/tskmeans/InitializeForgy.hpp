#ifndef TSKMEANS_INITIALIZE_FORGY_HPP
#define TSKMEANS_INITIALIZE_FORGY_HPP

#include <vector>

#include "sanisizer/sanisizer.hpp"
#include "aarand/aarand.hpp"

#include "Initialize.hpp"

/**
 * @file InitializeForgy.hpp
 * @brief Class for Forgy initialization.
 */

namespace tskmeans {

/**
 * @brief Initialize by sampling random series without replacement.
 *
 * Each of the chosen series is used directly as an initial center.
 * Centers are ordered by the index of the series in the dataset.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Cluster_, typename Float_>
class InitializeForgy final : public Initialize<Index_, Cluster_, Float_> {
public:
    /**
     * @cond
     */
    Cluster_ run(
        const Dataset<Index_, Float_>& data,
        const Cluster_ ncenters,
        const Distance<Float_>&,
        const Average<Index_, Float_>&,
        Rng& rng,
        std::vector<TimeSeries<Float_> >& centers)
    const {
        const auto nobs = data.num_series();
        internal::check_num_series(nobs, ncenters);

        auto chosen = sanisizer::create<std::vector<Index_> >(ncenters);
        aarand::sample(nobs, static_cast<Index_>(ncenters), chosen.begin(), rng);
        internal::copy_into_centers(data, chosen, centers);
        return ncenters;
    }
    /**
     * @endcond
     */
};

}

#endif
