#ifndef TSKMEANS_INITIALIZE_HPP
#define TSKMEANS_INITIALIZE_HPP

#include <vector>
#include <random>
#include <string>

#include "sanisizer/sanisizer.hpp"

#include "Dataset.hpp"
#include "Distance.hpp"
#include "Average.hpp"
#include "TimeSeries.hpp"
#include "errors.hpp"

/**
 * @file Initialize.hpp
 * @brief Interface for initialization of the cluster centers.
 */

namespace tskmeans {

/**
 * Type of the pseudo-random number generator used for initialization.
 */
typedef std::mt19937_64 Rng;

/**
 * @brief Interface for initialization algorithms.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Cluster_, typename Float_>
class Initialize {
public:
    /**
     * @cond
     */
    Initialize() = default;
    Initialize(Initialize&&) = default;
    Initialize(const Initialize&) = default;
    Initialize& operator=(Initialize&&) = default;
    Initialize& operator=(const Initialize&) = default;
    virtual ~Initialize() = default;
    /**
     * @endcond
     */

    /**
     * @param data Dataset of time series.
     * This should contain at least `num_centers` series.
     * @param num_centers Number of cluster centers.
     * @param distance Distance between series.
     * @param average Method for computing centers from cluster members.
     * @param rng Pseudo-random number generator.
     * @param[out] centers On output, a vector of length `num_centers` containing the initial cluster centers.
     *
     * @return The number of filled centers, which should be equal to `num_centers`.
     */
    virtual Cluster_ run(
        const Dataset<Index_, Float_>& data,
        Cluster_ num_centers,
        const Distance<Float_>& distance,
        const Average<Index_, Float_>& average,
        Rng& rng,
        std::vector<TimeSeries<Float_> >& centers
    ) const = 0;
};

/**
 * @cond
 */
namespace internal {

template<typename Index_, typename Cluster_>
void check_num_series(const Index_ nobs, const Cluster_ ncenters) {
    if (!sanisizer::is_greater_than_or_equal(nobs, ncenters)) {
        throw InsufficientData("number of series (" + std::to_string(nobs) + ") is less than the number of clusters (" + std::to_string(ncenters) + ")");
    }
}

template<typename Index_, typename Float_>
void copy_into_centers(const Dataset<Index_, Float_>& data, const std::vector<Index_>& chosen, std::vector<TimeSeries<Float_> >& centers) {
    sanisizer::resize(centers, chosen.size());
    for (decltype(chosen.size()) i = 0, end = chosen.size(); i < end; ++i) {
        centers[i].assign(data.get_series(chosen[i]));
    }
}

}
/**
 * @endcond
 */

}

#endif
