#ifndef TSKMEANS_REFINE_HPP
#define TSKMEANS_REFINE_HPP

#include <vector>

#include "Details.hpp"
#include "Dataset.hpp"
#include "Distance.hpp"
#include "Average.hpp"
#include "TimeSeries.hpp"

/**
 * @file Refine.hpp
 * @brief Interface for refinement of the clustering.
 */

namespace tskmeans {

/**
 * @brief Interface for refinement algorithms.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Cluster_, typename Float_>
class Refine {
public:
    /**
     * @cond
     */
    Refine() = default;
    Refine(Refine&&) = default;
    Refine(const Refine&) = default;
    Refine& operator=(Refine&&) = default;
    Refine& operator=(const Refine&) = default;
    virtual ~Refine() = default;
    /**
     * @endcond
     */

    /**
     * @param data Dataset of time series.
     * @param distance Distance between series.
     * @param average Method for computing centers from cluster members.
     * @param[in, out] centers On input, the initial cluster centers.
     * On output, the final cluster centers.
     * The number of clusters is defined by the length of this vector.
     * @param[out] clusters Pointer to an array of length equal to the number of series (from `data.num_series()`).
     * On output, this will contain the 0-based cluster assignment for each series.
     *
     * @return `centers` and `clusters` are filled, and an object is returned containing clustering statistics.
     */
    virtual Details<Index_, Float_> run(
        const Dataset<Index_, Float_>& data,
        const Distance<Float_>& distance,
        const Average<Index_, Float_>& average,
        std::vector<TimeSeries<Float_> >& centers,
        Cluster_* clusters
    ) const = 0;
};

}

#endif
