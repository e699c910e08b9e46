#ifndef TSKMEANS_DETAILS_HPP
#define TSKMEANS_DETAILS_HPP

#include <vector>
#include <utility>

/**
 * @file Details.hpp
 *
 * @brief Report detailed clustering statistics.
 */

namespace tskmeans {

/**
 * @brief Additional statistics from the clustering.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the distances.
 */
template<typename Index_, typename Float_>
struct Details {
    /**
     * @cond
     */
    Details() = default;

    Details(std::vector<Index_> sizes, const int iterations, const int status, const Float_ inertia) :
        sizes(std::move(sizes)), iterations(iterations), status(status), inertia(inertia) {}
    /**
     * @endcond
     */

    /**
     * The number of series in each cluster.
     */
    std::vector<Index_> sizes;

    /**
     * The number of iterations that were performed.
     * This can be interpreted as the number of iterations to convergence if `Details::status == 0`.
     */
    int iterations = 0;

    /**
     * The status of the algorithm on completion.
     * A value of 0 indicates that the algorithm converged,
     * while a value of 2 indicates that the maximum number of iterations was reached without convergence.
     */
    int status = 0;

    /**
     * Sum of the distances from each series to its assigned center.
     * For Euclidean distances, the squared distances are summed instead.
     */
    Float_ inertia = 0;

    /**
     * @return Whether the algorithm converged.
     */
    bool converged() const {
        return status == 0;
    }
};

}

#endif
