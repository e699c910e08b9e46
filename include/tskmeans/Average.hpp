#ifndef TSKMEANS_AVERAGE_HPP
#define TSKMEANS_AVERAGE_HPP

#include <vector>

#include "Dataset.hpp"
#include "Distance.hpp"
#include "TimeSeries.hpp"

/**
 * @file Average.hpp
 * @brief Interface for computing cluster centers.
 */

namespace tskmeans {

/**
 * @brief Interface for methods that compute a cluster center from its members.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Float_>
class Average {
public:
    /**
     * @cond
     */
    Average() = default;
    Average(Average&&) = default;
    Average(const Average&) = default;
    Average& operator=(Average&&) = default;
    Average& operator=(const Average&) = default;
    virtual ~Average() = default;
    /**
     * @endcond
     */

    /**
     * @param data Dataset of time series.
     * @param members Indices of the series in this cluster, sorted in increasing order.
     * This should not be empty.
     * @param distance Distance between series.
     * @param[in, out] center On input, the current center of the cluster.
     * This may be empty if no center has been computed yet.
     * On output, the new center of the cluster.
     */
    virtual void run(const Dataset<Index_, Float_>& data, const std::vector<Index_>& members, const Distance<Float_>& distance, TimeSeries<Float_>& center) const = 0;

    /**
     * @return Whether all series must have the same length.
     */
    virtual bool requires_equal_length() const {
        return false;
    }

    /**
     * Check that this method can be used with `distance`.
     * An `InvalidParameter` exception should be thrown if this is not the case.
     *
     * @param distance Distance between series.
     */
    virtual void validate(const Distance<Float_>& distance) const {
        (void)distance;
    }
};

}

#endif
