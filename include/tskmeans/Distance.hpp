#ifndef TSKMEANS_DISTANCE_HPP
#define TSKMEANS_DISTANCE_HPP

#include <vector>
#include <utility>
#include <cstddef>

#include "TimeSeries.hpp"
#include "errors.hpp"

/**
 * @file Distance.hpp
 * @brief Interface for distances between time series.
 */

namespace tskmeans {

/**
 * Alignment path between two series `x` and `y`.
 * Each entry is a pair of 0-based indices `(i, j)` specifying that `x[i]` corresponds to `y[j]`.
 * Entries are ordered from the start of both series.
 */
typedef std::vector<std::pair<std::size_t, std::size_t> > AlignmentPath;

/**
 * @brief Interface for distances between time series.
 *
 * Implementations should be stateless after construction, such that `compute()` and `align()` can be called concurrently from multiple threads.
 * All parameters should be validated in the constructor.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Float_>
class Distance {
public:
    /**
     * @cond
     */
    Distance() = default;
    Distance(Distance&&) = default;
    Distance(const Distance&) = default;
    Distance& operator=(Distance&&) = default;
    Distance& operator=(const Distance&) = default;
    virtual ~Distance() = default;
    /**
     * @endcond
     */

    /**
     * @param x First series.
     * @param y Second series, with the same number of channels as `x`.
     * @return Non-negative distance between `x` and `y`.
     */
    virtual Float_ compute(const SeriesView<Float_>& x, const SeriesView<Float_>& y) const = 0;

    /**
     * @return Whether `align()` is supported.
     */
    virtual bool has_alignment() const {
        return false;
    }

    /**
     * @param x First series.
     * @param y Second series, with the same number of channels as `x`.
     * @param[out] path On output, the alignment path on the minimum-cost route between `x` and `y`.
     * @return Distance between `x` and `y`, identical to that from `compute()`.
     */
    virtual Float_ align(const SeriesView<Float_>&, const SeriesView<Float_>&, AlignmentPath&) const {
        throw InvalidParameter("distance does not report alignment paths");
    }

    /**
     * @return Whether this distance is only defined for series of the same length.
     */
    virtual bool requires_equal_length() const {
        return false;
    }

    /**
     * @param distance Distance from a series to its cluster center, as returned by `compute()`.
     * @return Contribution of this series to the inertia.
     * By default, this is the distance itself.
     */
    virtual Float_ inertia(const Float_ distance) const {
        return distance;
    }
};

}

#endif
