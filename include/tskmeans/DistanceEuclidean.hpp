#ifndef TSKMEANS_DISTANCE_EUCLIDEAN_HPP
#define TSKMEANS_DISTANCE_EUCLIDEAN_HPP

#include <cmath>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "Distance.hpp"
#include "TimeSeries.hpp"

/**
 * @file DistanceEuclidean.hpp
 * @brief Euclidean distance between series.
 */

namespace tskmeans {

/**
 * @brief Euclidean distance between equal-length series.
 *
 * This is the square root of the sum of squared differences across all time points and channels.
 * The alignment path is always the diagonal, so this can also be used with DBA, in which case DBA reduces to the arithmetic mean.
 * For the inertia, the squared distance is used so that Lloyd iterations with the mean never increase the inertia.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Float_>
class DistanceEuclidean final : public Distance<Float_> {
public:
    /**
     * @cond
     */
    Float_ compute(const SeriesView<Float_>& x, const SeriesView<Float_>& y) const {
        internal::check_channels(x, y);
        internal::check_lengths(x, y);
        const auto total = sanisizer::product_unsafe<std::size_t>(x.length, x.num_channels);
        Float_ output = 0;
        for (std::size_t i = 0; i < total; ++i) {
            const Float_ delta = x.data[i] - y.data[i];
            output += delta * delta;
        }
        return std::sqrt(output);
    }

    bool has_alignment() const {
        return true;
    }

    Float_ align(const SeriesView<Float_>& x, const SeriesView<Float_>& y, AlignmentPath& path) const {
        const auto output = compute(x, y);
        path.clear();
        path.reserve(x.length);
        for (std::size_t t = 0; t < x.length; ++t) {
            path.emplace_back(t, t);
        }
        return output;
    }

    bool requires_equal_length() const {
        return true;
    }

    Float_ inertia(const Float_ distance) const {
        return distance * distance;
    }
    /**
     * @endcond
     */
};

}

#endif
