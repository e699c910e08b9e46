#ifndef TSKMEANS_DISTANCE_MSM_HPP
#define TSKMEANS_DISTANCE_MSM_HPP

#include <cstddef>
#include <cmath>
#include <utility>
#include <algorithm>

#include "Distance.hpp"
#include "TimeSeries.hpp"
#include "alignment.hpp"

/**
 * @file DistanceMsm.hpp
 * @brief Move-split-merge distance.
 */

namespace tskmeans {

/**
 * @brief Options for `DistanceMsm`.
 */
struct DistanceMsmOptions {
    /**
     * Width of the Sakoe-Chiba band, see `DistanceDtwOptions::window`.
     */
    double window = 1;

    /**
     * Cost of a split or merge operation.
     * This should be non-negative.
     */
    double c = 1;
};

/**
 * @cond
 */
namespace internal {

/*
 * Cost of splitting or merging 'x' when it is flanked by 'y' and 'z'. This is
 * just 'c' if 'x' lies between 'y' and 'z', otherwise we add the distance to
 * the closer of the two. For multiple channels, "between" is defined by the
 * ball around the midpoint of 'y' and 'z'.
 */
template<typename Float_>
Float_ msm_split_merge(const Float_* const x, const Float_* const y, const Float_* const z, const std::size_t num_channels, const Float_ c) {
    Float_ to_mid = 0, span = 0;
    for (std::size_t k = 0; k < num_channels; ++k) {
        const Float_ mid = (y[k] + z[k]) / 2;
        const Float_ delta = mid - x[k];
        to_mid += delta * delta;
        const Float_ width = y[k] - z[k];
        span += width * width;
    }

    if (std::sqrt(to_mid) <= std::sqrt(span) / 2) {
        return c;
    } else {
        return c + std::min(euclidean(x, y, num_channels), euclidean(x, z, num_channels));
    }
}

}
/**
 * @endcond
 */

/**
 * @brief Move-split-merge (MSM) distance.
 *
 * Series are transformed into each other by moving a value (with cost equal to the Euclidean distance of the move),
 * splitting one value into two, or merging two consecutive equal values into one.
 * The cost of a split or merge is `c` if the value lies between its neighbors, plus the distance to the closer neighbor otherwise.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Stefan, A., Athitsos, V. and Das, G. (2013).
 * The move-split-merge metric for time series.
 * _IEEE Transactions on Knowledge and Data Engineering_ 25, 1425-1438.
 */
template<typename Float_>
class DistanceMsm final : public AlignedDistance<Float_> {
public:
    /**
     * @param options Further options.
     */
    DistanceMsm(DistanceMsmOptions options) : my_options(std::move(options)) {
        internal::check_window(my_options.window);
        internal::check_non_negative(my_options.c, "c");
    }

    /**
     * Default constructor.
     */
    DistanceMsm() = default;

private:
    DistanceMsmOptions my_options;

public:
    /**
     * @return Options for the MSM distance.
     */
    const DistanceMsmOptions& get_options() const {
        return my_options;
    }

protected:
    /**
     * @cond
     */
    Float_ fill(const SeriesView<Float_>& x, const SeriesView<Float_>& y, internal::AlignmentMatrix<Float_>& matrix) const {
        const auto n = x.length, m = y.length;
        matrix.reset(n, m, internal::infinity<Float_>());
        matrix.cost(0, 0) = 0;

        const auto nchannels = x.num_channels;
        const Float_ c = my_options.c;
        const auto radius = internal::band_radius(my_options.window, n, m);

        return internal::fill_minimum(matrix, n, m, radius, [&](const std::size_t i, const std::size_t j) -> internal::Transitions<Float_> {
            const auto xi = x.at(i - 1), yj = y.at(j - 1);
            return internal::Transitions<Float_>{
                internal::euclidean(xi, yj, nchannels),
                (i > 1 ? internal::msm_split_merge(xi, x.at(i - 2), yj, nchannels, c) : internal::infinity<Float_>()),
                (j > 1 ? internal::msm_split_merge(yj, y.at(j - 2), xi, nchannels, c) : internal::infinity<Float_>())
            };
        });
    }
    /**
     * @endcond
     */
};

}

#endif
