#ifndef TSKMEANS_DISTANCE_TWE_HPP
#define TSKMEANS_DISTANCE_TWE_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "sanisizer/sanisizer.hpp"

#include "Distance.hpp"
#include "TimeSeries.hpp"
#include "alignment.hpp"

/**
 * @file DistanceTwe.hpp
 * @brief Time warp edit distance.
 */

namespace tskmeans {

/**
 * @brief Options for `DistanceTwe`.
 */
struct DistanceTweOptions {
    /**
     * Width of the Sakoe-Chiba band, see `DistanceDtwOptions::window`.
     */
    double window = 1;

    /**
     * Stiffness, i.e., the penalty for each unit of time difference between aligned points.
     * This should be non-negative.
     */
    double nu = 0.001;

    /**
     * Constant penalty for a deletion in either series.
     * This should be non-negative.
     */
    double lambda = 1;
};

/**
 * @brief Time warp edit distance (TWE).
 *
 * Each series is implicitly prefixed with a zero-valued time point.
 * A match between time points `i` and `j` costs the Euclidean distances between the values at `(i, j)` and at `(i-1, j-1)`,
 * plus `2 * nu * |i - j|`.
 * A deletion of time point `i` costs the Euclidean distance between its value and that of its predecessor, plus `nu + lambda`.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Marteau, P.-F. (2009).
 * Time warp edit distance with stiffness adjustment for time series matching.
 * _IEEE Transactions on Pattern Analysis and Machine Intelligence_ 31, 306-318.
 */
template<typename Float_>
class DistanceTwe final : public AlignedDistance<Float_> {
public:
    /**
     * @param options Further options.
     */
    DistanceTwe(DistanceTweOptions options) : my_options(std::move(options)) {
        internal::check_window(my_options.window);
        internal::check_non_negative(my_options.nu, "nu");
        internal::check_non_negative(my_options.lambda, "lambda");
    }

    /**
     * Default constructor.
     */
    DistanceTwe() = default;

private:
    DistanceTweOptions my_options;

public:
    /**
     * @return Options for the TWE distance.
     */
    const DistanceTweOptions& get_options() const {
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
        const auto zero = sanisizer::create<std::vector<Float_> >(nchannels);
        auto previous_x = [&](const std::size_t i) -> const Float_* { // 'i' is 1-based, as in the table.
            return (i > 1 ? x.at(i - 2) : zero.data());
        };
        auto previous_y = [&](const std::size_t j) -> const Float_* {
            return (j > 1 ? y.at(j - 2) : zero.data());
        };

        const Float_ nu = my_options.nu;
        const Float_ deletion = my_options.nu + my_options.lambda;
        const auto radius = internal::band_radius(my_options.window, n, m);

        return internal::fill_minimum(matrix, n, m, radius, [&](const std::size_t i, const std::size_t j) -> internal::Transitions<Float_> {
            const auto xi = x.at(i - 1), yj = y.at(j - 1);
            const auto xprev = previous_x(i), yprev = previous_y(j);
            const Float_ gap = static_cast<Float_>(i > j ? i - j : j - i);
            return internal::Transitions<Float_>{
                internal::euclidean(xi, yj, nchannels) + internal::euclidean(xprev, yprev, nchannels) + 2 * nu * gap,
                internal::euclidean(xprev, xi, nchannels) + deletion,
                internal::euclidean(yprev, yj, nchannels) + deletion
            };
        });
    }
    /**
     * @endcond
     */
};

}

#endif
