#ifndef TSKMEANS_DISTANCE_LCSS_HPP
#define TSKMEANS_DISTANCE_LCSS_HPP

#include <cstddef>
#include <utility>
#include <algorithm>

#include "Distance.hpp"
#include "TimeSeries.hpp"
#include "alignment.hpp"

/**
 * @file DistanceLcss.hpp
 * @brief Longest common subsequence distance.
 */

namespace tskmeans {

/**
 * @brief Options for `DistanceLcss`.
 */
struct DistanceLcssOptions {
    /**
     * Width of the Sakoe-Chiba band, see `DistanceDtwOptions::window`.
     * Time points outside of the band are never considered to match.
     */
    double window = 1;

    /**
     * Matching threshold.
     * Two time points are considered to match if the Euclidean distance between their values is no greater than `epsilon`.
     * This should be non-negative.
     */
    double epsilon = 1;
};

/**
 * @brief Longest common subsequence (LCSS) distance.
 *
 * The similarity between two series is defined as the length `L` of the longest common subsequence of matching time points.
 * The distance is then `1 - L / min(n, m)` where `n` and `m` are the lengths of the two series, such that it always lies in `[0, 1]`.
 * The alignment path reports every cell visited while tracing back the longest common subsequence, not just the matching time points.
 * This path stays inside the warping window, preferring diagonal steps between matches.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Vlachos, M., Kollios, G. and Gunopulos, D. (2002).
 * Discovering similar multidimensional trajectories.
 * _Proceedings of the 18th International Conference on Data Engineering_, 673-684.
 */
template<typename Float_>
class DistanceLcss final : public AlignedDistance<Float_> {
public:
    /**
     * @param options Further options.
     */
    DistanceLcss(DistanceLcssOptions options) : my_options(std::move(options)) {
        internal::check_window(my_options.window);
        internal::check_non_negative(my_options.epsilon, "epsilon");
    }

    /**
     * Default constructor.
     */
    DistanceLcss() = default;

private:
    DistanceLcssOptions my_options;

public:
    /**
     * @return Options for the LCSS distance.
     */
    const DistanceLcssOptions& get_options() const {
        return my_options;
    }

protected:
    /**
     * @cond
     */
    Float_ fill(const SeriesView<Float_>& x, const SeriesView<Float_>& y, internal::AlignmentMatrix<Float_>& matrix) const {
        const auto n = x.length, m = y.length;
        const Float_ unreachable = -internal::infinity<Float_>();
        matrix.reset(n, m, unreachable);
        for (std::size_t i = 0; i <= n; ++i) {
            matrix.cost(i, 0) = 0;
        }
        for (std::size_t j = 0; j <= m; ++j) {
            matrix.cost(0, j) = 0;
        }

        // Only cells inside the band are filled, the others stay unreachable.
        // Unmatched diagonal steps are allowed so that every cell in the band
        // has a predecessor in the band.
        const auto nchannels = x.num_channels;
        const auto radius = internal::band_radius(my_options.window, n, m);
        const Float_ threshold = my_options.epsilon * my_options.epsilon;

        for (std::size_t i = 1; i <= n; ++i) {
            const std::size_t jstart = (i > radius ? std::max<std::size_t>(1, i - radius) : 1);
            const std::size_t jend = std::min(m, i + radius);
            for (std::size_t j = jstart; j <= jend; ++j) {
                const bool match = internal::squared_euclidean(x.at(i - 1), y.at(j - 1), nchannels) <= threshold;
                const auto best = internal::pick_maximum<Float_>(
                    matrix.cost(i - 1, j - 1) + (match ? 1 : 0),
                    matrix.cost(i - 1, j),
                    matrix.cost(i, j - 1)
                );
                matrix.cost(i, j) = best.first;
                matrix.step(i, j) = best.second;
            }
        }

        const auto shortest = std::min(n, m);
        if (shortest == 0) {
            return 0;
        }
        return 1 - matrix.cost(n, m) / static_cast<Float_>(shortest);
    }
    /**
     * @endcond
     */
};

}

#endif
