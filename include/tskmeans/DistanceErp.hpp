#ifndef TSKMEANS_DISTANCE_ERP_HPP
#define TSKMEANS_DISTANCE_ERP_HPP

#include <cstddef>
#include <cmath>
#include <utility>
#include <vector>

#include "sanisizer/sanisizer.hpp"

#include "Distance.hpp"
#include "TimeSeries.hpp"
#include "alignment.hpp"

/**
 * @file DistanceErp.hpp
 * @brief Edit distance with real penalty.
 */

namespace tskmeans {

/**
 * @brief Options for `DistanceErp`.
 */
struct DistanceErpOptions {
    /**
     * Width of the Sakoe-Chiba band, see `DistanceDtwOptions::window`.
     */
    double window = 1;

    /**
     * Reference value for gaps.
     * Skipping a time point costs the Euclidean distance between its values and a vector filled with `g`.
     * This should be finite.
     */
    double g = 0;
};

/**
 * @brief Edit distance with real penalty (ERP).
 *
 * Aligning two time points costs the Euclidean distance between their values,
 * while skipping a time point in either series costs the Euclidean distance from its values to the gap value `g`.
 * Unlike DTW, this is a metric.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Chen, L. and Ng, R. (2004).
 * On the marriage of Lp-norms and edit distance.
 * _Proceedings of the 30th International Conference on Very Large Data Bases_, 792-803.
 */
template<typename Float_>
class DistanceErp final : public AlignedDistance<Float_> {
public:
    /**
     * @param options Further options.
     */
    DistanceErp(DistanceErpOptions options) : my_options(std::move(options)) {
        internal::check_window(my_options.window);
        if (!std::isfinite(my_options.g)) {
            throw InvalidParameter("g should be finite");
        }
    }

    /**
     * Default constructor.
     */
    DistanceErp() = default;

private:
    DistanceErpOptions my_options;

public:
    /**
     * @return Options for the ERP distance.
     */
    const DistanceErpOptions& get_options() const {
        return my_options;
    }

protected:
    /**
     * @cond
     */
    Float_ fill(const SeriesView<Float_>& x, const SeriesView<Float_>& y, internal::AlignmentMatrix<Float_>& matrix) const {
        const auto n = x.length, m = y.length;
        const auto nchannels = x.num_channels;
        const auto gap = sanisizer::create<std::vector<Float_> >(nchannels, my_options.g);

        // Gap costs for each time point are reused throughout the table.
        auto xgap = sanisizer::create<std::vector<Float_> >(n);
        for (std::size_t i = 0; i < n; ++i) {
            xgap[i] = internal::euclidean(x.at(i), gap.data(), nchannels);
        }
        auto ygap = sanisizer::create<std::vector<Float_> >(m);
        for (std::size_t j = 0; j < m; ++j) {
            ygap[j] = internal::euclidean(y.at(j), gap.data(), nchannels);
        }

        matrix.reset(n, m, internal::infinity<Float_>());
        matrix.cost(0, 0) = 0;
        for (std::size_t i = 1; i <= n; ++i) {
            matrix.cost(i, 0) = matrix.cost(i - 1, 0) + xgap[i - 1];
            matrix.step(i, 0) = internal::Step::UP;
        }
        for (std::size_t j = 1; j <= m; ++j) {
            matrix.cost(0, j) = matrix.cost(0, j - 1) + ygap[j - 1];
            matrix.step(0, j) = internal::Step::LEFT;
        }

        const auto radius = internal::band_radius(my_options.window, n, m);
        return internal::fill_minimum(matrix, n, m, radius, [&](const std::size_t i, const std::size_t j) -> internal::Transitions<Float_> {
            return internal::Transitions<Float_>{
                internal::euclidean(x.at(i - 1), y.at(j - 1), nchannels),
                xgap[i - 1],
                ygap[j - 1]
            };
        });
    }
    /**
     * @endcond
     */
};

}

#endif
