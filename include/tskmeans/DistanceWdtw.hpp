#ifndef TSKMEANS_DISTANCE_WDTW_HPP
#define TSKMEANS_DISTANCE_WDTW_HPP

#include <vector>
#include <cmath>
#include <cstddef>
#include <utility>
#include <algorithm>

#include "Distance.hpp"
#include "TimeSeries.hpp"
#include "alignment.hpp"
#include "derivative.hpp"
#include "DistanceDtw.hpp"

/**
 * @file DistanceWdtw.hpp
 * @brief Weighted dynamic time warping distances.
 */

namespace tskmeans {

/**
 * @brief Options for `DistanceWdtw` and `DistanceWddtw`.
 */
struct DistanceWdtwOptions {
    /**
     * Width of the Sakoe-Chiba band, see `DistanceDtwOptions::window`.
     */
    double window = 1;

    /**
     * Steepness of the logistic weight function.
     * Larger values penalize alignments between distant time points more heavily.
     * This should be non-negative.
     */
    double g = 0.05;
};

/**
 * @cond
 */
namespace internal {

template<typename Float_>
std::vector<Float_> logistic_weights(const std::size_t n, const std::size_t m, const double g) {
    const auto longest = std::max(n, m);
    std::vector<Float_> weights(longest);
    const double midpoint = static_cast<double>(longest) / 2;
    for (std::size_t d = 0; d < longest; ++d) {
        weights[d] = 1 / (1 + std::exp(-g * (static_cast<double>(d) - midpoint)));
    }
    return weights;
}

template<typename Float_>
Float_ fill_wdtw(const SeriesView<Float_>& x, const SeriesView<Float_>& y, const DistanceWdtwOptions& options, AlignmentMatrix<Float_>& matrix) {
    const auto weights = logistic_weights<Float_>(x.length, y.length, options.g);
    return fill_dtw(x, y, options.window, matrix, [&](const std::size_t i, const std::size_t j) -> Float_ {
        return weights[i > j ? i - j : j - i];
    });
}

inline void check_wdtw_options(const DistanceWdtwOptions& options) {
    check_window(options.window);
    check_non_negative(options.g, "g");
}

}
/**
 * @endcond
 */

/**
 * @brief Weighted dynamic time warping (WDTW) distance.
 *
 * This is the DTW distance where the cost of aligning time points `i` and `j` is multiplied by a logistic weight,
 * `1 / (1 + exp(-g * (|i - j| - L / 2)))` where `L` is the length of the longer series.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Jeong, Y.-S., Jeong, M. K. and Omitaomu, O. A. (2011).
 * Weighted dynamic time warping for time series classification.
 * _Pattern Recognition_ 44, 2231-2240.
 */
template<typename Float_>
class DistanceWdtw final : public AlignedDistance<Float_> {
public:
    /**
     * @param options Further options.
     */
    DistanceWdtw(DistanceWdtwOptions options) : my_options(std::move(options)) {
        internal::check_wdtw_options(my_options);
    }

    /**
     * Default constructor.
     */
    DistanceWdtw() = default;

private:
    DistanceWdtwOptions my_options;

public:
    /**
     * @return Options for the WDTW distance.
     */
    const DistanceWdtwOptions& get_options() const {
        return my_options;
    }

protected:
    /**
     * @cond
     */
    Float_ fill(const SeriesView<Float_>& x, const SeriesView<Float_>& y, internal::AlignmentMatrix<Float_>& matrix) const {
        return internal::fill_wdtw(x, y, my_options, matrix);
    }
    /**
     * @endcond
     */
};

/**
 * @brief Weighted derivative dynamic time warping (WDDTW) distance.
 *
 * This is the WDTW distance between the first derivatives of the two series, see `derivative()`.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Float_>
class DistanceWddtw final : public AlignedDistance<Float_> {
public:
    /**
     * @param options Further options.
     */
    DistanceWddtw(DistanceWdtwOptions options) : my_options(std::move(options)) {
        internal::check_wdtw_options(my_options);
    }

    /**
     * Default constructor.
     */
    DistanceWddtw() = default;

private:
    DistanceWdtwOptions my_options;

public:
    /**
     * @return Options for the WDDTW distance.
     */
    const DistanceWdtwOptions& get_options() const {
        return my_options;
    }

protected:
    /**
     * @cond
     */
    Float_ fill(const SeriesView<Float_>& x, const SeriesView<Float_>& y, internal::AlignmentMatrix<Float_>& matrix) const {
        const auto dx = derivative(x), dy = derivative(y);
        return internal::fill_wdtw(dx.view(), dy.view(), my_options, matrix);
    }
    /**
     * @endcond
     */
};

}

#endif
