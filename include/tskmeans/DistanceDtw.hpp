#ifndef TSKMEANS_DISTANCE_DTW_HPP
#define TSKMEANS_DISTANCE_DTW_HPP

#include <cstddef>
#include <utility>

#include "Distance.hpp"
#include "TimeSeries.hpp"
#include "alignment.hpp"
#include "derivative.hpp"

/**
 * @file DistanceDtw.hpp
 * @brief Dynamic time warping distances.
 */

namespace tskmeans {

/**
 * @brief Options for `DistanceDtw` and `DistanceDdtw`.
 */
struct DistanceDtwOptions {
    /**
     * Width of the Sakoe-Chiba band, as a proportion of the length of the longer series.
     * This should lie in `[0, 1]`.
     * Only pairs of time points `(i, j)` with `|i - j|` no greater than the band's half-width are aligned,
     * where the half-width is also at least the difference in the series lengths.
     * Smaller values reduce the computational cost at the expense of constraining the warping.
     * A value of 0 forces a diagonal alignment for equal-length series.
     */
    double window = 1;
};

/**
 * @cond
 */
namespace internal {

template<typename Float_, class Weight_>
Float_ fill_dtw(const SeriesView<Float_>& x, const SeriesView<Float_>& y, const double window, AlignmentMatrix<Float_>& matrix, Weight_ weight) {
    const auto n = x.length, m = y.length;
    matrix.reset(n, m, infinity<Float_>());
    matrix.cost(0, 0) = 0;

    const auto nchannels = x.num_channels;
    const auto radius = band_radius(window, n, m);
    return fill_minimum(matrix, n, m, radius, [&](const std::size_t i, const std::size_t j) -> Transitions<Float_> {
        const Float_ local = weight(i, j) * squared_euclidean(x.at(i - 1), y.at(j - 1), nchannels);
        return Transitions<Float_>{ local, local, local };
    });
}

template<typename Float_>
Float_ fill_dtw(const SeriesView<Float_>& x, const SeriesView<Float_>& y, const double window, AlignmentMatrix<Float_>& matrix) {
    return fill_dtw(x, y, window, matrix, [](const std::size_t, const std::size_t) -> Float_ { return 1; });
}

}
/**
 * @endcond
 */

/**
 * @brief Dynamic time warping (DTW) distance.
 *
 * The cost of aligning two time points is the squared Euclidean distance between their values,
 * and the DTW distance is the minimum total cost of any monotonic alignment of the two series.
 * No square root is applied to the total.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Sakoe, H. and Chiba, S. (1978).
 * Dynamic programming algorithm optimization for spoken word recognition.
 * _IEEE Transactions on Acoustics, Speech, and Signal Processing_ 26, 43-49.
 */
template<typename Float_>
class DistanceDtw final : public AlignedDistance<Float_> {
public:
    /**
     * @param options Further options.
     */
    DistanceDtw(DistanceDtwOptions options) : my_options(std::move(options)) {
        internal::check_window(my_options.window);
    }

    /**
     * Default constructor.
     */
    DistanceDtw() = default;

private:
    DistanceDtwOptions my_options;

public:
    /**
     * @return Options for the DTW distance.
     */
    const DistanceDtwOptions& get_options() const {
        return my_options;
    }

protected:
    /**
     * @cond
     */
    Float_ fill(const SeriesView<Float_>& x, const SeriesView<Float_>& y, internal::AlignmentMatrix<Float_>& matrix) const {
        return internal::fill_dtw(x, y, my_options.window, matrix);
    }
    /**
     * @endcond
     */
};

/**
 * @brief Derivative dynamic time warping (DDTW) distance.
 *
 * This is the DTW distance between the first derivatives of the two series, see `derivative()` for details.
 * The derivative has the same length as the original series, so the alignment path refers to the original time points.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Keogh, E. and Pazzani, M. (2001).
 * Derivative dynamic time warping.
 * _Proceedings of the 2001 SIAM International Conference on Data Mining_, 1-11.
 */
template<typename Float_>
class DistanceDdtw final : public AlignedDistance<Float_> {
public:
    /**
     * @param options Further options.
     */
    DistanceDdtw(DistanceDtwOptions options) : my_options(std::move(options)) {
        internal::check_window(my_options.window);
    }

    /**
     * Default constructor.
     */
    DistanceDdtw() = default;

private:
    DistanceDtwOptions my_options;

public:
    /**
     * @return Options for the DDTW distance.
     */
    const DistanceDtwOptions& get_options() const {
        return my_options;
    }

protected:
    /**
     * @cond
     */
    Float_ fill(const SeriesView<Float_>& x, const SeriesView<Float_>& y, internal::AlignmentMatrix<Float_>& matrix) const {
        const auto dx = derivative(x), dy = derivative(y);
        return internal::fill_dtw(dx.view(), dy.view(), my_options.window, matrix);
    }
    /**
     * @endcond
     */
};

}

#endif
