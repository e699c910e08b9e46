#ifndef TSKMEANS_DERIVATIVE_HPP
#define TSKMEANS_DERIVATIVE_HPP

#include <cstddef>
#include <algorithm>

#include "TimeSeries.hpp"

/**
 * @file derivative.hpp
 * @brief Derivative transform for derivative-based distances.
 */

namespace tskmeans {

/**
 * Estimate the first derivative of a series, as used by DDTW and WDDTW.
 * For each interior time point `t`, the derivative is defined as `((x[t] - x[t-1]) + (x[t+1] - x[t-1]) / 2) / 2`.
 * The first and last time points are assigned the derivatives of their neighbors so that the output has the same length as the input.
 * For a series of length 2, both derivatives are set to `x[1] - x[0]`, while a series of length 1 has a derivative of zero.
 *
 * @tparam Float_ Floating-point type of the values.
 * @param x Series to transform.
 * @return Derivative of `x`, with the same length and number of channels.
 */
template<typename Float_>
TimeSeries<Float_> derivative(const SeriesView<Float_>& x) {
    const auto n = x.length;
    const auto nchannels = x.num_channels;
    TimeSeries<Float_> output(n, nchannels);

    if (n >= 3) {
        for (std::size_t t = 1; t + 1 < n; ++t) {
            const auto previous = x.at(t - 1), current = x.at(t), next = x.at(t + 1);
            auto optr = output.at(t);
            for (std::size_t c = 0; c < nchannels; ++c) {
                optr[c] = ((current[c] - previous[c]) + (next[c] - previous[c]) / 2) / 2;
            }
        }
        std::copy_n(output.at(1), nchannels, output.at(0));
        std::copy_n(output.at(n - 2), nchannels, output.at(n - 1));

    } else if (n == 2) {
        const auto first = x.at(0), second = x.at(1);
        for (std::size_t c = 0; c < nchannels; ++c) {
            const Float_ delta = second[c] - first[c];
            output.at(0)[c] = delta;
            output.at(1)[c] = delta;
        }
    }

    return output;
}

}

#endif
