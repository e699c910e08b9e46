#ifndef TSKMEANS_AVERAGE_MEAN_HPP
#define TSKMEANS_AVERAGE_MEAN_HPP

#include <vector>
#include <algorithm>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "Average.hpp"
#include "utils.hpp"

/**
 * @file AverageMean.hpp
 * @brief Arithmetic mean of the cluster members.
 */

namespace tskmeans {

/**
 * @brief Compute the center as the arithmetic mean of the cluster members.
 *
 * The mean is computed separately for each time point and channel.
 * All series must have the same length, and the distance is ignored.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Float_>
class AverageMean final : public Average<Index_, Float_> {
public:
    /**
     * @cond
     */
    void run(const Dataset<Index_, Float_>& data, const std::vector<Index_>& members, const Distance<Float_>&, TimeSeries<Float_>& center) const {
        const auto first = data.get_series(members.front());
        center = TimeSeries<Float_>(first.length, first.num_channels);

        const auto total = center.values().size();
        const auto cptr = center.data();
        for (const auto m : members) {
            const auto current = data.get_series(m);
            internal::check_lengths(first, current);
            for (I<decltype(total)> i = 0; i < total; ++i) {
                cptr[i] += current.data[i];
            }
        }

        const Float_ size = members.size();
        for (I<decltype(total)> i = 0; i < total; ++i) {
            cptr[i] /= size;
        }
    }

    bool requires_equal_length() const {
        return true;
    }
    /**
     * @endcond
     */
};

}

#endif
