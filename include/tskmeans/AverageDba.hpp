#ifndef TSKMEANS_AVERAGE_DBA_HPP
#define TSKMEANS_AVERAGE_DBA_HPP

#include <vector>
#include <cstddef>
#include <utility>
#include <algorithm>

#include "sanisizer/sanisizer.hpp"

#include "Average.hpp"
#include "errors.hpp"
#include "parallelize.hpp"

/**
 * @file AverageDba.hpp
 * @brief DTW barycenter averaging.
 */

namespace tskmeans {

/**
 * @brief Options for `AverageDba`.
 */
struct AverageDbaOptions {
    /**
     * Number of refinement rounds.
     * This should be positive.
     */
    int iterations = 10;

    /**
     * Number of threads to use for aligning the members to the current barycenter.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;
};

/**
 * @brief Compute the center by DTW barycenter averaging (DBA).
 *
 * Starting from the current center (or the first member, if the center is empty), each round aligns every member to the center.
 * Each time point of the center is then replaced by the mean of all member values that were aligned to it.
 * The length of the center does not change.
 * Time points of the center that are not aligned to any member are left unchanged.
 *
 * This requires a distance that reports alignment paths, usually from the DTW family.
 * With `DistanceEuclidean`, every alignment is diagonal and DBA reduces to the arithmetic mean.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the values and distances.
 *
 * @see
 * Petitjean, F., Ketterlin, A. and Gancarski, P. (2011).
 * A global averaging method for dynamic time warping, with applications to clustering.
 * _Pattern Recognition_ 44, 678-693.
 */
template<typename Index_, typename Float_>
class AverageDba final : public Average<Index_, Float_> {
public:
    /**
     * @param options Further options.
     */
    AverageDba(AverageDbaOptions options) : my_options(std::move(options)) {
        if (my_options.iterations <= 0) {
            throw InvalidParameter("number of DBA iterations should be positive");
        }
    }

    /**
     * Default constructor.
     */
    AverageDba() = default;

private:
    AverageDbaOptions my_options;

public:
    /**
     * @return Options for DBA.
     */
    const AverageDbaOptions& get_options() const {
        return my_options;
    }

public:
    /**
     * @cond
     */
    void run(const Dataset<Index_, Float_>& data, const std::vector<Index_>& members, const Distance<Float_>& distance, TimeSeries<Float_>& center) const {
        if (center.empty()) {
            center.assign(data.get_series(members.front()));
        }

        const auto nmembers = members.size();
        const auto len = center.length();
        const auto nchannels = center.num_channels();
        auto paths = sanisizer::create<std::vector<AlignmentPath> >(nmembers);
        auto sums = sanisizer::create<std::vector<Float_> >(center.values().size());
        auto counts = sanisizer::create<std::vector<std::size_t> >(len);

        for (int it = 0; it < my_options.iterations; ++it) {
            const auto reference = center.view();
            parallelize(my_options.num_threads, nmembers, [&](const int, const std::size_t start, const std::size_t length) -> void {
                for (std::size_t m = start, end = start + length; m < end; ++m) {
                    distance.align(reference, data.get_series(members[m]), paths[m]);
                }
            });

            // Accumulating in member order so that the result does not depend on the number of threads.
            std::fill(sums.begin(), sums.end(), 0);
            std::fill(counts.begin(), counts.end(), 0);
            for (std::size_t m = 0; m < nmembers; ++m) {
                const auto current = data.get_series(members[m]);
                for (const auto& pair : paths[m]) {
                    const auto src = current.at(pair.second);
                    const auto offset = sanisizer::product_unsafe<std::size_t>(pair.first, nchannels);
                    for (std::size_t c = 0; c < nchannels; ++c) {
                        sums[offset + c] += src[c];
                    }
                    ++counts[pair.first];
                }
            }

            for (std::size_t t = 0; t < len; ++t) {
                if (counts[t] == 0) {
                    continue;
                }
                const auto cptr = center.at(t);
                const auto offset = sanisizer::product_unsafe<std::size_t>(t, nchannels);
                for (std::size_t c = 0; c < nchannels; ++c) {
                    cptr[c] = sums[offset + c] / counts[t];
                }
            }
        }
    }

    void validate(const Distance<Float_>& distance) const {
        if (!distance.has_alignment()) {
            throw InvalidParameter("DBA requires a distance that reports alignment paths");
        }
    }
    /**
     * @endcond
     */
};

}

#endif
