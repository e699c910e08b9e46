#ifndef TSKMEANS_AVERAGE_MEDOID_HPP
#define TSKMEANS_AVERAGE_MEDOID_HPP

#include <vector>
#include <cstddef>
#include <utility>

#include "sanisizer/sanisizer.hpp"

#include "Average.hpp"
#include "parallelize.hpp"

/**
 * @file AverageMedoid.hpp
 * @brief Medoid of the cluster members.
 */

namespace tskmeans {

/**
 * @brief Options for `AverageMedoid`.
 */
struct AverageMedoidOptions {
    /**
     * Number of threads to use for computing the pairwise distances.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;
};

/**
 * @brief Use the medoid of the cluster members as the center.
 *
 * The medoid is the member with the smallest sum of distances to all other members.
 * Ties are broken in favor of the member with the lowest index in the dataset.
 * This is used for k-medoids clustering, and works with any distance.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Float_>
class AverageMedoid final : public Average<Index_, Float_> {
public:
    /**
     * @param options Further options.
     */
    AverageMedoid(AverageMedoidOptions options) : my_options(std::move(options)) {}

    /**
     * Default constructor.
     */
    AverageMedoid() = default;

private:
    AverageMedoidOptions my_options;

public:
    /**
     * @return Options for the medoid calculation.
     */
    const AverageMedoidOptions& get_options() const {
        return my_options;
    }

public:
    /**
     * @cond
     */
    void run(const Dataset<Index_, Float_>& data, const std::vector<Index_>& members, const Distance<Float_>& distance, TimeSeries<Float_>& center) const {
        const auto nmembers = members.size();

        // Only the upper triangle is filled, as all distances are symmetric.
        auto pairwise = sanisizer::create<std::vector<Float_> >(sanisizer::product<std::size_t>(nmembers, nmembers));
        parallelize(my_options.num_threads, nmembers, [&](const int, const std::size_t start, const std::size_t length) -> void {
            for (std::size_t i = start, end = start + length; i < end; ++i) {
                const auto left = data.get_series(members[i]);
                for (std::size_t j = i + 1; j < nmembers; ++j) {
                    pairwise[sanisizer::nd_offset<std::size_t>(j, nmembers, i)] = distance.compute(left, data.get_series(members[j]));
                }
            }
        });

        auto sums = sanisizer::create<std::vector<Float_> >(nmembers);
        for (std::size_t i = 0; i < nmembers; ++i) {
            for (std::size_t j = i + 1; j < nmembers; ++j) {
                const auto d = pairwise[sanisizer::nd_offset<std::size_t>(j, nmembers, i)];
                sums[i] += d;
                sums[j] += d;
            }
        }

        std::size_t best = 0;
        for (std::size_t i = 1; i < nmembers; ++i) {
            if (sums[i] < sums[best]) {
                best = i;
            }
        }
        center.assign(data.get_series(members[best]));
    }
    /**
     * @endcond
     */
};

}

#endif
