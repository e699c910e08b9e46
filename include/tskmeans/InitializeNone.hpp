#ifndef TSKMEANS_INITIALIZE_NONE_HPP
#define TSKMEANS_INITIALIZE_NONE_HPP 

#include <vector>
#include <string>
#include <utility>
#include <cstddef>

#include "Initialize.hpp"
#include "errors.hpp"

/**
 * @file InitializeNone.hpp
 * @brief Class for no initialization.
 */

namespace tskmeans {

/**
 * @brief No-op "initialization" with existing cluster centers.
 *
 * This class holds cluster centers supplied by the caller and returns them without modification.
 * The number of centers should be equal to the requested number of clusters,
 * and each center should have the same number of channels as the dataset.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type for the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Index_, typename Cluster_, typename Float_>
class InitializeNone final : public Initialize<Index_, Cluster_, Float_> { 
public:
    /**
     * @param centers Initial cluster centers.
     */
    InitializeNone(std::vector<TimeSeries<Float_> > centers) : my_centers(std::move(centers)) {}

private:
    std::vector<TimeSeries<Float_> > my_centers;

public:
    /**
     * @cond
     */
    Cluster_ run(
        const Dataset<Index_, Float_>& data,
        const Cluster_ ncenters,
        const Distance<Float_>& distance,
        const Average<Index_, Float_>& average,
        Rng&,
        std::vector<TimeSeries<Float_> >& centers)
    const {
        if (my_centers.size() != static_cast<std::size_t>(ncenters)) {
            throw InvalidParameter("expected " + std::to_string(ncenters) + " initial centers, got " + std::to_string(my_centers.size()));
        }

        const bool equal_length = distance.requires_equal_length() || average.requires_equal_length();
        const auto nobs = data.num_series();
        for (const auto& cen : my_centers) {
            if (cen.empty()) {
                throw InsufficientData("initial centers should contain at least one observation");
            }
            if (cen.num_channels() != data.num_channels()) {
                throw DimensionMismatch("initial centers should have the same number of channels as the dataset");
            }
            if (equal_length && nobs > 0 && cen.length() != data.get_series(0).length) {
                throw DimensionMismatch("initial centers should have the same length as the series");
            }
        }

        centers = my_centers;
        return ncenters;
    }
    /**
     * @endcond
     */
};

}

#endif
