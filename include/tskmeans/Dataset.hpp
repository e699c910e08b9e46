#ifndef TSKMEANS_DATASET_HPP
#define TSKMEANS_DATASET_HPP

#include <cstddef>

#include "TimeSeries.hpp"

/**
 * @file Dataset.hpp
 * @brief Interface for datasets of time series.
 */

namespace tskmeans {

/**
 * @brief Interface for a dataset of time series.
 *
 * All series in the dataset should have the same number of channels but may have different lengths.
 * Implementations should allow `get_series()` to be called concurrently from multiple threads.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the values.
 */
template<typename Index_, typename Float_>
class Dataset {
public:
    /**
     * @cond
     */
    Dataset() = default;
    Dataset(Dataset&&) = default;
    Dataset(const Dataset&) = default;
    Dataset& operator=(Dataset&&) = default;
    Dataset& operator=(const Dataset&) = default;
    virtual ~Dataset() = default;
    /**
     * @endcond
     */

    /**
     * @return Number of series.
     */
    virtual Index_ num_series() const = 0;

    /**
     * @return Number of channels in each series.
     */
    virtual std::size_t num_channels() const = 0;

    /**
     * @param i Index of the series, less than `num_series()`.
     * @return View of the series, valid for the lifetime of this object.
     */
    virtual SeriesView<Float_> get_series(Index_ i) const = 0;
};

}

#endif
