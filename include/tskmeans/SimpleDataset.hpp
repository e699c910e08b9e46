#ifndef TSKMEANS_SIMPLE_DATASET_HPP
#define TSKMEANS_SIMPLE_DATASET_HPP

#include <vector>
#include <cstddef>
#include <string>
#include <utility>

#include "sanisizer/sanisizer.hpp"

#include "Dataset.hpp"
#include "TimeSeries.hpp"
#include "errors.hpp"

/**
 * @file SimpleDataset.hpp
 * @brief Wrapper for in-memory time series.
 */

namespace tskmeans {

/**
 * @brief A simple dataset of in-memory time series.
 *
 * This borrows the caller's arrays, which should not be modified or deallocated during the lifetime of the `SimpleDataset`.
 *
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the values.
 */
template<typename Index_, typename Float_>
class SimpleDataset final : public Dataset<Index_, Float_> {
public:
    /**
     * @param num_channels Number of channels.
     * @param num_series Number of series.
     * @param length Length of each series.
     * @param[in] data Pointer to an array of length equal to the product of `num_channels`, `num_series` and `length`.
     * Each series is stored contiguously in time-major layout (see `SeriesView`), and series are stored consecutively.
     */
    SimpleDataset(const std::size_t num_channels, const Index_ num_series, const std::size_t length, const Float_* const data) : my_num_channels(num_channels) {
        const auto stride = sanisizer::product<std::size_t>(num_channels, length);
        my_series.reserve(num_series);
        for (Index_ i = 0; i < num_series; ++i) {
            my_series.emplace_back(data + sanisizer::product_unsafe<std::size_t>(i, stride), length, num_channels);
        }
    }

    /**
     * @param series Vector of series, all with the same number of channels.
     */
    SimpleDataset(const std::vector<TimeSeries<Float_> >& series) {
        my_series.reserve(series.size());
        for (const auto& s : series) {
            my_series.push_back(s.view());
        }
        initialize_channels();
    }

    /**
     * @param series Vector of views, all with the same number of channels.
     */
    SimpleDataset(std::vector<SeriesView<Float_> > series) : my_series(std::move(series)) {
        initialize_channels();
    }

private:
    std::vector<SeriesView<Float_> > my_series;
    std::size_t my_num_channels = 0;

    void initialize_channels() {
        if (my_series.empty()) {
            return;
        }
        my_num_channels = my_series.front().num_channels;
        for (const auto& s : my_series) {
            if (s.num_channels != my_num_channels) {
                throw DimensionMismatch("all series should have the same number of channels (" + std::to_string(my_num_channels) + ")");
            }
        }
    }

public:
    /**
     * @cond
     */
    Index_ num_series() const {
        return my_series.size();
    }

    std::size_t num_channels() const {
        return my_num_channels;
    }

    SeriesView<Float_> get_series(const Index_ i) const {
        return my_series[i];
    }
    /**
     * @endcond
     */
};

}

#endif
