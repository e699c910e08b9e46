#ifndef TSKMEANS_TIME_SERIES_HPP
#define TSKMEANS_TIME_SERIES_HPP

#include <vector>
#include <cstddef>
#include <algorithm>
#include <string>

#include "sanisizer/sanisizer.hpp"

#include "errors.hpp"

/**
 * @file TimeSeries.hpp
 * @brief Representation of a single time series.
 */

namespace tskmeans {

/**
 * @brief Read-only view of a time series.
 *
 * The series consists of `length` observations, each of which is a vector of `num_channels` values.
 * Values are stored time-major, i.e., the value for channel `c` at time `t` is at `data[t * num_channels + c]`.
 * The view does not own the underlying array, which must outlive the view.
 *
 * @tparam Float_ Floating-point type of the values.
 */
template<typename Float_>
struct SeriesView {
    /**
     * @cond
     */
    SeriesView() = default;

    SeriesView(const Float_* const data, const std::size_t length, const std::size_t num_channels) : data(data), length(length), num_channels(num_channels) {}
    /**
     * @endcond
     */

    /**
     * Pointer to an array of length equal to the product of `length` and `num_channels`.
     */
    const Float_* data = NULL;

    /**
     * Number of observations, i.e., time points.
     */
    std::size_t length = 0;

    /**
     * Number of channels at each time point.
     */
    std::size_t num_channels = 0;

    /**
     * @param t Index of the time point, less than `length`.
     * @return Pointer to an array of length `num_channels`, containing the values at time `t`.
     */
    const Float_* at(const std::size_t t) const {
        return data + sanisizer::product_unsafe<std::size_t>(t, num_channels);
    }
};

/**
 * @brief Owning time series.
 *
 * This is used to hold the cluster centers, which may be synthesized from the dataset (e.g., by averaging) rather than referring to existing series.
 * Storage follows the same time-major layout as `SeriesView`.
 *
 * @tparam Float_ Floating-point type of the values.
 */
template<typename Float_>
class TimeSeries {
public:
    /**
     * Creates an empty series with no observations.
     */
    TimeSeries() = default;

    /**
     * @param length Number of observations.
     * @param num_channels Number of channels.
     * All values are initialized to zero.
     */
    TimeSeries(const std::size_t length, const std::size_t num_channels) :
        my_values(sanisizer::product<typename std::vector<Float_>::size_type>(length, num_channels)),
        my_length(length),
        my_num_channels(num_channels)
    {}

    /**
     * @param values Time-major array of values.
     * Its length should be a multiple of `num_channels`.
     * @param num_channels Number of channels.
     */
    TimeSeries(std::vector<Float_> values, const std::size_t num_channels) : my_values(std::move(values)), my_num_channels(num_channels) {
        if (num_channels == 0) {
            throw DimensionMismatch("number of channels should be positive");
        }
        if (my_values.size() % num_channels != 0) {
            throw DimensionMismatch("number of values is not a multiple of the number of channels");
        }
        my_length = my_values.size() / num_channels;
    }

    /**
     * @param values Values of a univariate series.
     */
    TimeSeries(std::vector<Float_> values) : my_values(std::move(values)), my_length(my_values.size()), my_num_channels(1) {}

    /**
     * @param view View of an existing series, to be copied.
     */
    TimeSeries(const SeriesView<Float_>& view) {
        assign(view);
    }

private:
    std::vector<Float_> my_values;
    std::size_t my_length = 0;
    std::size_t my_num_channels = 0;

public:
    /**
     * @return Number of observations.
     */
    std::size_t length() const {
        return my_length;
    }

    /**
     * @return Number of channels.
     */
    std::size_t num_channels() const {
        return my_num_channels;
    }

    /**
     * @return Whether the series has no observations.
     */
    bool empty() const {
        return my_length == 0;
    }

    /**
     * @return Time-major array of values.
     */
    const std::vector<Float_>& values() const {
        return my_values;
    }

    /**
     * @return Pointer to the time-major array of values.
     */
    Float_* data() {
        return my_values.data();
    }

    /**
     * @return Pointer to the time-major array of values.
     */
    const Float_* data() const {
        return my_values.data();
    }

    /**
     * @param t Index of the time point.
     * @return Pointer to the values at time `t`.
     */
    Float_* at(const std::size_t t) {
        return my_values.data() + sanisizer::product_unsafe<std::size_t>(t, my_num_channels);
    }

    /**
     * @param t Index of the time point.
     * @return Pointer to the values at time `t`.
     */
    const Float_* at(const std::size_t t) const {
        return my_values.data() + sanisizer::product_unsafe<std::size_t>(t, my_num_channels);
    }

    /**
     * @return View of this series, valid as long as the series is not modified or destroyed.
     */
    SeriesView<Float_> view() const {
        return SeriesView<Float_>(my_values.data(), my_length, my_num_channels);
    }

    /**
     * @param view View of a series to copy into this object.
     */
    void assign(const SeriesView<Float_>& view) {
        my_length = view.length;
        my_num_channels = view.num_channels;
        my_values.resize(sanisizer::product<typename std::vector<Float_>::size_type>(my_length, my_num_channels));
        std::copy_n(view.data, my_values.size(), my_values.begin());
    }
};

/**
 * @cond
 */
namespace internal {

template<typename Float_>
void check_channels(const SeriesView<Float_>& x, const SeriesView<Float_>& y) {
    if (x.num_channels != y.num_channels) {
        throw DimensionMismatch("series have different numbers of channels (" + std::to_string(x.num_channels) + " and " + std::to_string(y.num_channels) + ")");
    }
}

template<typename Float_>
void check_lengths(const SeriesView<Float_>& x, const SeriesView<Float_>& y) {
    if (x.length != y.length) {
        throw DimensionMismatch("series have different lengths (" + std::to_string(x.length) + " and " + std::to_string(y.length) + ")");
    }
}

}
/**
 * @endcond
 */

}

#endif
