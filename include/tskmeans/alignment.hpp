#ifndef TSKMEANS_ALIGNMENT_HPP
#define TSKMEANS_ALIGNMENT_HPP

#include <vector>
#include <cstddef>
#include <cmath>
#include <limits>
#include <algorithm>
#include <utility>
#include <string>

#include "sanisizer/sanisizer.hpp"

#include "Distance.hpp"
#include "TimeSeries.hpp"
#include "errors.hpp"

/**
 * @file alignment.hpp
 * @brief Dynamic programming for elastic distances.
 */

namespace tskmeans {

/**
 * @cond
 */
namespace internal {

enum class Step : unsigned char { NONE, DIAGONAL, UP, LEFT };

/*
 * Ties are broken in favor of the diagonal, then up (i.e., from (i-1, j)), then left (from (i, j-1)).
 * This determines the alignment paths used by DBA, so it must not change.
 */
template<typename Float_>
std::pair<Float_, Step> pick_minimum(const Float_ diagonal, const Float_ up, const Float_ left) {
    if (diagonal <= up && diagonal <= left) {
        return std::make_pair(diagonal, Step::DIAGONAL);
    } else if (up <= left) {
        return std::make_pair(up, Step::UP);
    } else {
        return std::make_pair(left, Step::LEFT);
    }
}

template<typename Float_>
std::pair<Float_, Step> pick_maximum(const Float_ diagonal, const Float_ up, const Float_ left) {
    if (diagonal >= up && diagonal >= left) {
        return std::make_pair(diagonal, Step::DIAGONAL);
    } else if (up >= left) {
        return std::make_pair(up, Step::UP);
    } else {
        return std::make_pair(left, Step::LEFT);
    }
}

inline void check_window(const double window) {
    if (!(window >= 0 && window <= 1)) { // also catches NaNs.
        throw InvalidParameter("window should lie in [0, 1]");
    }
}

template<typename Value_>
void check_non_negative(const Value_ value, const char* name) {
    if (!(value >= 0) || !std::isfinite(value)) {
        throw InvalidParameter(std::string(name) + " should be a non-negative finite number");
    }
}

/*
 * Half-width of the Sakoe-Chiba band. This is never less than the difference
 * in lengths, otherwise the final cell would not be reachable.
 */
inline std::size_t band_radius(const double window, const std::size_t n, const std::size_t m) {
    const auto longest = std::max(n, m);
    const auto radius = static_cast<std::size_t>(std::floor(window * static_cast<double>(longest)));
    const auto gap = (n > m ? n - m : m - n);
    return std::max(radius, gap);
}

inline bool in_band(const std::size_t i, const std::size_t j, const std::size_t radius) {
    return (i > j ? i - j : j - i) <= radius;
}

template<typename Float_>
struct Transitions {
    Float_ diagonal;
    Float_ up;
    Float_ left;
};

/*
 * Cost table for a (n + 1)-by-(m + 1) dynamic program. Cell (i, j) refers to
 * the first i observations of 'x' and the first j observations of 'y', so row
 * and column 0 are the boundaries. We also store the step that was used to
 * reach each cell so that the path can be recovered by backtracking.
 */
template<typename Float_>
class AlignmentMatrix {
public:
    void reset(const std::size_t n, const std::size_t m, const Float_ fill) {
        my_nrow = n + 1;
        my_ncol = m + 1;
        const auto total = sanisizer::product<typename std::vector<Float_>::size_type>(my_nrow, my_ncol);
        my_costs.clear();
        my_costs.resize(total, fill);
        my_steps.clear();
        my_steps.resize(total, Step::NONE);
    }

private:
    std::size_t my_nrow = 0, my_ncol = 0;
    std::vector<Float_> my_costs;
    std::vector<Step> my_steps;

public:
    Float_& cost(const std::size_t i, const std::size_t j) {
        return my_costs[sanisizer::nd_offset<std::size_t>(j, my_ncol, i)];
    }

    Float_ cost(const std::size_t i, const std::size_t j) const {
        return my_costs[sanisizer::nd_offset<std::size_t>(j, my_ncol, i)];
    }

    Step& step(const std::size_t i, const std::size_t j) {
        return my_steps[sanisizer::nd_offset<std::size_t>(j, my_ncol, i)];
    }

    Step step(const std::size_t i, const std::size_t j) const {
        return my_steps[sanisizer::nd_offset<std::size_t>(j, my_ncol, i)];
    }

    void backtrack(AlignmentPath& path) const {
        path.clear();
        std::size_t i = my_nrow - 1, j = my_ncol - 1;
        while (i > 0 && j > 0) {
            path.emplace_back(i - 1, j - 1);
            const auto s = step(i, j);
            if (s == Step::DIAGONAL) {
                --i;
                --j;
            } else if (s == Step::UP) {
                --i;
            } else if (s == Step::LEFT) {
                --j;
            } else {
                break;
            }
        }
        std::reverse(path.begin(), path.end());
    }
};

/*
 * Fills the interior cells of a minimizing dynamic program. The boundaries
 * should already have been set by the caller after reset(). 'transitions(i, j)'
 * should return the cost of moving into cell (i, j) from each predecessor.
 * Cells outside the band are left at their initial (infinite) cost.
 */
template<typename Float_, class Transitions_>
Float_ fill_minimum(AlignmentMatrix<Float_>& matrix, const std::size_t n, const std::size_t m, const std::size_t radius, Transitions_ transitions) {
    for (std::size_t i = 1; i <= n; ++i) {
        const std::size_t jstart = (i > radius ? std::max<std::size_t>(1, i - radius) : 1);
        const std::size_t jend = std::min(m, i + radius);
        for (std::size_t j = jstart; j <= jend; ++j) {
            const Transitions<Float_> trans = transitions(i, j);
            const auto best = pick_minimum<Float_>(
                matrix.cost(i - 1, j - 1) + trans.diagonal,
                matrix.cost(i - 1, j) + trans.up,
                matrix.cost(i, j - 1) + trans.left
            );
            matrix.cost(i, j) = best.first;
            matrix.step(i, j) = best.second;
        }
    }
    return matrix.cost(n, m);
}

template<typename Float_>
Float_ squared_euclidean(const Float_* const x, const Float_* const y, const std::size_t num_channels) {
    Float_ output = 0;
    for (std::size_t c = 0; c < num_channels; ++c) {
        const Float_ delta = x[c] - y[c];
        output += delta * delta;
    }
    return output;
}

template<typename Float_>
Float_ euclidean(const Float_* const x, const Float_* const y, const std::size_t num_channels) {
    return std::sqrt(squared_euclidean(x, y, num_channels));
}

template<typename Float_>
constexpr Float_ infinity() {
    return std::numeric_limits<Float_>::infinity();
}

}
/**
 * @endcond
 */

/**
 * @brief Distance computed by a dynamic programming alignment.
 *
 * Subclasses only need to fill the cost table in `fill()`.
 * The alignment path is then recovered by backtracking from the final cell,
 * where ties between predecessors are broken in favor of the diagonal, then the cell above `(i-1, j)`, then the cell to the left `(i, j-1)`.
 * Boundary cells are not reported in the path.
 *
 * @tparam Float_ Floating-point type of the values and distances.
 */
template<typename Float_>
class AlignedDistance : public Distance<Float_> {
public:
    /**
     * @cond
     */
    Float_ compute(const SeriesView<Float_>& x, const SeriesView<Float_>& y) const {
        internal::check_channels(x, y);
        internal::AlignmentMatrix<Float_> matrix;
        return fill(x, y, matrix);
    }

    bool has_alignment() const {
        return true;
    }

    Float_ align(const SeriesView<Float_>& x, const SeriesView<Float_>& y, AlignmentPath& path) const {
        internal::check_channels(x, y);
        internal::AlignmentMatrix<Float_> matrix;
        const auto output = fill(x, y, matrix);
        matrix.backtrack(path);
        return output;
    }
    /**
     * @endcond
     */

protected:
    /**
     * @param x First series.
     * @param y Second series, with the same number of channels as `x`.
     * @param matrix Cost table to be filled, including the steps used to reach each cell.
     * @return Distance between `x` and `y`.
     */
    virtual Float_ fill(const SeriesView<Float_>& x, const SeriesView<Float_>& y, internal::AlignmentMatrix<Float_>& matrix) const = 0;
};

}

#endif
