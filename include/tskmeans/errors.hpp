#ifndef TSKMEANS_ERRORS_HPP
#define TSKMEANS_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exceptions thrown on invalid inputs.
 */

namespace tskmeans {

/**
 * @brief Invalid configuration.
 *
 * Thrown for a non-positive number of clusters or iterations, an unknown method name,
 * or distance parameters outside their permitted range.
 */
class InvalidParameter : public std::invalid_argument {
public:
    /**
     * @param message Description of the problem.
     */
    InvalidParameter(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @brief Not enough data for the requested clustering.
 *
 * Thrown when the dataset contains fewer series than the number of clusters, or when a series has no observations.
 */
class InsufficientData : public std::runtime_error {
public:
    /**
     * @param message Description of the problem.
     */
    InsufficientData(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Incompatible series shapes.
 *
 * Thrown when two series have different numbers of channels,
 * or when a distance or averaging method requires equal-length series and this is not satisfied.
 */
class DimensionMismatch : public std::invalid_argument {
public:
    /**
     * @param message Description of the problem.
     */
    DimensionMismatch(const std::string& message) : std::invalid_argument(message) {}
};

}

#endif
