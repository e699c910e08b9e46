#ifndef TSKMEANS_OPTIONS_HPP
#define TSKMEANS_OPTIONS_HPP

#include <string>
#include <cstdint>

#include "errors.hpp"

/**
 * @file Options.hpp
 * @brief Options for the top-level clustering functions.
 */

namespace tskmeans {

/**
 * Method for choosing the initial cluster centers.
 *
 * - `RANDOM`: assign each series to a random cluster and average the members, see `InitializeRandom`.
 * - `FORGY`: use randomly chosen series as centers, see `InitializeForgy`.
 * - `KMEANSPP`: k-means++ seeding with the chosen distance, see `InitializeKmeanspp`.
 */
enum class InitMethod : char { RANDOM, FORGY, KMEANSPP };

/**
 * Distance between time series.
 * See the class of the same name (e.g., `DistanceDtw` for `DTW`) for details.
 */
enum class DistanceMethod : char { EUCLIDEAN, DTW, DDTW, WDTW, WDDTW, LCSS, ERP, MSM, TWE };

/**
 * Method for computing cluster centers.
 *
 * - `MEAN`: arithmetic mean, see `AverageMean`.
 * - `DBA`: DTW barycenter averaging, see `AverageDba`.
 * - `MEDOID`: medoid of the cluster, see `AverageMedoid`.
 */
enum class AverageMethod : char { MEAN, DBA, MEDOID };

/**
 * @brief Choice of distance and its parameters.
 *
 * Only the parameters relevant to `method` are used.
 */
struct DistanceOptions {
    /**
     * Distance between time series.
     */
    DistanceMethod method = DistanceMethod::DTW;

    /**
     * Width of the Sakoe-Chiba band for all methods except `EUCLIDEAN`, see `DistanceDtwOptions::window`.
     */
    double window = 1;

    /**
     * Steepness of the weight function for `WDTW` and `WDDTW`, see `DistanceWdtwOptions::g`.
     */
    double g = 0.05;

    /**
     * Matching threshold for `LCSS`, see `DistanceLcssOptions::epsilon`.
     */
    double epsilon = 1;

    /**
     * Gap value for `ERP`, see `DistanceErpOptions::g`.
     */
    double erp_g = 0;

    /**
     * Split/merge cost for `MSM`, see `DistanceMsmOptions::c`.
     */
    double c = 1;

    /**
     * Stiffness for `TWE`, see `DistanceTweOptions::nu`.
     */
    double nu = 0.001;

    /**
     * Deletion penalty for `TWE`, see `DistanceTweOptions::lambda`.
     */
    double lambda = 1;
};

/**
 * @brief Options for `fit_kmeans()`.
 */
struct KmeansOptions {
    /**
     * Number of clusters.
     * This should be positive and no greater than the number of series.
     */
    int num_centers = 8;

    /**
     * Initialization method.
     */
    InitMethod init_method = InitMethod::KMEANSPP;

    /**
     * Distance between time series.
     */
    DistanceOptions distance;

    /**
     * Method for computing the cluster centers.
     * `MEAN` requires series of equal length.
     */
    AverageMethod average_method = AverageMethod::MEAN;

    /**
     * Number of refinement rounds in each update when `average_method = DBA`, see `AverageDbaOptions::iterations`.
     */
    int average_iterations = 10;

    /**
     * Maximum number of iterations of the Lloyd algorithm, see `RefineLloydOptions::max_iterations`.
     */
    int max_iterations = 300;

    /**
     * Convergence threshold on the movement of the centers, see `RefineLloydOptions::tolerance`.
     */
    double tolerance = 1e-6;

    /**
     * Number of restarts with different seeds.
     * The restart with the lowest inertia is reported.
     */
    int num_init = 1;

    /**
     * Seed for the first restart.
     * Restart `i` uses a seed of `seed + i`.
     */
    std::uint64_t seed = 6523;

    /**
     * Number of threads to use.
     */
    int num_threads = 1;

    /**
     * Whether to report progress at the info level.
     */
    bool verbose = false;
};

/**
 * @brief Options for `fit_kmedoids()`.
 *
 * Centers are always the medoids of their clusters.
 */
struct KmedoidsOptions {
    /**
     * Number of clusters.
     * This should be positive and no greater than the number of series.
     */
    int num_centers = 8;

    /**
     * Initialization method.
     */
    InitMethod init_method = InitMethod::KMEANSPP;

    /**
     * Distance between time series.
     */
    DistanceOptions distance;

    /**
     * Maximum number of iterations of the Lloyd algorithm.
     */
    int max_iterations = 300;

    /**
     * Convergence threshold on the movement of the centers.
     */
    double tolerance = 1e-6;

    /**
     * Number of restarts with different seeds.
     */
    int num_init = 1;

    /**
     * Seed for the first restart.
     */
    std::uint64_t seed = 6523;

    /**
     * Number of threads to use.
     */
    int num_threads = 1;

    /**
     * Whether to report progress at the info level.
     */
    bool verbose = false;
};

/**
 * @param name Name of the initialization method, one of `"random"`, `"forgy"` or `"kmeans++"`.
 * @return The corresponding `InitMethod`.
 */
inline InitMethod parse_init_method(const std::string& name) {
    if (name == "random") {
        return InitMethod::RANDOM;
    } else if (name == "forgy") {
        return InitMethod::FORGY;
    } else if (name == "kmeans++") {
        return InitMethod::KMEANSPP;
    }
    throw InvalidParameter("unknown initialization method '" + name + "'");
}

/**
 * @param name Name of the distance, one of `"euclidean"`, `"dtw"`, `"ddtw"`, `"wdtw"`, `"wddtw"`, `"lcss"`, `"erp"`, `"msm"` or `"twe"`.
 * @return The corresponding `DistanceMethod`.
 */
inline DistanceMethod parse_distance_method(const std::string& name) {
    if (name == "euclidean") {
        return DistanceMethod::EUCLIDEAN;
    } else if (name == "dtw") {
        return DistanceMethod::DTW;
    } else if (name == "ddtw") {
        return DistanceMethod::DDTW;
    } else if (name == "wdtw") {
        return DistanceMethod::WDTW;
    } else if (name == "wddtw") {
        return DistanceMethod::WDDTW;
    } else if (name == "lcss") {
        return DistanceMethod::LCSS;
    } else if (name == "erp") {
        return DistanceMethod::ERP;
    } else if (name == "msm") {
        return DistanceMethod::MSM;
    } else if (name == "twe") {
        return DistanceMethod::TWE;
    }
    throw InvalidParameter("unknown distance '" + name + "'");
}

/**
 * @param name Name of the averaging method, one of `"mean"`, `"dba"` or `"medoid"`.
 * @return The corresponding `AverageMethod`.
 */
inline AverageMethod parse_average_method(const std::string& name) {
    if (name == "mean") {
        return AverageMethod::MEAN;
    } else if (name == "dba") {
        return AverageMethod::DBA;
    } else if (name == "medoid") {
        return AverageMethod::MEDOID;
    }
    throw InvalidParameter("unknown averaging method '" + name + "'");
}

}

#endif
