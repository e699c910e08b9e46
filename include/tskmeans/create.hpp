#ifndef TSKMEANS_CREATE_HPP
#define TSKMEANS_CREATE_HPP

#include <memory>

#include "Options.hpp"
#include "errors.hpp"

#include "Distance.hpp"
#include "DistanceEuclidean.hpp"
#include "DistanceDtw.hpp"
#include "DistanceWdtw.hpp"
#include "DistanceLcss.hpp"
#include "DistanceErp.hpp"
#include "DistanceMsm.hpp"
#include "DistanceTwe.hpp"

#include "Initialize.hpp"
#include "InitializeRandom.hpp"
#include "InitializeForgy.hpp"
#include "InitializeKmeanspp.hpp"

#include "Average.hpp"
#include "AverageMean.hpp"
#include "AverageDba.hpp"
#include "AverageMedoid.hpp"

/**
 * @file create.hpp
 * @brief Create algorithm objects from their options.
 */

namespace tskmeans {

/**
 * @tparam Float_ Floating-point type of the values and distances.
 * @param options Choice of distance and its parameters.
 * @return The requested distance.
 * An `InvalidParameter` exception is thrown if the parameters are invalid.
 */
template<typename Float_>
std::shared_ptr<const Distance<Float_> > create_distance(const DistanceOptions& options) {
    switch (options.method) {
        case DistanceMethod::EUCLIDEAN:
            return std::make_shared<DistanceEuclidean<Float_> >();
        case DistanceMethod::DTW:
            {
                DistanceDtwOptions dopt;
                dopt.window = options.window;
                return std::make_shared<DistanceDtw<Float_> >(dopt);
            }
        case DistanceMethod::DDTW:
            {
                DistanceDtwOptions dopt;
                dopt.window = options.window;
                return std::make_shared<DistanceDdtw<Float_> >(dopt);
            }
        case DistanceMethod::WDTW:
            {
                DistanceWdtwOptions wopt;
                wopt.window = options.window;
                wopt.g = options.g;
                return std::make_shared<DistanceWdtw<Float_> >(wopt);
            }
        case DistanceMethod::WDDTW:
            {
                DistanceWdtwOptions wopt;
                wopt.window = options.window;
                wopt.g = options.g;
                return std::make_shared<DistanceWddtw<Float_> >(wopt);
            }
        case DistanceMethod::LCSS:
            {
                DistanceLcssOptions lopt;
                lopt.window = options.window;
                lopt.epsilon = options.epsilon;
                return std::make_shared<DistanceLcss<Float_> >(lopt);
            }
        case DistanceMethod::ERP:
            {
                DistanceErpOptions eopt;
                eopt.window = options.window;
                eopt.g = options.erp_g;
                return std::make_shared<DistanceErp<Float_> >(eopt);
            }
        case DistanceMethod::MSM:
            {
                DistanceMsmOptions mopt;
                mopt.window = options.window;
                mopt.c = options.c;
                return std::make_shared<DistanceMsm<Float_> >(mopt);
            }
        case DistanceMethod::TWE:
            {
                DistanceTweOptions topt;
                topt.window = options.window;
                topt.nu = options.nu;
                topt.lambda = options.lambda;
                return std::make_shared<DistanceTwe<Float_> >(topt);
            }
    }
    throw InvalidParameter("unknown distance");
}

/**
 * @tparam Index_ Integer type of the series indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the values and distances.
 * @param method Initialization method.
 * @param num_threads Number of threads to use.
 * @return The requested initialization algorithm.
 */
template<typename Index_, typename Cluster_, typename Float_>
std::unique_ptr<Initialize<Index_, Cluster_, Float_> > create_initialize(const InitMethod method, const int num_threads) {
    switch (method) {
        case InitMethod::RANDOM:
            return std::make_unique<InitializeRandom<Index_, Cluster_, Float_> >();
        case InitMethod::FORGY:
            return std::make_unique<InitializeForgy<Index_, Cluster_, Float_> >();
        case InitMethod::KMEANSPP:
            {
                InitializeKmeansppOptions kopt;
                kopt.num_threads = num_threads;
                return std::make_unique<InitializeKmeanspp<Index_, Cluster_, Float_> >(kopt);
            }
    }
    throw InvalidParameter("unknown initialization method");
}

/**
 * @tparam Index_ Integer type of the series indices.
 * @tparam Float_ Floating-point type of the values and distances.
 * @param method Method for computing the cluster centers.
 * @param iterations Number of refinement rounds for `AverageMethod::DBA`.
 * @param num_threads Number of threads to use.
 * @return The requested averaging method.
 */
template<typename Index_, typename Float_>
std::unique_ptr<Average<Index_, Float_> > create_average(const AverageMethod method, const int iterations, const int num_threads) {
    switch (method) {
        case AverageMethod::MEAN:
            return std::make_unique<AverageMean<Index_, Float_> >();
        case AverageMethod::DBA:
            {
                AverageDbaOptions dopt;
                dopt.iterations = iterations;
                dopt.num_threads = num_threads;
                return std::make_unique<AverageDba<Index_, Float_> >(dopt);
            }
        case AverageMethod::MEDOID:
            {
                AverageMedoidOptions mopt;
                mopt.num_threads = num_threads;
                return std::make_unique<AverageMedoid<Index_, Float_> >(mopt);
            }
    }
    throw InvalidParameter("unknown averaging method");
}

}

#endif
