#ifndef TSKMEANS_LOGGING_HPP
#define TSKMEANS_LOGGING_HPP

#include <memory>
#include <mutex>

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

/**
 * @file logging.hpp
 * @brief Logger for progress reports.
 */

namespace tskmeans {

/**
 * Name of the **spdlog** logger used by this library.
 * Applications can retrieve it with `spdlog::get()` to change its level or sinks.
 */
inline constexpr const char* logger_name = "tskmeans";

/**
 * @return The library's logger.
 * This is created on first use with a colored stdout sink, unless the application has already registered a logger named `logger_name`.
 */
inline std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> output;
    std::call_once(flag, []() -> void {
        output = spdlog::get(logger_name);
        if (!output) {
            output = spdlog::stdout_color_mt(logger_name);
        }
    });
    return output;
}

/**
 * @cond
 */
namespace internal {

inline spdlog::level::level_enum progress_level(const bool verbose) {
    return (verbose ? spdlog::level::info : spdlog::level::debug);
}

}
/**
 * @endcond
 */

}

#endif
