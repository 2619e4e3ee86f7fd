/**
 * @file log.hpp
 * @brief Library logger.
 * @author lfqueue contributors
 * @version 0.1.0
 *
 * All diagnostics of the library go through a single spdlog logger named "lfq". It writes to
 * stderr and defaults to the warn level; the LFQ_LOG_LEVEL environment variable (trace, debug,
 * info, warn, error, critical, off) overrides the default when the logger is first created.
 *
 * Queue operations never log. The reclamation domain logs thread registration and reclamation
 * batches at debug/trace level, and @ref LFQ_CHECK failures are logged at critical level.
 */

#ifndef LFQ_LOG_HPP_
#define LFQ_LOG_HPP_

#include <memory>

#include <spdlog/spdlog.h>

namespace lfq {

/** @brief Name under which the library logger is registered with spdlog. */
inline constexpr const char* kLoggerName = "lfq";

/**
 * @brief Return the library logger, creating it on first use.
 *
 * If a logger named @ref kLoggerName is already registered with spdlog (for example one the
 * application set up with its own sinks), that logger is used as is.
 */
std::shared_ptr<spdlog::logger> logger();

/** @brief Change the level of the library logger. */
void set_log_level(spdlog::level::level_enum level);

}  // namespace lfq

#endif  // LFQ_LOG_HPP_
