/**
 * @file log.hpp
 * @brief Internal diagnostics of the HuntGlitch client.
 *
 * The library logs through its own `huntglitch` logger and its
 * `huntglitch.<category>` children. These loggers are private to the
 * library: they are not registered with spdlog, use their own thread pool,
 * and never replace the process-wide default logger. Embedding the client
 * therefore leaves the host's spdlog setup untouched. Only an executable
 * that owns the process (the `huntglitch` tool) calls
 * install_default_logger().
 *
 * Until init_logger() is called the loggers write warnings and above to
 * stderr.
 */

#ifndef HUNTGLITCH_LOG_HPP
#define HUNTGLITCH_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace hgl {

/**
 * Configure level, pattern and destinations of the client loggers.
 *
 * May be called again later; the new sinks replace the previous ones for
 * every existing client logger and the level is applied to all of them.
 *
 * @param level Verbosity of the root and every category logger.
 * @param pattern spdlog pattern; empty keeps the current formatting.
 * @param file Optional log file written in addition to stderr.
 * @param rotate_files Rotated files kept for @p file; zero writes a single
 *        non-rotating file.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3);

/// The `huntglitch` root logger, created on first use.
std::shared_ptr<spdlog::logger> root_logger();

/**
 * Logger for one area of the client, named `huntglitch.<category>`.
 *
 * Shares the root's destinations and starts at the root's level.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Make the root logger spdlog's default logger.
 *
 * Only for executables that own the process; library code never calls it.
 */
void install_default_logger();

/**
 * Drain queued messages, flush every destination and stop the logging
 * thread. Call once before the process exits.
 */
void shutdown_logging();

} // namespace hgl

#endif // HUNTGLITCH_LOG_HPP
