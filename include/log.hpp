/**
 * @file log.hpp
 * @brief Logging utilities for prwatch.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration. Diagnostics go to stderr so that stdout stays reserved for
 * status-change notifications and command output.
 */

#ifndef PRWATCH_LOG_HPP
#define PRWATCH_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace prw {

/**
 * Initialize the global logger with a stderr sink and an optional file sink.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path. When empty no file output is
 *        configured.
 * @param rotate_files Maximum number of rotated files to retain when
 *        @p file is provided. Zero selects a plain append-only file.
 * @param compress_rotations Whether rotated log files should be gzip
 *        compressed automatically.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers are registered as `prw.<category>` and share sinks with
 * the default logger so messages appear in the same destinations.
 *
 * @param category Category name such as `watcher` or `github.client`.
 * @return Shared pointer to the category logger.
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
 * Ensure a default logger exists before logging.
 *
 * Creates one on demand when the logging subsystem has not been explicitly
 * initialized, which is the case for unit tests and early startup code.
 */
void ensure_default_logger();

} // namespace prw

#endif // PRWATCH_LOG_HPP
