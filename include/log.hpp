/**
 * @file log.hpp
 * @brief Logging utilities for stargazers-fetch.
 *
 * Declares logger initialization, per-component category loggers, and
 * category level overrides.
 */

#ifndef STARGAZERS_FETCH_LOG_HPP
#define STARGAZERS_FETCH_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace sgf {

/**
 * Initialize the default logger with a console sink and an optional rotating
 * file sink.
 *
 * @param level Logging verbosity applied to the default logger.
 * @param pattern spdlog pattern; an empty string keeps the spdlog default.
 * @param file Optional log file path. No file output when empty.
 * @param rotate_files Number of rotated files kept beside @p file. Zero
 *        writes a single non-rotating file.
 * @param compress_rotations Gzip rotated files when true.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create the logger for a component.
 *
 * Category loggers share the sinks of the default logger and are registered
 * as `sgf.<category>`.
 *
 * @param category Component name, e.g. "fetcher" or "cache".
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

/// Create the default logger on demand when init_logger() was never called.
void ensure_default_logger();

} // namespace sgf

#endif // STARGAZERS_FETCH_LOG_HPP
