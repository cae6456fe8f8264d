/**
 * @file log.hpp
 * @brief Logging utilities for autogitsquash.
 *
 * Declares logger initialization, category loggers, and category level
 * overrides built on spdlog.
 */

#ifndef AUTOGITSQUASH_LOG_HPP
#define AUTOGITSQUASH_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace agsq {

/**
 * Install the default `agsq` logger with a console sink and an optional file
 * sink.
 *
 * Calling this again replaces the sinks of the existing logger so that a
 * logger created lazily before configuration was read picks up the final
 * destinations.
 *
 * @param level Verbosity applied to the default logger and all categories.
 * @param pattern spdlog pattern; an empty string keeps the spdlog default.
 * @param file Optional log file. When empty only the console is used.
 * @param rotate_files Rotated files to keep for @p file (0 disables rotation).
 * @param compress_rotations Gzip rotated files when rotation is enabled.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create the logger for a category (`agsq.<category>`).
 *
 * Category loggers share the sinks of the default logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/// Apply per-category level overrides.
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure the default logger exists, creating an info-level console logger on
 * demand.
 */
void ensure_default_logger();

} // namespace agsq

#endif // AUTOGITSQUASH_LOG_HPP
