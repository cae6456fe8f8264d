/**
 * @file duration.hpp
 * @brief Human-readable duration parsing and formatting.
 *
 * Squash windows, age limits, and command timeouts are configured as
 * duration strings ("14d", "1h30m") or plain seconds.
 */
#ifndef AUTOGITSQUASH_UTIL_DURATION_HPP
#define AUTOGITSQUASH_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace agsq {

/**
 * Parse a duration string such as "10s", "5m", "2h", "3d", "1w" or "1h30m"
 * into seconds. Units may be combined; a bare number means seconds.
 *
 * @param str Duration string; an empty string yields zero.
 * @return Parsed duration.
 * @throws std::runtime_error On an invalid format or unit suffix.
 */
std::chrono::seconds parse_duration(const std::string &str);

/**
 * Render @p value using the largest whole units, e.g. 1209600s -> "2w",
 * 5400s -> "1h30m". Zero renders as "0s".
 */
std::string format_duration(std::chrono::seconds value);

} // namespace agsq

#endif // AUTOGITSQUASH_UTIL_DURATION_HPP
