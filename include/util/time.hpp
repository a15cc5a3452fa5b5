/**
 * @file time.hpp
 * @brief Timestamp formatting and parsing helpers.
 *
 * The state file and webhook payloads carry RFC 3339 timestamps; the `list`
 * command shows local wall-clock minutes.
 */
#ifndef PRWATCH_UTIL_TIME_HPP
#define PRWATCH_UTIL_TIME_HPP

#include <chrono>
#include <optional>
#include <string>

namespace prw {

/**
 * Format a time point as an RFC 3339 UTC timestamp (`2024-05-01T12:00:00Z`).
 *
 * @param tp Time point to format; sub-second precision is dropped.
 * @return Formatted timestamp.
 */
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

/**
 * Parse an RFC 3339 timestamp.
 *
 * Accepts optional fractional seconds and either a `Z` suffix or a numeric
 * `+HH:MM`/`-HH:MM` offset. Timestamps in year 1 or earlier denote "never"
 * and map to the default-constructed time point.
 *
 * @param text Timestamp text.
 * @return Parsed time point, or std::nullopt when @p text is malformed.
 */
std::optional<std::chrono::system_clock::time_point>
parse_rfc3339(const std::string &text);

/**
 * Format a time point in local time as `YYYY-MM-DD HH:MM`.
 */
std::string format_local_minutes(std::chrono::system_clock::time_point tp);

} // namespace prw

#endif // PRWATCH_UTIL_TIME_HPP
