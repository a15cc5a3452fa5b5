/**
 * @file version.hpp
 * @brief Build version information.
 *
 * PRWATCH_VERSION and PRWATCH_COMMIT are supplied by the build system.
 */
#ifndef PRWATCH_VERSION_HPP
#define PRWATCH_VERSION_HPP

#include <string>
#include <string_view>

#ifndef PRWATCH_VERSION
#define PRWATCH_VERSION "0.0.0-dev"
#endif

#ifndef PRWATCH_COMMIT
#define PRWATCH_COMMIT "unknown"
#endif

namespace prw {

inline constexpr const char *kVersion = PRWATCH_VERSION;
inline constexpr const char *kCommit = PRWATCH_COMMIT;

/**
 * Format a version for display.
 *
 * @param version Release version.
 * @param commit Source commit; omitted when empty or `unknown`, otherwise
 *        shortened to seven characters.
 * @return `version` or `version (abcdef1)`.
 */
std::string version_string(std::string_view version = kVersion,
                           std::string_view commit = kCommit);

} // namespace prw

#endif // PRWATCH_VERSION_HPP
