/**
 * @file duration.hpp
 * @brief Human-readable duration parsing utilities.
 *
 * Parses duration strings such as "50ms", "1s" or "1h30m" into
 * std::chrono::milliseconds for configuration values.
 */
#ifndef STARGAZERS_FETCH_UTIL_DURATION_HPP
#define STARGAZERS_FETCH_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace sgf {

/**
 * Parse a duration string into milliseconds.
 *
 * Supported units are `ms`, `s`, `m`, `h` and `d`; several number/unit pairs
 * may be combined ("1m30s"). A bare number is interpreted as milliseconds.
 *
 * @param str Duration string; an empty string yields zero.
 * @return Parsed duration.
 * @throws std::runtime_error On an invalid format or unit.
 */
std::chrono::milliseconds parse_duration(const std::string &str);

} // namespace sgf

#endif // STARGAZERS_FETCH_UTIL_DURATION_HPP
