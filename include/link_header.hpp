/**
 * @file link_header.hpp
 * @brief Parser for the pagination `Link` response header.
 */
#ifndef STARGAZERS_FETCH_LINK_HEADER_HPP
#define STARGAZERS_FETCH_LINK_HEADER_HPP

#include <optional>
#include <string>
#include <vector>

namespace sgf {

/// One `<uri>; rel="..."` element of a `Link` header.
struct LinkValue {
  std::string uri;              ///< Target URI between the angle brackets
  std::vector<std::string> rel; ///< Relation types, lower-cased
};

/**
 * Parse a `Link` header value into its link-values.
 *
 * Grammar (whitespace allowed around separators):
 *
 *     links  = link *( "," link )
 *     link   = "<" uri ">" *( ";" param )
 *     param  = token "=" ( token | quoted-string )
 *
 * @param value Raw header value, e.g.
 *        `<https://x?page=2>; rel="next", <https://x?page=5>; rel="last"`.
 * @return Parsed links, or std::nullopt when the value is malformed.
 */
std::optional<std::vector<LinkValue>> parse_link_header(const std::string &value);

/**
 * Extract the next-page cursor from a `Link` header value.
 *
 * @param value Raw header value; may be empty.
 * @return URI of the `rel="next"` link. Empty when the header is absent,
 *         malformed, or carries no next relation.
 */
std::optional<std::string> next_page_cursor(const std::string &value);

/**
 * Extract the next-page cursor from a set of response headers.
 *
 * @param headers Response headers formatted as `Name: value`.
 */
std::optional<std::string>
cursor_from_headers(const std::vector<std::string> &headers);

} // namespace sgf

#endif // STARGAZERS_FETCH_LINK_HEADER_HPP
