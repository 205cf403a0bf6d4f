#include "link_header.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace sgf;

TEST_CASE("next_page_cursor follows GitHub pagination headers") {
  const std::string header =
      "<https://api.github.com/repositories/1/stargazers?page=2>; "
      "rel=\"next\", "
      "<https://api.github.com/repositories/1/stargazers?page=5>; "
      "rel=\"last\"";
  auto next = next_page_cursor(header);
  REQUIRE(next);
  CHECK(*next == "https://api.github.com/repositories/1/stargazers?page=2");
}

TEST_CASE("next_page_cursor is empty on the last page") {
  const std::string header =
      "<https://api.github.com/x?page=1>; rel=\"first\", "
      "<https://api.github.com/x?page=4>; rel=\"prev\"";
  CHECK_FALSE(next_page_cursor(header));
  CHECK_FALSE(next_page_cursor(""));
}

TEST_CASE("next_page_cursor ignores malformed headers") {
  CHECK_FALSE(next_page_cursor("garbage"));
  CHECK_FALSE(next_page_cursor("<https://x?page=2>; rel=\"next\""
                               " trailing"));
  CHECK_FALSE(next_page_cursor("<https://x?page=2; rel=\"next\""));
  CHECK_FALSE(next_page_cursor("<>; rel=\"next\""));
  CHECK_FALSE(next_page_cursor("<https://x?page=2>; rel=\"next"));
}

TEST_CASE("next_page_cursor does not depend on link order") {
  const std::string header = "<https://x?page=9>; rel=\"last\", "
                             "<https://x?page=3>; rel=\"next\"";
  auto next = next_page_cursor(header);
  REQUIRE(next);
  CHECK(*next == "https://x?page=3");
}

TEST_CASE("parse_link_header handles parameters and relation lists") {
  auto links = parse_link_header(
      "<https://x/a>; title=\"a, b\"; REL=\"prev first\",<https://x/b>;rel=next");
  REQUIRE(links);
  REQUIRE(links->size() == 2);
  CHECK((*links)[0].uri == "https://x/a");
  CHECK((*links)[0].rel == std::vector<std::string>{"prev", "first"});
  CHECK((*links)[1].uri == "https://x/b");
  CHECK((*links)[1].rel == std::vector<std::string>{"next"});
}

TEST_CASE("cursor_from_headers matches the header name case-insensitively") {
  std::vector<std::string> headers = {
      "Content-Type: application/json",
      "link: <https://x?page=2>; rel=\"next\""};
  auto next = cursor_from_headers(headers);
  REQUIRE(next);
  CHECK(*next == "https://x?page=2");
  CHECK_FALSE(cursor_from_headers({"Content-Type: application/json"}));
}
