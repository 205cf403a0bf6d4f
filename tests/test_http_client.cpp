#include "errors.hpp"
#include "http_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace sgf;

TEST_CASE("find_header matches names case-insensitively and trims values") {
  std::vector<std::string> headers = {
      "Content-Type: application/json; charset=utf-8",
      "x-ratelimit-remaining:   0  ",
      "X-RateLimit-Reset: 1700000000"};
  CHECK(find_header(headers, "content-type") ==
        std::optional<std::string>("application/json; charset=utf-8"));
  CHECK(find_header(headers, "X-RateLimit-Remaining") ==
        std::optional<std::string>("0"));
  CHECK(find_header(headers, "x-ratelimit-reset") ==
        std::optional<std::string>("1700000000"));
  CHECK_FALSE(find_header(headers, "Link"));
  CHECK_FALSE(find_header(headers, "X-RateLimit"));
}

TEST_CASE("CurlHttpClient configuration") {
  CurlHttpClient client(1000, "http://proxy", "http://secureproxy");
  CHECK(client.http_proxy() == "http://proxy");
  CHECK(client.https_proxy() == "http://secureproxy");
}

TEST_CASE("CurlHttpClient reports connection failures as transient") {
  CurlHttpClient client(2000);
  CHECK_THROWS_AS(client.get_with_headers("http://127.0.0.1:1/", {}),
                  TransientNetworkError);
}
