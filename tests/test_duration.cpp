#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>

using namespace sgf;
using namespace std::chrono;

TEST_CASE("parse_duration supports combined units") {
  CHECK(parse_duration("50ms") == milliseconds{50});
  CHECK(parse_duration("1s") == milliseconds{1000});
  CHECK(parse_duration("1m30s") == milliseconds{90 * 1000});
  CHECK(parse_duration("1h30m") == milliseconds{(3600 + 30 * 60) * 1000LL});
  CHECK(parse_duration("1d2s5ms") == milliseconds{86400 * 1000LL + 2005});
  CHECK(parse_duration("250") == milliseconds{250});
  CHECK(parse_duration("") == milliseconds{0});
}

TEST_CASE("parse_duration rejects invalid strings") {
  CHECK_THROWS_AS(parse_duration("1s30"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("abc"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("1.5s"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("5x"), std::runtime_error);
}
