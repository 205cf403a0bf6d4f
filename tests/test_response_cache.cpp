#include "errors.hpp"
#include "log.hpp"
#include "response_cache.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace sgf;
namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const std::string &name) {
  auto dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

CacheEntry sample_entry(const std::string &body) {
  CacheEntry entry;
  entry.status = 200;
  entry.headers = {"Content-Type: application/json",
                   "Link: <https://api.github.com/x?page=2>; rel=\"next\""};
  entry.body = body;
  entry.stored_at = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(1700000000123LL));
  return entry;
}

} // namespace

TEST_CASE("response cache stores and returns entries") {
  auto root = fresh_dir("sgf_cache_roundtrip");
  ResponseCache cache(root);
  RequestIdentity id{"GET", "https://api.github.com/repos/o/r/stargazers", ""};

  CHECK_FALSE(cache.get("o/r", id));
  cache.put("o/r", id, sample_entry("[1,2,3]"));

  auto entry = cache.get("o/r", id);
  REQUIRE(entry);
  CHECK(entry->status == 200);
  CHECK(entry->body == "[1,2,3]");
  CHECK(entry->headers.size() == 2);
  CHECK(entry->stored_at == sample_entry("").stored_at);

  cache.put("o/r", id, sample_entry("[4]"));
  CHECK(cache.get("o/r", id)->body == "[4]");
  fs::remove_all(root);
}

TEST_CASE("response cache keys by query and accept override") {
  auto root = fresh_dir("sgf_cache_keys");
  ResponseCache cache(root);
  RequestIdentity page1{"GET", "https://api.github.com/repos/o/r/stargazers",
                        ""};
  RequestIdentity page2{
      "GET", "https://api.github.com/repos/o/r/stargazers?page=2", ""};
  RequestIdentity starred{"GET", page1.url,
                          "application/vnd.github.v3.star+json"};

  CHECK(cache.record_path("o/r", page1) != cache.record_path("o/r", page2));
  CHECK(cache.record_path("o/r", page1) != cache.record_path("o/r", starred));

  cache.put("o/r", page1, sample_entry("\"p1\""));
  cache.put("o/r", starred, sample_entry("\"starred\""));
  CHECK(cache.get("o/r", page1)->body == "\"p1\"");
  CHECK(cache.get("o/r", starred)->body == "\"starred\"");
  CHECK_FALSE(cache.get("o/r", page2));
  fs::remove_all(root);
}

TEST_CASE("response cache lays records out per repository") {
  ResponseCache cache("/cache");
  RequestIdentity id{"GET",
                     "https://api.github.com/repos/o/r/stargazers?page=2", ""};
  auto path = cache.record_path("o/r", id);
  CHECK(path.generic_string() ==
        "/cache/o/r/api.github.com/repos/o/r/stargazers/GET@page=2.json");
  CHECK_THROWS_AS(cache.record_path("../x", id), std::invalid_argument);
  CHECK_THROWS_AS(cache.record_path("", id), std::invalid_argument);
  CHECK_THROWS_AS(
      cache.record_path("o/r", RequestIdentity{"GET", "/relative", ""}),
      std::invalid_argument);
}

TEST_CASE("response cache discards unreadable records") {
  auto root = fresh_dir("sgf_cache_corrupt");
  ResponseCache cache(root);
  RequestIdentity id{"GET", "https://api.github.com/users/u", ""};
  cache.put("o/r", id, sample_entry("{}"));
  auto path = cache.record_path("o/r", id);
  {
    std::ofstream out(path, std::ios::trunc);
    out << "{\"status\": 200, \"hea";
  }
  CHECK_FALSE(cache.get("o/r", id));
  CHECK_FALSE(fs::exists(path));
  fs::remove_all(root);
}

TEST_CASE("response cache invalidates and clears") {
  auto root = fresh_dir("sgf_cache_clear");
  ResponseCache cache(root);
  RequestIdentity a{"GET", "https://api.github.com/repos/o/r/stargazers", ""};
  RequestIdentity b{"GET", "https://api.github.com/users/u", ""};
  cache.put("o/r", a, sample_entry("[]"));
  cache.put("o/r", b, sample_entry("{}"));
  cache.put("o/other", a, sample_entry("[]"));

  CHECK(cache.invalidate("o/r", a));
  CHECK_FALSE(cache.invalidate("o/r", a));
  CHECK_FALSE(cache.get("o/r", a));

  CHECK(cache.clear_scope("o/r") > 0);
  CHECK_FALSE(cache.get("o/r", b));
  CHECK(cache.get("o/other", a));
  CHECK(cache.clear_scope("o/missing") == 0);
  fs::remove_all(root);
}

TEST_CASE("response cache reports unwritable roots") {
  auto root = fresh_dir("sgf_cache_blocked");
  fs::create_directories(root.parent_path());
  {
    std::ofstream blocker(root);
    blocker << "not a directory";
  }
  ResponseCache cache(root);
  RequestIdentity id{"GET", "https://api.github.com/users/u", ""};
  CHECK_THROWS_AS(cache.put("o/r", id, sample_entry("{}")), CacheIoError);
  fs::remove(root);
}

TEST_CASE("response cache replaces invalid UTF-8 and warns") {
  auto root = fresh_dir("sgf_cache_utf8");
  auto log_path = fs::temp_directory_path() / "sgf_cache_utf8.log";
  fs::remove(log_path);
  init_logger(spdlog::level::info, "", log_path.string(), 0);

  ResponseCache cache(root);
  RequestIdentity id{"GET", "https://api.github.com/users/u", ""};
  cache.put("o/r", id, sample_entry("[\"ok\"]"));
  cache.put("o/r", id, sample_entry("[\"\xff\"]"));
  auto entry = cache.get("o/r", id);
  REQUIRE(entry);
  CHECK(entry->body == "[\"\xEF\xBF\xBD\"]");
  spdlog::apply_all([](const std::shared_ptr<spdlog::logger> &l) { l->flush(); });

  std::ifstream in(log_path);
  std::string log((std::istreambuf_iterator<char>(in)),
                  std::istreambuf_iterator<char>());
  CHECK(log.find("not valid UTF-8") != std::string::npos);
  CHECK(log.find("https://api.github.com/users/u") != std::string::npos);

  init_logger(spdlog::level::info);
  fs::remove(log_path);
  fs::remove_all(root);
}
