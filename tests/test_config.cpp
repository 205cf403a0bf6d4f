#include "config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace std::chrono;

TEST_CASE("config defaults") {
  sgf::Config cfg;
  CHECK(cfg.api_base() == "https://api.github.com");
  CHECK(cfg.cache_dir() == "./stargazer_cache");
  CHECK(cfg.user_agent() == "stargazers-fetch");
  CHECK(cfg.max_attempts() == 10);
  CHECK(cfg.backoff_initial() == milliseconds{50});
  CHECK(cfg.backoff_max() == milliseconds{1000});
  CHECK(cfg.rate_limit_padding() == milliseconds{1000});
  CHECK(cfg.http_timeout() == milliseconds{30000});
  CHECK(cfg.log_level() == "info");
  CHECK(cfg.log_rotate() == 3);
  CHECK_FALSE(cfg.log_compress());
  CHECK(cfg.token().empty());
}

TEST_CASE("config loads sectioned YAML") {
  auto path = std::filesystem::temp_directory_path() / "sgf_cfg.yaml";
  {
    std::ofstream f(path);
    f << "github:\n";
    f << "  token: abc123\n";
    f << "  api_base: https://ghe.example/api/v3\n";
    f << "  user_agent: stars-bot\n";
    f << "cache:\n";
    f << "  cache_dir: /var/cache/stars\n";
    f << "http:\n";
    f << "  http_timeout: 5s\n";
    f << "  http_proxy: http://proxy\n";
    f << "  https_proxy: http://secureproxy\n";
    f << "retry:\n";
    f << "  max_attempts: 4\n";
    f << "  backoff_initial: 25ms\n";
    f << "  backoff_max: 2s\n";
    f << "  rate_limit_padding: 1500\n";
    f << "logging:\n";
    f << "  log_level: debug\n";
    f << "  log_rotate: 5\n";
    f << "  log_compress: true\n";
    f << "  log_categories:\n";
    f << "    cache: trace\n";
    f << "    http:\n";
  }
  auto cfg = sgf::Config::from_file(path.string());
  CHECK(cfg.token() == "abc123");
  CHECK(cfg.api_base() == "https://ghe.example/api/v3");
  CHECK(cfg.user_agent() == "stars-bot");
  CHECK(cfg.cache_dir() == "/var/cache/stars");
  CHECK(cfg.http_timeout() == milliseconds{5000});
  CHECK(cfg.http_proxy() == "http://proxy");
  CHECK(cfg.https_proxy() == "http://secureproxy");
  CHECK(cfg.max_attempts() == 4);
  CHECK(cfg.backoff_initial() == milliseconds{25});
  CHECK(cfg.backoff_max() == milliseconds{2000});
  CHECK(cfg.rate_limit_padding() == milliseconds{1500});
  CHECK(cfg.log_level() == "debug");
  CHECK(cfg.log_rotate() == 5);
  CHECK(cfg.log_compress());
  REQUIRE(cfg.log_categories().size() == 2);
  CHECK(cfg.log_categories().at("cache") == "trace");
  CHECK(cfg.log_categories().at("http") == "debug");
  std::filesystem::remove(path);
}

TEST_CASE("config loads flat TOML") {
  auto path = std::filesystem::temp_directory_path() / "sgf_cfg.toml";
  {
    std::ofstream f(path);
    f << "token = \"tok\"\n";
    f << "cache_dir = \"cache\"\n";
    f << "max_attempts = 3\n";
    f << "backoff_initial = \"100ms\"\n";
    f << "log_categories = [\"fetcher=warn\", \"backoff\"]\n";
  }
  auto cfg = sgf::Config::from_file(path.string());
  CHECK(cfg.token() == "tok");
  CHECK(cfg.cache_dir() == "cache");
  CHECK(cfg.max_attempts() == 3);
  CHECK(cfg.backoff_initial() == milliseconds{100});
  CHECK(cfg.log_categories().at("fetcher") == "warn");
  CHECK(cfg.log_categories().at("backoff") == "debug");
  std::filesystem::remove(path);
}

TEST_CASE("config loads JSON") {
  auto path = std::filesystem::temp_directory_path() / "sgf_cfg.json";
  {
    nlohmann::json doc;
    doc["retry"] = {{"max_attempts", 0}, {"backoff_max", "1m"}};
    doc["logging"] = {{"log_file", "fetch.log"}, {"log_rotate", 0}};
    std::ofstream f(path);
    f << doc.dump();
  }
  auto cfg = sgf::Config::from_file(path.string());
  CHECK(cfg.max_attempts() == 1);
  CHECK(cfg.backoff_max() == milliseconds{60000});
  CHECK(cfg.log_file() == "fetch.log");
  CHECK(cfg.log_rotate() == 0);
  std::filesystem::remove(path);
}

TEST_CASE("config rejects bad input") {
  CHECK_THROWS_AS(sgf::Config::from_file("settings.ini"), std::runtime_error);
  CHECK_THROWS_AS(sgf::Config::from_file("no_extension"), std::runtime_error);
  CHECK_THROWS_AS(
      sgf::Config::from_json(nlohmann::json{{"backoff_initial", "soon"}}),
      std::runtime_error);
  CHECK_THROWS_AS(
      sgf::Config::from_json(nlohmann::json{{"backoff_initial", -5}}),
      std::runtime_error);
  CHECK_THROWS(sgf::Config::from_json(nlohmann::json{{"max_attempts", "x"}}));
}
