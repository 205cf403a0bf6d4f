#include "errors.hpp"
#include "request_executor.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace sgf;
namespace fs = std::filesystem;

class ScriptedHttpClient : public HttpClient {
public:
  HttpResponse response;
  bool fail = false;
  int calls = 0;
  std::vector<std::string> last_headers;

  HttpResponse get_with_headers(const std::string &url,
                                const std::vector<std::string> &headers) override {
    ++calls;
    last_headers = headers;
    if (fail) {
      throw TransientNetworkError("curl GET " + url + " failed: timeout");
    }
    return response;
  }
};

namespace {

bool has_header(const std::vector<std::string> &headers,
                const std::string &line) {
  return std::find(headers.begin(), headers.end(), line) != headers.end();
}

FetchContext make_ctx(const fs::path &dir) {
  FetchContext ctx;
  ctx.repo = "o/r";
  ctx.token = "secret";
  ctx.cache_dir = dir;
  return ctx;
}

} // namespace

TEST_CASE("request headers carry agent, encoding, token and accept") {
  ScriptedHttpClient http;
  RequestExecutor executor(http, "sgf-test");
  FetchContext ctx = make_ctx("/unused");
  RequestIdentity id{"GET", "https://api.github.com/x", ""};

  auto headers = executor.request_headers(ctx, id);
  CHECK(has_header(headers, "User-Agent: sgf-test"));
  CHECK(has_header(headers, "Accept-Encoding: gzip"));
  CHECK(has_header(headers, "Authorization: token secret"));
  CHECK(std::none_of(headers.begin(), headers.end(), [](const std::string &h) {
    return h.rfind("Accept:", 0) == 0;
  }));

  id.accept = "application/vnd.github.v3.star+json";
  ctx.token.clear();
  headers = executor.request_headers(ctx, id);
  CHECK(has_header(headers, "Accept: application/vnd.github.v3.star+json"));
  CHECK(std::none_of(headers.begin(), headers.end(), [](const std::string &h) {
    return h.rfind("Authorization:", 0) == 0;
  }));
}

TEST_CASE("classify maps statuses to outcomes") {
  const std::string url = "https://api.github.com/x";
  HttpResponse ok{"[]", {"Link: <https://x?page=2>; rel=\"next\""}, 200};
  auto outcome = RequestExecutor::classify(url, ok);
  CHECK(outcome.kind == OutcomeKind::Success);
  CHECK(outcome.entry.body == "[]");
  CHECK(outcome.entry.headers == ok.headers);

  HttpResponse accepted{"{}", {}, 202};
  CHECK(RequestExecutor::classify(url, accepted).kind ==
        OutcomeKind::Transient);

  HttpResponse limited{"",
                       {"X-RateLimit-Remaining: 0",
                        "X-RateLimit-Reset: 1700000000"},
                       403};
  outcome = RequestExecutor::classify(url, limited);
  REQUIRE(outcome.kind == OutcomeKind::RateLimited);
  CHECK(outcome.reset_at == std::chrono::system_clock::time_point(
                                std::chrono::seconds(1700000000)));

  HttpResponse forbidden{"{\"message\":\"denied\"}",
                         {"X-RateLimit-Remaining: 42"},
                         403};
  outcome = RequestExecutor::classify(url, forbidden);
  CHECK(outcome.kind == OutcomeKind::Permanent);
  CHECK(outcome.status == 403);

  HttpResponse no_reset{"", {"X-RateLimit-Remaining: 0"}, 403};
  CHECK(RequestExecutor::classify(url, no_reset).kind ==
        OutcomeKind::Permanent);

  HttpResponse missing{"{\"message\":\"Not Found\"}", {}, 404};
  outcome = RequestExecutor::classify(url, missing);
  CHECK(outcome.kind == OutcomeKind::Permanent);
  CHECK(outcome.status == 404);
  CHECK(outcome.diagnostic.find("HTTP 404") != std::string::npos);
  CHECK(outcome.diagnostic.find(url) != std::string::npos);

  HttpResponse server_error{"", {}, 500};
  CHECK(RequestExecutor::classify(url, server_error).kind ==
        OutcomeKind::Permanent);
}

TEST_CASE("classify rejects implausible rate limit resets") {
  const std::string url = "https://api.github.com/x";
  for (const std::string reset : {"99999999999", "-5"}) {
    HttpResponse limited{"",
                         {"X-RateLimit-Remaining: 0",
                          "X-RateLimit-Reset: " + reset},
                         403};
    auto outcome = RequestExecutor::classify(url, limited);
    CHECK(outcome.kind == OutcomeKind::Permanent);
    CHECK(outcome.status == 403);
  }

  auto soon = std::chrono::duration_cast<std::chrono::seconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count() +
              3600;
  HttpResponse limited{"",
                       {"X-RateLimit-Remaining: 0",
                        "X-RateLimit-Reset: " + std::to_string(soon)},
                       403};
  CHECK(RequestExecutor::classify(url, limited).kind ==
        OutcomeKind::RateLimited);
}

TEST_CASE("execute caches successful responses only") {
  auto dir = fs::temp_directory_path() / "sgf_executor_cache";
  fs::remove_all(dir);
  ScriptedHttpClient http;
  RequestExecutor executor(http);
  ResponseCache cache(dir);
  FetchContext ctx = make_ctx(dir);
  RequestIdentity ok_id{"GET", "https://api.github.com/ok", ""};
  RequestIdentity missing_id{"GET", "https://api.github.com/missing", ""};

  http.response = {"{\"a\":1}", {"Content-Type: application/json"}, 200};
  auto outcome = executor.execute(ctx, ok_id, cache);
  CHECK(outcome.kind == OutcomeKind::Success);
  auto cached = cache.get("o/r", ok_id);
  REQUIRE(cached);
  CHECK(cached->body == "{\"a\":1}");

  http.response = {"{}", {}, 404};
  outcome = executor.execute(ctx, missing_id, cache);
  CHECK(outcome.kind == OutcomeKind::Permanent);
  CHECK_FALSE(cache.get("o/r", missing_id));
  fs::remove_all(dir);
}

TEST_CASE("execute turns transport failures into transient outcomes") {
  ScriptedHttpClient http;
  http.fail = true;
  RequestExecutor executor(http);
  ResponseCache cache(fs::temp_directory_path() / "sgf_executor_unused");
  auto outcome = executor.execute(
      make_ctx(cache.root()),
      RequestIdentity{"GET", "https://api.github.com/x", ""}, cache);
  CHECK(outcome.kind == OutcomeKind::Transient);
  CHECK(outcome.diagnostic.find("timeout") != std::string::npos);
  CHECK(http.calls == 1);
}
