#include "request_executor.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <chrono>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace sgf {

namespace {

constexpr std::size_t kBodyExcerpt = 200;

// Reset times further ahead than this are not trusted.
constexpr std::chrono::hours kMaxResetHorizon{24};

std::shared_ptr<spdlog::logger> executor_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("executor");
  }();
  return logger;
}

std::optional<long long> parse_integer(const std::optional<std::string> &text) {
  if (!text || text->empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    long long value = std::stoll(*text, &idx);
    if (idx != text->size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
}

/// Whether @p reset (epoch seconds) is not before the epoch and at most
/// kMaxResetHorizon past now.
bool plausible_reset(long long reset) {
  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  return reset >= 0 &&
         reset <= now + std::chrono::seconds(kMaxResetHorizon).count();
}

std::string describe_failure(const std::string &url, const HttpResponse &resp) {
  std::string diag =
      "GET " + url + " returned HTTP " + std::to_string(resp.status_code);
  if (!resp.body.empty()) {
    diag += ": " + resp.body.substr(0, kBodyExcerpt);
    if (resp.body.size() > kBodyExcerpt) {
      diag += "...";
    }
  }
  return diag;
}

} // namespace

RequestExecutor::RequestExecutor(HttpClient &http, std::string user_agent)
    : http_(http), user_agent_(std::move(user_agent)) {}

std::vector<std::string>
RequestExecutor::request_headers(const FetchContext &ctx,
                                 const RequestIdentity &id) const {
  std::vector<std::string> headers;
  headers.push_back("User-Agent: " + user_agent_);
  headers.push_back("Accept-Encoding: gzip");
  if (!ctx.token.empty()) {
    headers.push_back("Authorization: token " + ctx.token);
  }
  if (!id.accept.empty()) {
    headers.push_back("Accept: " + id.accept);
  }
  return headers;
}

FetchOutcome RequestExecutor::classify(const std::string &url,
                                       const HttpResponse &resp) {
  switch (resp.status_code) {
  case 200:
    return FetchOutcome::success(
        {resp.status_code, resp.headers, resp.body,
         std::chrono::system_clock::now()});
  case 202:
    // Statistics endpoints answer 202 while the data is computed.
    return FetchOutcome::transient("GET " + url +
                                   " returned 202 (Accepted); retrying");
  case 403: {
    auto remaining =
        parse_integer(find_header(resp.headers, "X-RateLimit-Remaining"));
    auto reset = parse_integer(find_header(resp.headers, "X-RateLimit-Reset"));
    if (remaining && *remaining == 0 && reset) {
      if (!plausible_reset(*reset)) {
        executor_log()->warn("Ignoring implausible X-RateLimit-Reset {} for {}",
                             *reset, url);
        return FetchOutcome::permanent(resp.status_code,
                                       describe_failure(url, resp));
      }
      return FetchOutcome::rate_limited(std::chrono::system_clock::time_point(
          std::chrono::seconds(*reset)));
    }
    return FetchOutcome::permanent(resp.status_code,
                                   describe_failure(url, resp));
  }
  default:
    return FetchOutcome::permanent(resp.status_code,
                                   describe_failure(url, resp));
  }
}

FetchOutcome RequestExecutor::execute(const FetchContext &ctx,
                                      const RequestIdentity &id,
                                      ResponseCache &cache) {
  executor_log()->info("Fetching {}", id.url);
  HttpResponse resp;
  try {
    resp = http_.get_with_headers(id.url, request_headers(ctx, id));
  } catch (const TransientNetworkError &e) {
    return FetchOutcome::transient(e.what());
  }
  FetchOutcome outcome = classify(id.url, resp);
  if (outcome.kind == OutcomeKind::Success) {
    try {
      cache.put(ctx.repo, id, outcome.entry);
    } catch (const CacheIoError &e) {
      executor_log()->warn("Response for {} not cached: {}", id.url, e.what());
    }
  }
  return outcome;
}

} // namespace sgf
