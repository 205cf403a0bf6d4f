/**
 * @file fetcher.cpp
 * @brief Cache-first fetch loop with corruption recovery.
 */

#include "fetcher.hpp"
#include "errors.hpp"
#include "link_header.hpp"
#include "log.hpp"
#include <exception>
#include <spdlog/spdlog.h>
#include <utility>

namespace sgf {

namespace {
std::shared_ptr<spdlog::logger> fetcher_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("fetcher");
  }();
  return logger;
}
} // namespace

Fetcher::Fetcher(std::unique_ptr<HttpClient> http, BackoffSettings settings,
                 std::unique_ptr<Clock> clock, std::string user_agent)
    : http_(http ? std::move(http) : std::make_unique<CurlHttpClient>()),
      executor_(*http_, std::move(user_agent)),
      policy_(settings, std::move(clock)) {}

PageCursor Fetcher::fetch_with(const FetchContext &ctx, const std::string &url,
                               const Decoder &decode,
                               bool revalidate_last_page) {
  return fetch_attempt(ctx, url, decode, revalidate_last_page, true);
}

PageCursor Fetcher::fetch_attempt(const FetchContext &ctx,
                                  const std::string &url,
                                  const Decoder &decode,
                                  bool revalidate_last_page,
                                  bool recover_corruption) {
  const RequestIdentity id{"GET", url, ctx.accept};
  ResponseCache cache(ctx.cache_dir);

  std::optional<CacheEntry> entry = cache.get(ctx.repo, id);
  PageCursor next;
  if (entry) {
    next = cursor_from_headers(entry->headers);
    if (!next && revalidate_last_page) {
      // The last page of a collection may have grown since it was cached.
      fetcher_log()->debug("Revalidating cached last page {}", url);
      ++stats_.revalidations;
      entry.reset();
    } else {
      ++stats_.cache_hits;
    }
  }

  if (!entry) {
    FetchOutcome outcome = policy_.run(url, [&] {
      ++stats_.requests;
      return executor_.execute(ctx, id, cache);
    });
    stats_.retries += static_cast<std::size_t>(policy_.last_attempts() - 1);
    if (outcome.kind != OutcomeKind::Success) {
      ++stats_.soft_failures;
      fetcher_log()->warn("Unable to fetch {} ({}); continuing without it",
                          url, to_string(outcome.kind));
      return std::nullopt;
    }
    entry = std::move(outcome.entry);
    next = cursor_from_headers(entry->headers);
  }

  try {
    decode(entry->body);
  } catch (const std::exception &e) {
    if (!recover_corruption) {
      fetcher_log()->error("Failed to decode {}: {}", url, e.what());
      cache.invalidate(ctx.repo, id);
      throw DecodeError("decode URL=" + url + ": " + e.what());
    }
    fetcher_log()->warn("Cache entry {} corrupted ({}); removing and refetching",
                        url, e.what());
    ++stats_.corruption_recoveries;
    cache.invalidate(ctx.repo, id);
    return fetch_attempt(ctx, url, decode, revalidate_last_page, false);
  }
  return next;
}

} // namespace sgf
