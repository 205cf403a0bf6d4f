/**
 * @file fetcher.hpp
 * @brief Cached, rate-limit-aware fetching of paginated GitHub API resources.
 *
 * The Fetcher is the single entry point used by traversal code: it consults
 * the response cache, performs network requests through the backoff policy,
 * extracts the next-page cursor, and decodes the body into a caller-supplied
 * destination.
 */
#ifndef STARGAZERS_FETCH_FETCHER_HPP
#define STARGAZERS_FETCH_FETCHER_HPP

#include "backoff_policy.hpp"
#include "fetch_types.hpp"
#include "http_client.hpp"
#include "request_executor.hpp"
#include "response_cache.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace sgf {

/// Running counters across all fetch() calls of a Fetcher.
struct FetchStats {
  std::size_t requests{0};     ///< Network attempts issued
  std::size_t cache_hits{0};   ///< Calls answered from the cache
  std::size_t revalidations{0}; ///< Cached last pages refetched
  std::size_t retries{0};      ///< Attempts beyond the first per request
  std::size_t soft_failures{0}; ///< Calls that yielded no data
  std::size_t corruption_recoveries{0}; ///< Invalidate-and-retry cycles
};

/**
 * Fetches one URL at a time, serving repeated requests from the on-disk
 * response cache.
 *
 * @note Not thread-safe. All requests share one backoff policy so that a
 *       single token's quota is never exceeded.
 */
class Fetcher {
public:
  /// Decodes a response body; throws when the body is unusable.
  using Decoder = std::function<void(const std::string &body)>;

  /**
   * @param http HTTP transport. A CurlHttpClient is created when `nullptr`.
   * @param settings Retry and backoff tunables.
   * @param clock Time source for backoff sleeps; system clock when
   *        `nullptr`.
   * @param user_agent Value of the `User-Agent` request header.
   */
  explicit Fetcher(std::unique_ptr<HttpClient> http = nullptr,
                   BackoffSettings settings = {},
                   std::unique_ptr<Clock> clock = nullptr,
                   std::string user_agent = "stargazers-fetch");

  /**
   * Fetch @p url and decode its JSON body into @p destination.
   *
   * Permanent HTTP failures and an exhausted attempt budget are logged and
   * reported as an empty cursor with @p destination left untouched.
   *
   * @param ctx Per-call configuration.
   * @param url Absolute request URL, usually the previous call's cursor.
   * @param destination Any type nlohmann::json can convert into.
   * @param revalidate_last_page Refetch a cached page that has no next
   *        page, since the final page of a growing collection may change.
   * @return Cursor of the next page, empty on the last page.
   * @throws DecodeError When the body cannot be decoded even after the
   *         cached copy was discarded and fetched again.
   * @throws CacheIoError When the response cache cannot be read.
   */
  template <typename T>
  PageCursor fetch(const FetchContext &ctx, const std::string &url,
                   T &destination, bool revalidate_last_page) {
    return fetch_with(
        ctx, url,
        [&destination](const std::string &body) {
          nlohmann::json::parse(body).get_to(destination);
        },
        revalidate_last_page);
  }

  /**
   * Fetch @p url and hand the raw body to @p decode.
   *
   * Same contract as fetch(); an exception thrown by @p decode marks the
   * cached body as corrupted.
   */
  PageCursor fetch_with(const FetchContext &ctx, const std::string &url,
                        const Decoder &decode, bool revalidate_last_page);

  /// Counters accumulated since construction.
  const FetchStats &stats() const { return stats_; }

private:
  PageCursor fetch_attempt(const FetchContext &ctx, const std::string &url,
                           const Decoder &decode, bool revalidate_last_page,
                           bool recover_corruption);

  std::unique_ptr<HttpClient> http_;
  RequestExecutor executor_;
  BackoffPolicy policy_;
  FetchStats stats_;
};

} // namespace sgf

#endif // STARGAZERS_FETCH_FETCHER_HPP
