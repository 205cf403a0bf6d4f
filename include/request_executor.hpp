/**
 * @file request_executor.hpp
 * @brief Performs one GitHub API request and classifies the result.
 */
#ifndef STARGAZERS_FETCH_REQUEST_EXECUTOR_HPP
#define STARGAZERS_FETCH_REQUEST_EXECUTOR_HPP

#include "fetch_types.hpp"
#include "http_client.hpp"
#include "response_cache.hpp"
#include <string>
#include <vector>

namespace sgf {

/**
 * Issues single GET requests through an HttpClient and maps each response to
 * a FetchOutcome.
 *
 * Classification:
 *  - 200 is Success; the response is stored in the cache first.
 *  - 202 (statistics still being computed) is Transient.
 *  - 403 with `X-RateLimit-Remaining: 0` is RateLimited until
 *    `X-RateLimit-Reset`.
 *  - Every other status is Permanent.
 *  - A transport failure is Transient.
 */
class RequestExecutor {
public:
  /**
   * @param http Transport used for requests; must outlive the executor.
   * @param user_agent Value of the `User-Agent` header.
   */
  explicit RequestExecutor(HttpClient &http,
                           std::string user_agent = "stargazers-fetch");

  /**
   * Perform one request.
   *
   * A failure to store a successful response is logged and the response is
   * still returned.
   *
   * @param ctx Per-call configuration supplying token and cache scope.
   * @param id Request identity; `id.accept` overrides `Accept` when set.
   * @param cache Cache receiving successful responses.
   * @return Classified outcome; never throws for HTTP or transport errors.
   */
  FetchOutcome execute(const FetchContext &ctx, const RequestIdentity &id,
                       ResponseCache &cache);

  /// Headers attached to every request for @p ctx and @p id.
  std::vector<std::string> request_headers(const FetchContext &ctx,
                                           const RequestIdentity &id) const;

  /**
   * Classify a received response. Nothing is cached or retried here.
   *
   * A 403 whose `X-RateLimit-Reset` lies before the epoch or more than a
   * day ahead is treated as Permanent.
   *
   * @param url Request URL, used in diagnostics.
   * @param resp Response to classify.
   */
  static FetchOutcome classify(const std::string &url,
                               const HttpResponse &resp);

private:
  HttpClient &http_;
  std::string user_agent_;
};

} // namespace sgf

#endif // STARGAZERS_FETCH_REQUEST_EXECUTOR_HPP
