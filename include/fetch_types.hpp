/**
 * @file fetch_types.hpp
 * @brief Value types shared by the cache, executor, policy, and fetcher.
 */
#ifndef STARGAZERS_FETCH_FETCH_TYPES_HPP
#define STARGAZERS_FETCH_FETCH_TYPES_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sgf {

/// Next page of a paginated collection; empty on the last page.
using PageCursor = std::optional<std::string>;

/**
 * Immutable per-call request configuration.
 *
 * Call sites needing a different `Accept` value derive a copy with
 * with_accept() instead of modifying a shared instance.
 */
struct FetchContext {
  std::string repo;                ///< Tracked repository `owner/repo`
  std::string token;               ///< Access token, may be empty
  std::filesystem::path cache_dir; ///< Root of the response cache
  std::string accept;              ///< Optional `Accept` override

  /// Copy of this context with a different content-negotiation override.
  FetchContext with_accept(std::string value) const {
    FetchContext copy = *this;
    copy.accept = std::move(value);
    return copy;
  }
};

/// Key addressing a cache entry.
struct RequestIdentity {
  std::string method{"GET"}; ///< HTTP method
  std::string url;           ///< Absolute request URL
  std::string accept;        ///< `Accept` override, empty for the default

  bool operator==(const RequestIdentity &other) const {
    return method == other.method && url == other.url &&
           accept == other.accept;
  }
};

/// Stored request/response record.
struct CacheEntry {
  long status = 0;                  ///< HTTP status code
  std::vector<std::string> headers; ///< Response headers as `Name: value`
  std::string body;                 ///< Raw response body
  std::chrono::system_clock::time_point stored_at{}; ///< Time of storage
};

/// Discriminator of FetchOutcome.
enum class OutcomeKind {
  Success,     ///< 200 response available in `entry`
  RateLimited, ///< Quota exhausted until `reset_at`
  Transient,   ///< Retry after backoff; see `diagnostic`
  Permanent    ///< Give up on this URL; see `status` and `diagnostic`
};

/**
 * Classified result of a single network attempt.
 *
 * Only the fields belonging to `kind` are meaningful. Construct instances
 * through the named factories.
 */
struct FetchOutcome {
  OutcomeKind kind = OutcomeKind::Transient;
  CacheEntry entry;                                 ///< Success
  std::chrono::system_clock::time_point reset_at{}; ///< RateLimited
  long status = 0;                                  ///< Permanent
  std::string diagnostic; ///< Transient cause or Permanent description

  static FetchOutcome success(CacheEntry entry) {
    FetchOutcome o;
    o.kind = OutcomeKind::Success;
    o.status = entry.status;
    o.entry = std::move(entry);
    return o;
  }

  static FetchOutcome rate_limited(std::chrono::system_clock::time_point at) {
    FetchOutcome o;
    o.kind = OutcomeKind::RateLimited;
    o.reset_at = at;
    o.status = 403;
    return o;
  }

  static FetchOutcome transient(std::string cause) {
    FetchOutcome o;
    o.kind = OutcomeKind::Transient;
    o.diagnostic = std::move(cause);
    return o;
  }

  static FetchOutcome permanent(long status, std::string diagnostic) {
    FetchOutcome o;
    o.kind = OutcomeKind::Permanent;
    o.status = status;
    o.diagnostic = std::move(diagnostic);
    return o;
  }
};

/// Name of an outcome kind for log messages.
inline const char *to_string(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::Success:
    return "success";
  case OutcomeKind::RateLimited:
    return "rate-limited";
  case OutcomeKind::Transient:
    return "transient";
  case OutcomeKind::Permanent:
    return "permanent";
  }
  return "unknown";
}

} // namespace sgf

#endif // STARGAZERS_FETCH_FETCH_TYPES_HPP
