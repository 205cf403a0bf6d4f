/**
 * @file backoff_policy.hpp
 * @brief Retry, exponential backoff, and rate-limit waiting for one fetch.
 */
#ifndef STARGAZERS_FETCH_BACKOFF_POLICY_HPP
#define STARGAZERS_FETCH_BACKOFF_POLICY_HPP

#include "fetch_types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace sgf {

/** Source of wall-clock time and blocking sleeps. */
class Clock {
public:
  virtual ~Clock() = default;
  /// Current wall-clock time.
  virtual std::chrono::system_clock::time_point now() const = 0;
  /// Block the calling thread for @p duration.
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

/// Clock backed by std::chrono::system_clock and std::this_thread.
class SystemClock : public Clock {
public:
  std::chrono::system_clock::time_point now() const override;
  void sleep_for(std::chrono::milliseconds duration) override;
};

/// Tunables of the retry loop.
struct BackoffSettings {
  int max_attempts = 10; ///< Attempts per logical fetch
  std::chrono::milliseconds initial_backoff{50}; ///< First transient delay
  std::chrono::milliseconds max_backoff{1000};   ///< Transient delay cap
  std::chrono::milliseconds rate_limit_padding{1000}; ///< Clock skew margin
};

/**
 * Drives attempts of a single request until it succeeds, fails
 * permanently, or exhausts the attempt budget.
 *
 * Rate-limit waits are unbounded in time but each consumes one attempt, so
 * an endpoint that is both rate-limited and flaky still terminates.
 */
class BackoffPolicy {
public:
  /**
   * @param settings Retry tunables.
   * @param clock Time source; a SystemClock is used when `nullptr`.
   */
  explicit BackoffPolicy(BackoffSettings settings = {},
                         std::unique_ptr<Clock> clock = nullptr);

  /**
   * Run @p attempt until a terminal outcome.
   *
   * @param url Request URL used in log messages.
   * @param attempt Performs one request and classifies it.
   * @return Success or Permanent outcome, or the last RateLimited/Transient
   *         outcome when the budget ran out.
   */
  FetchOutcome run(const std::string &url,
                   const std::function<FetchOutcome()> &attempt);

  /**
   * Delay before retrying after the transient failure of attempt @p attempt
   * (zero-based): initial_backoff doubled per attempt, capped at
   * max_backoff.
   */
  std::chrono::milliseconds backoff_delay(int attempt) const;

  /// Time to wait until @p reset_at plus padding; zero when already past.
  std::chrono::milliseconds
  rate_limit_delay(std::chrono::system_clock::time_point reset_at) const;

  /// Attempts made by the most recent run().
  int last_attempts() const { return last_attempts_; }

  /// Active settings.
  const BackoffSettings &settings() const { return settings_; }

private:
  BackoffSettings settings_;
  std::unique_ptr<Clock> clock_;
  int last_attempts_{0};
};

} // namespace sgf

#endif // STARGAZERS_FETCH_BACKOFF_POLICY_HPP
