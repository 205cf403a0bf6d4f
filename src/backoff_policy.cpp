#include "backoff_policy.hpp"
#include "log.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include <thread>
#include <utility>

namespace sgf {

namespace {
std::shared_ptr<spdlog::logger> backoff_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("backoff");
  }();
  return logger;
}
} // namespace

std::chrono::system_clock::time_point SystemClock::now() const {
  return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

BackoffPolicy::BackoffPolicy(BackoffSettings settings,
                             std::unique_ptr<Clock> clock)
    : settings_(settings),
      clock_(clock ? std::move(clock) : std::make_unique<SystemClock>()) {
  settings_.max_attempts = std::max(1, settings_.max_attempts);
}

std::chrono::milliseconds BackoffPolicy::backoff_delay(int attempt) const {
  auto delay = settings_.initial_backoff;
  for (int i = 0; i < attempt && delay < settings_.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, settings_.max_backoff);
}

std::chrono::milliseconds BackoffPolicy::rate_limit_delay(
    std::chrono::system_clock::time_point reset_at) const {
  // Round up so the retry never lands before the padded reset.
  auto wait = std::chrono::ceil<std::chrono::milliseconds>(
      reset_at + settings_.rate_limit_padding - clock_->now());
  return std::max(wait, std::chrono::milliseconds{0});
}

FetchOutcome BackoffPolicy::run(const std::string &url,
                                const std::function<FetchOutcome()> &attempt) {
  FetchOutcome outcome;
  last_attempts_ = 0;
  for (int i = 0; i < settings_.max_attempts; ++i) {
    ++last_attempts_;
    outcome = attempt();
    const bool last = i + 1 == settings_.max_attempts;
    switch (outcome.kind) {
    case OutcomeKind::Success:
      return outcome;
    case OutcomeKind::Permanent:
      backoff_log()->warn("Unable to fetch {}: {}", url, outcome.diagnostic);
      return outcome;
    case OutcomeKind::RateLimited: {
      auto wait = rate_limit_delay(outcome.reset_at);
      auto reset = std::chrono::duration_cast<std::chrono::seconds>(
                       outcome.reset_at.time_since_epoch())
                       .count();
      backoff_log()->warn("Rate limit for GitHub API access exceeded while "
                          "fetching {}; resets at {} (in {}ms)",
                          url, reset, wait.count());
      if (!last) {
        clock_->sleep_for(wait);
      }
      break;
    }
    case OutcomeKind::Transient: {
      if (last) {
        backoff_log()->warn("Attempt {} for {} failed: {}", i + 1, url,
                            outcome.diagnostic);
        break;
      }
      auto wait = backoff_delay(i);
      backoff_log()->warn("Attempt {} for {} failed: {}; retrying in {}ms",
                          i + 1, url, outcome.diagnostic, wait.count());
      clock_->sleep_for(wait);
      break;
    }
    }
  }
  backoff_log()->warn("Giving up on {} after {} attempts", url, last_attempts_);
  return outcome;
}

} // namespace sgf
