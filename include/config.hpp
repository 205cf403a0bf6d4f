#ifndef STARGAZERS_FETCH_CONFIG_HPP
#define STARGAZERS_FETCH_CONFIG_HPP

#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace sgf {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// GitHub access token used for the `Authorization` header.
  const std::string &token() const { return token_; }

  /// Set GitHub access token.
  void set_token(const std::string &token) { token_ = token; }

  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL for the GitHub API.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// `User-Agent` sent with every request.
  const std::string &user_agent() const { return user_agent_; }

  /// Set `User-Agent` header value.
  void set_user_agent(const std::string &agent) { user_agent_ = agent; }

  /// Root directory of the response cache.
  const std::string &cache_dir() const { return cache_dir_; }

  /// Set response cache root directory.
  void set_cache_dir(const std::string &dir) { cache_dir_ = dir; }

  /// HTTP request timeout.
  std::chrono::milliseconds http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(std::chrono::milliseconds t) { http_timeout_ = t; }

  /// HTTP proxy URL.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set HTTP proxy URL.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// HTTPS proxy URL.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set HTTPS proxy URL.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Attempts per logical fetch.
  int max_attempts() const { return max_attempts_; }

  /// Set attempts per logical fetch (minimum 1).
  void set_max_attempts(int attempts) {
    max_attempts_ = attempts < 1 ? 1 : attempts;
  }

  /// Delay after the first transient failure.
  std::chrono::milliseconds backoff_initial() const { return backoff_initial_; }

  /// Set delay after the first transient failure.
  void set_backoff_initial(std::chrono::milliseconds d) { backoff_initial_ = d; }

  /// Upper bound of the transient failure delay.
  std::chrono::milliseconds backoff_max() const { return backoff_max_; }

  /// Set upper bound of the transient failure delay.
  void set_backoff_max(std::chrono::milliseconds d) { backoff_max_ = d; }

  /// Margin added to a rate-limit reset time before retrying.
  std::chrono::milliseconds rate_limit_padding() const {
    return rate_limit_padding_;
  }

  /// Set margin added to a rate-limit reset time.
  void set_rate_limit_padding(std::chrono::milliseconds d) {
    rate_limit_padding_ = d;
  }

  /// Logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Log file path.
  const std::string &log_file() const { return log_file_; }

  /// Set log file path.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files.
  void set_log_rotate(int files) { log_rotate_ = files < 0 ? 0 : files; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool compress) { log_compress_ = compress; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace per-category log level overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> levels) {
    log_categories_ = std::move(levels);
  }

  /**
   * Load configuration from the file at `path`.
   *
   * The format is chosen by extension: `.yaml`/`.yml`, `.toml`/`.tml`, or
   * `.json`.
   *
   * @throws std::runtime_error When the file cannot be read or parsed, or
   *         the extension is unsupported.
   */
  static Config from_file(const std::string &path);

  /// Build configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /**
   * Populate this configuration from a JSON object.
   *
   * Keys may be flat or grouped under the `github`, `cache`, `http`,
   * `retry`, and `logging` sections. Keys that are absent keep their
   * current values.
   */
  void load_json(const nlohmann::json &j);

private:
  std::string token_;
  std::string api_base_ = "https://api.github.com";
  std::string user_agent_ = "stargazers-fetch";
  std::string cache_dir_ = "./stargazer_cache";
  std::chrono::milliseconds http_timeout_{30000};
  std::string http_proxy_;
  std::string https_proxy_;
  int max_attempts_ = 10;
  std::chrono::milliseconds backoff_initial_{50};
  std::chrono::milliseconds backoff_max_{1000};
  std::chrono::milliseconds rate_limit_padding_{1000};
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace sgf

#endif // STARGAZERS_FETCH_CONFIG_HPP
