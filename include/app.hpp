/**
 * @file app.hpp
 * @brief Application flow for the stargazers-fetch command line tool.
 *
 * Declares the App class, which parses the command line, merges it with the
 * configuration file, initialises logging, and runs the selected command.
 */

#ifndef STARGAZERS_FETCH_APP_HPP
#define STARGAZERS_FETCH_APP_HPP

#include "backoff_policy.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "fetch_types.hpp"
#include "fetcher.hpp"
#include "http_client.hpp"
#include <iosfwd>
#include <memory>
#include <string>

namespace sgf {

/**
 * Command line application wrapping a Fetcher.
 */
class App {
public:
  /**
   * @param http HTTP transport used by `get`. A CurlHttpClient configured
   *        from the resolved settings is created when `nullptr`.
   * @param clock Time source for backoff sleeps; system clock when `nullptr`.
   */
  explicit App(std::unique_ptr<HttpClient> http = nullptr,
               std::unique_ptr<Clock> clock = nullptr);

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Raw CLI arguments.
   * @param out Destination of `get` output when `--output` is not given.
   * @return Zero on success, non-zero when parsing or the command failed.
   */
  int run(int argc, char **argv, std::ostream &out);

  /// @copydoc run(int, char **, std::ostream &)
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Configuration after command line overrides were applied.
  const Config &config() const { return config_; }

  /// Fetch counters of the last `get` command.
  const FetchStats &stats() const { return stats_; }

  /**
   * Resolve a command line URL against the configured API base.
   *
   * Absolute `http://` and `https://` URLs are returned unchanged.
   */
  std::string resolve_url(const std::string &url) const;

private:
  void apply_config();
  void setup_logging() const;
  FetchContext make_context() const;
  int run_clear();
  int run_get(std::ostream &out);

  std::unique_ptr<HttpClient> http_;
  std::unique_ptr<Clock> clock_;
  CliOptions options_;
  Config config_;
  FetchStats stats_;
};

} // namespace sgf

#endif // STARGAZERS_FETCH_APP_HPP
