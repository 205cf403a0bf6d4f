/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for stargazers-fetch.
 */

#ifndef STARGAZERS_FETCH_CLI_HPP
#define STARGAZERS_FETCH_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>

namespace sgf {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /// Construct an exit signal with the desired process exit code.
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code that should be returned to the caller.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Subcommand selected on the command line.
enum class CliCommand {
  Clear, ///< Remove the cached responses of one repository
  Get    ///< Walk the pages of one URL and print the decoded JSON
};

/**
 * Parsed command line options.
 *
 * `*_explicit` members record whether a value came from the command line so
 * it can take precedence over the configuration file.
 */
struct CliOptions {
  CliCommand command{CliCommand::Get};

  bool verbose{false};     ///< Shorthand for `--log-level debug`
  std::string config_file; ///< Path to a YAML, TOML, or JSON configuration
  std::string token;       ///< Access token; empty when not given
  std::string cache_dir;   ///< Cache root override; empty when not given
  std::string api_base;    ///< API base override; empty when not given

  std::string log_level{"info"};
  bool log_level_explicit{false};
  std::string log_file;
  int log_rotate{3};
  bool log_rotate_explicit{false};
  bool log_compress{false};
  std::unordered_map<std::string, std::string> log_categories;

  std::string repo;        ///< `owner/repo` scope of the cached responses
  std::string url;         ///< First page to fetch, absolute or API-relative
  std::string accept;      ///< Optional `Accept` media type
  bool revalidate{false};  ///< Refetch a cached last page
  int max_pages{0};        ///< Page limit for `get`; 0 means unlimited
  std::string output;      ///< Output file for `get`; stdout when empty
};

/**
 * Parse command line arguments.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Raw CLI argument strings.
 * @return Populated options structure.
 * @throws CliParseExit When parsing fails or `--help`/`--version` was
 *         requested; the message has already been printed.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace sgf

#endif // STARGAZERS_FETCH_CLI_HPP
