#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sgf {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 8> categories = {
      "app",     "backoff", "cache", "cli",
      "config",  "executor", "fetcher", "http"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., cache=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

/// Accepts `owner/repo` with both parts non-empty.
std::string validate_repo(const std::string &value) {
  auto pos = value.find('/');
  if (pos == std::string::npos || pos == 0 || pos + 1 == value.size() ||
      value.find('/', pos + 1) != std::string::npos) {
    return "expected OWNER/REPO, got '" + value + "'";
  }
  return {};
}

} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Cached, rate-limit-aware GitHub API fetcher"};
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "stargazers-fetch " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option("-t,--token", options.token,
                 "GitHub access token (defaults to the configuration file, "
                 "then GITHUB_TOKEN)")
      ->type_name("TOKEN")
      ->group("GitHub");
  app.add_option("--api-base", options.api_base,
                 "Base URL for relative request URLs")
      ->type_name("URL")
      ->group("GitHub");
  app.add_option("-c,--cache", options.cache_dir,
                 "Response cache directory (default ./stargazer_cache)")
      ->type_name("DIR")
      ->group("Cache");
  auto *log_level = app.add_option(
                           "--log-level", options.log_level,
                           "Set logging level (trace, debug, info, warn, "
                           "error, critical, off)")
                        ->type_name("LEVEL")
                        ->default_val("info")
                        ->group("Logging");
  app.add_option("--log-file", options.log_file, "Path to log file")
      ->type_name("FILE")
      ->group("Logging");
  auto *log_rotate =
      app.add_option("--log-rotate", options.log_rotate,
                     "Number of rotated log files to keep (0 disables "
                     "rotation)")
          ->type_name("N")
          ->check(CLI::NonNegativeNumber)
          ->group("Logging");
  app.add_flag("--log-compress", options.log_compress,
               "Compress rotated log files with gzip")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Override a logging category (NAME or NAME=LEVEL)")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");
  app.fallthrough();

  CLI::Validator repo_validator(validate_repo, "OWNER/REPO");

  auto *clear = app.add_subcommand(
      "clear", "Remove every cached response of a repository");
  clear->add_option("-r,--repo", options.repo, "Repository as OWNER/REPO")
      ->required()
      ->check(repo_validator);

  auto *get = app.add_subcommand(
      "get", "Fetch every page of a URL and print the decoded JSON");
  get->add_option("-r,--repo", options.repo, "Repository as OWNER/REPO")
      ->required()
      ->check(repo_validator);
  get->add_option("-u,--url", options.url,
                  "First page to fetch; relative URLs use the API base")
      ->required()
      ->type_name("URL");
  get->add_option("--accept", options.accept, "Accept media type")
      ->type_name("MIME");
  get->add_flag("--revalidate", options.revalidate,
                "Refetch the cached last page");
  get->add_option("--max-pages", options.max_pages,
                  "Stop after N pages (0 = all)")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber);
  get->add_option("-o,--output", options.output,
                  "Write the result to FILE instead of stdout")
      ->type_name("FILE");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  options.command = clear->parsed() ? CliCommand::Clear : CliCommand::Get;
  options.log_level_explicit = log_level->count() > 0U;
  options.log_rotate_explicit = log_rotate->count() > 0U;
  if (options.verbose && !options.log_level_explicit) {
    options.log_level = "debug";
    options.log_level_explicit = true;
  }
  cli_log()->debug("Parsed command line for repository {}", options.repo);
  return options;
}

} // namespace sgf
