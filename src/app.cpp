#include "app.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "response_cache.hpp"
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sgf {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

/// Parse a level name; spdlog maps unknown names to `off`.
std::optional<spdlog::level::level_enum> parse_level(const std::string &name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

std::string get_env_var(const char *name) {
  const char *env = std::getenv(name);
  return env ? std::string(env) : std::string();
}

/**
 * Combine decoded pages into one document.
 *
 * Array pages are concatenated. A single object page is returned as is;
 * several object pages become an array of pages.
 */
nlohmann::json merge_pages(const std::vector<nlohmann::json> &pages) {
  bool all_arrays = true;
  for (const auto &page : pages) {
    all_arrays = all_arrays && page.is_array();
  }
  if (pages.size() == 1 && !all_arrays) {
    return pages.front();
  }
  nlohmann::json merged = nlohmann::json::array();
  for (const auto &page : pages) {
    if (all_arrays) {
      merged.insert(merged.end(), page.begin(), page.end());
    } else {
      merged.push_back(page);
    }
  }
  return merged;
}
} // namespace

App::App(std::unique_ptr<HttpClient> http, std::unique_ptr<Clock> clock)
    : http_(std::move(http)), clock_(std::move(clock)) {}

int App::run(int argc, char **argv) { return run(argc, argv, std::cout); }

/**
 * Execute the main application flow: parse the command line, load the
 * configuration, initialise logging, and dispatch to the selected command.
 */
int App::run(int argc, char **argv, std::ostream &out) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }
  try {
    apply_config();
  } catch (const std::exception &e) {
    app_log()->error("Failed to load configuration {}: {}",
                     options_.config_file, e.what());
    return 1;
  }
  setup_logging();

  const char *command =
      options_.command == CliCommand::Clear ? "clear" : "get";
  try {
    return options_.command == CliCommand::Clear ? run_clear()
                                                 : run_get(out);
  } catch (const DecodeError &e) {
    app_log()->error("{} for {} aborted: {}", command, options_.repo,
                     e.what());
  } catch (const CacheIoError &e) {
    app_log()->error("{} for {} aborted on cache failure: {}", command,
                     options_.repo, e.what());
  } catch (const std::exception &e) {
    app_log()->error("{} for {} failed: {}", command, options_.repo, e.what());
  }
  return 1;
}

/// Load the configuration file and let explicit CLI values override it.
void App::apply_config() {
  if (!options_.config_file.empty()) {
    config_ = Config::from_file(options_.config_file);
  }
  if (!options_.token.empty()) {
    config_.set_token(options_.token);
  } else if (config_.token().empty()) {
    config_.set_token(get_env_var("GITHUB_TOKEN"));
  }
  if (!options_.cache_dir.empty()) {
    config_.set_cache_dir(options_.cache_dir);
  }
  if (!options_.api_base.empty()) {
    config_.set_api_base(options_.api_base);
  }
  if (options_.log_level_explicit) {
    config_.set_log_level(options_.log_level);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress) {
    config_.set_log_compress(true);
  }
  if (!options_.log_categories.empty()) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(std::move(categories));
  }
}

void App::setup_logging() const {
  auto lvl = parse_level(config_.log_level());
  if (!lvl) {
    app_log()->warn("Ignoring invalid log level '{}'", config_.log_level());
  }
  init_logger(lvl.value_or(spdlog::level::info), config_.log_pattern(),
              config_.log_file(), static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    auto level = parse_level(level_str);
    if (!level) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
      continue;
    }
    category_levels[category] = *level;
  }
  configure_log_categories(category_levels);
}

FetchContext App::make_context() const {
  FetchContext ctx;
  ctx.repo = options_.repo;
  ctx.token = config_.token();
  ctx.cache_dir = config_.cache_dir();
  ctx.accept = options_.accept;
  return ctx;
}

std::string App::resolve_url(const std::string &url) const {
  if (url.rfind("https://", 0) == 0 || url.rfind("http://", 0) == 0) {
    return url;
  }
  std::string base = config_.api_base();
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  if (url.empty() || url.front() != '/') {
    return base + "/" + url;
  }
  return base + url;
}

int App::run_clear() {
  ResponseCache cache(config_.cache_dir());
  auto removed = cache.clear_scope(options_.repo);
  app_log()->info("Cleared {} cached entries for {}", removed, options_.repo);
  return 0;
}

int App::run_get(std::ostream &out) {
  auto http = std::move(http_);
  if (!http) {
    http = std::make_unique<CurlHttpClient>(
        static_cast<long>(config_.http_timeout().count()),
        config_.http_proxy(), config_.https_proxy());
  }
  BackoffSettings settings;
  settings.max_attempts = config_.max_attempts();
  settings.initial_backoff = config_.backoff_initial();
  settings.max_backoff = config_.backoff_max();
  settings.rate_limit_padding = config_.rate_limit_padding();
  Fetcher fetcher(std::move(http), settings, std::move(clock_),
                  config_.user_agent());

  const FetchContext ctx = make_context();
  std::vector<nlohmann::json> pages;
  PageCursor cursor = resolve_url(options_.url);
  int fetched = 0;
  while (cursor) {
    if (options_.max_pages > 0 && fetched >= options_.max_pages) {
      app_log()->info("Stopping after {} pages; next page is {}", fetched,
                      *cursor);
      break;
    }
    nlohmann::json page;
    const std::string url = *cursor;
    cursor = fetcher.fetch(ctx, url, page, options_.revalidate);
    ++fetched;
    if (!page.is_null()) {
      pages.push_back(std::move(page));
    }
  }
  stats_ = fetcher.stats();

  const std::string document = merge_pages(pages).dump(2);
  if (options_.output.empty()) {
    out << document << '\n';
  } else {
    std::ofstream file(options_.output);
    if (!file) {
      throw std::runtime_error("Failed to open output file " +
                               options_.output);
    }
    file << document << '\n';
    if (!file) {
      throw std::runtime_error("Failed to write output file " +
                               options_.output);
    }
  }

  app_log()->info("Fetched {} pages of {}: {} requests, {} cache hits, {} "
                  "revalidations, {} retries, {} corruption recoveries",
                  fetched, options_.url, stats_.requests, stats_.cache_hits,
                  stats_.revalidations, stats_.retries,
                  stats_.corruption_recoveries);
  if (stats_.soft_failures > 0) {
    app_log()->warn("{} pages could not be fetched; output is incomplete",
                    stats_.soft_failures);
  }
  return 0;
}

} // namespace sgf
