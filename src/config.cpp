#include "config.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace sgf {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Scalars that look like booleans or numbers become JSON booleans and
 * numbers; everything else stays a string.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    const std::string lower = to_lower_copy(s);
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
    } catch (const std::logic_error &) {
      // not an integer
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/// Translate a TOML node to its JSON representation.
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  std::ostringstream oss;
  if (const auto *value = node.as_date()) {
    oss << value->get();
    return oss.str();
  }
  if (const auto *value = node.as_time()) {
    oss << value->get();
    return oss.str();
  }
  if (const auto *value = node.as_date_time()) {
    oss << value->get();
    return oss.str();
  }
  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * files expose the same flat keys as legacy flat files.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section :
       {"github", "cache", "http", "retry", "logging"}) {
    merge_section(section);
  }
  return normalized;
}

/// Read a duration given either as milliseconds or as a duration string.
std::chrono::milliseconds read_duration(const nlohmann::json &value,
                                        std::string_view key) {
  if (value.is_number_integer()) {
    auto ms = value.get<long long>();
    if (ms < 0) {
      throw std::runtime_error("Negative duration for " + std::string(key));
    }
    return std::chrono::milliseconds{ms};
  }
  if (value.is_string()) {
    return parse_duration(value.get<std::string>());
  }
  throw std::runtime_error("Invalid duration for " + std::string(key));
}

void assign_category(std::unordered_map<std::string, std::string> &categories,
                     const std::string &raw) {
  auto pos = raw.find('=');
  std::string name = pos == std::string::npos ? raw : raw.substr(0, pos);
  std::string level =
      pos == std::string::npos ? std::string{"debug"} : raw.substr(pos + 1);
  if (name.empty()) {
    return;
  }
  categories[name] = level.empty() ? "debug" : level;
}

} // namespace

/**
 * Apply values from a JSON document onto this configuration.
 *
 * @param j Configuration document, flat or sectioned.
 * @throws nlohmann::json::exception When a value has the wrong type.
 * @throws std::runtime_error When a duration cannot be parsed.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("token")) {
    set_token(cfg["token"].get<std::string>());
  }
  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("user_agent")) {
    set_user_agent(cfg["user_agent"].get<std::string>());
  }
  if (cfg.contains("cache_dir")) {
    set_cache_dir(cfg["cache_dir"].get<std::string>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(read_duration(cfg["http_timeout"], "http_timeout"));
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("max_attempts")) {
    set_max_attempts(cfg["max_attempts"].get<int>());
  }
  if (cfg.contains("backoff_initial")) {
    set_backoff_initial(
        read_duration(cfg["backoff_initial"], "backoff_initial"));
  }
  if (cfg.contains("backoff_max")) {
    set_backoff_max(read_duration(cfg["backoff_max"], "backoff_max"));
  }
  if (cfg.contains("rate_limit_padding")) {
    set_rate_limit_padding(
        read_duration(cfg["rate_limit_padding"], "rate_limit_padding"));
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    const auto &value = cfg["log_categories"];
    if (value.is_object()) {
      for (const auto &[key, v] : value.items()) {
        if (v.is_string()) {
          assign_category(categories, key + "=" + v.get<std::string>());
        } else if (v.is_null()) {
          assign_category(categories, key);
        } else {
          config_log()->warn("Unsupported value for log category '{}'; "
                             "expected string or null",
                             key);
        }
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        if (item.is_string()) {
          assign_category(categories, item.get<std::string>());
        }
      }
    } else if (value.is_string()) {
      assign_category(categories, value.get<std::string>());
    }
    set_log_categories(std::move(categories));
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension: " + path);
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace sgf
