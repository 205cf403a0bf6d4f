#include "response_cache.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace sgf {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxRecordName = 180;

std::shared_ptr<spdlog::logger> cache_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cache");
  }();
  return logger;
}

/**
 * Percent-escape a string so it forms exactly one portable path segment.
 */
std::string escape_segment(const std::string &raw) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(raw.size());
  for (unsigned char c : raw) {
    bool plain = std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
                 c == '~' || c == '=' || c == '&' || c == ',' || c == '+';
    if (plain) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  if (out == "." || out == "..") {
    out = std::string(out.size(), '_');
  }
  return out;
}

/// 64-bit FNV-1a; stable across builds so record names never change.
std::uint64_t fnv1a(const std::string &data) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::vector<std::string> split(const std::string &text, char sep) {
  std::vector<std::string> parts;
  std::string current;
  for (char c : text) {
    if (c == sep) {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  parts.push_back(current);
  return parts;
}

struct UrlParts {
  std::string host;
  std::vector<std::string> segments;
  std::string query;
};

UrlParts split_url(const std::string &url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    throw std::invalid_argument("Cache key requires an absolute URL: " + url);
  }
  std::string rest = url.substr(scheme_end + 3);
  auto fragment = rest.find('#');
  if (fragment != std::string::npos) {
    rest.erase(fragment);
  }
  UrlParts parts;
  auto q = rest.find('?');
  if (q != std::string::npos) {
    parts.query = rest.substr(q + 1);
    rest.erase(q);
  }
  auto slash = rest.find('/');
  parts.host = rest.substr(0, slash);
  if (parts.host.empty()) {
    throw std::invalid_argument("Cache key requires a host: " + url);
  }
  if (slash != std::string::npos) {
    for (auto &segment : split(rest.substr(slash + 1), '/')) {
      if (!segment.empty()) {
        parts.segments.push_back(std::move(segment));
      }
    }
  }
  return parts;
}

std::string record_name(const RequestIdentity &id, const std::string &query) {
  std::string name = escape_segment(id.method.empty() ? "GET" : id.method);
  if (!query.empty()) {
    name += "@" + escape_segment(query);
  }
  if (!id.accept.empty()) {
    name += "#" + escape_segment(id.accept);
  }
  if (name.size() > kMaxRecordName) {
    char digest[17];
    std::snprintf(digest, sizeof(digest), "%016llx",
                  static_cast<unsigned long long>(
                      fnv1a(id.method + " " + id.url + " " + id.accept)));
    name = name.substr(0, kMaxRecordName) + "~" + digest;
  }
  return name + ".json";
}

long long to_millis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

/// Pretty-print a record. Invalid UTF-8 in the body is replaced with U+FFFD.
std::string serialize_record(const nlohmann::json &record,
                             const std::string &url) {
  try {
    return record.dump(2);
  } catch (const nlohmann::json::type_error &e) {
    cache_log()->warn("Response for {} is not valid UTF-8; caching it with "
                      "replacement characters: {}",
                      url, e.what());
  }
  return record.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

ResponseCache::ResponseCache(fs::path root) : root_(std::move(root)) {}

fs::path ResponseCache::scope_dir(const std::string &scope) const {
  if (scope.empty()) {
    throw std::invalid_argument("Cache scope must not be empty");
  }
  fs::path dir = root_;
  for (const auto &segment : split(scope, '/')) {
    if (segment.empty() || segment == "." || segment == "..") {
      throw std::invalid_argument("Invalid cache scope '" + scope +
                                  "'; expected owner/repo");
    }
    dir /= escape_segment(segment);
  }
  return dir;
}

fs::path ResponseCache::record_path(const std::string &scope,
                                    const RequestIdentity &id) const {
  UrlParts parts = split_url(id.url);
  fs::path path = scope_dir(scope) / escape_segment(parts.host);
  for (const auto &segment : parts.segments) {
    path /= escape_segment(segment);
  }
  return path / record_name(id, parts.query);
}

std::optional<CacheEntry> ResponseCache::get(const std::string &scope,
                                             const RequestIdentity &id) const {
  const fs::path path = record_path(scope, id);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      throw CacheIoError("Failed to stat cache record " + path.string() +
                         ": " + ec.message());
    }
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw CacheIoError("Failed to open cache record " + path.string());
  }
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw CacheIoError("Failed to read cache record " + path.string());
  }
  in.close();

  CacheEntry entry;
  try {
    auto j = nlohmann::json::parse(text);
    if (j.value("url", std::string{}) != id.url ||
        j.value("accept", std::string{}) != id.accept) {
      cache_log()->debug("Cache record {} belongs to another request", path.string());
      return std::nullopt;
    }
    entry.status = j.at("status").get<long>();
    entry.headers = j.at("headers").get<std::vector<std::string>>();
    entry.body = j.at("body").get<std::string>();
    entry.stored_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.value("stored_at", 0LL)));
  } catch (const nlohmann::json::exception &e) {
    cache_log()->warn("Discarding unreadable cache record for {}: {}", id.url,
                      e.what());
    fs::remove(path, ec);
    if (ec) {
      throw CacheIoError("Failed to remove cache record " + path.string() +
                         ": " + ec.message());
    }
    return std::nullopt;
  }
  cache_log()->debug("Cache hit for {}", id.url);
  return entry;
}

void ResponseCache::put(const std::string &scope, const RequestIdentity &id,
                        const CacheEntry &entry) {
  const fs::path path = record_path(scope, id);
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    throw CacheIoError("Failed to create cache directory " +
                       path.parent_path().string() + ": " + ec.message());
  }
  nlohmann::json j = {{"method", id.method},
                      {"url", id.url},
                      {"accept", id.accept},
                      {"status", entry.status},
                      {"headers", entry.headers},
                      {"body", entry.body},
                      {"stored_at", to_millis(entry.stored_at)}};
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw CacheIoError("Failed to open cache record " + tmp.string());
    }
    out << serialize_record(j, id.url);
    if (!out.flush()) {
      throw CacheIoError("Failed to write cache record " + tmp.string());
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw CacheIoError("Failed to store cache record " + path.string());
  }
  cache_log()->debug("Cached {} ({} bytes)", id.url, entry.body.size());
}

bool ResponseCache::invalidate(const std::string &scope,
                               const RequestIdentity &id) {
  const fs::path path = record_path(scope, id);
  std::error_code ec;
  bool removed = fs::remove(path, ec);
  if (ec) {
    throw CacheIoError("Failed to remove cache record " + path.string() +
                       ": " + ec.message());
  }
  if (removed) {
    cache_log()->info("Invalidated cache entry for {}", id.url);
  }
  return removed;
}

std::uintmax_t ResponseCache::clear_scope(const std::string &scope) {
  const fs::path dir = scope_dir(scope);
  std::error_code ec;
  std::uintmax_t removed = fs::remove_all(dir, ec);
  if (ec) {
    throw CacheIoError("Failed to clear cache for " + scope + ": " +
                       ec.message());
  }
  cache_log()->debug("Removed {} entries under {}", removed, dir.string());
  return removed;
}

} // namespace sgf
