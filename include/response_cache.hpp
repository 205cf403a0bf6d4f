/**
 * @file response_cache.hpp
 * @brief On-disk cache of raw GitHub API responses.
 *
 * Entries live under `<root>/<owner>/<repo>/<host>/<path...>/<record>.json`
 * so that one tracked repository can be cleared independently and entries
 * can be inspected by hand.
 */
#ifndef STARGAZERS_FETCH_RESPONSE_CACHE_HPP
#define STARGAZERS_FETCH_RESPONSE_CACHE_HPP

#include "fetch_types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sgf {

/**
 * Filesystem-backed store of request/response records.
 *
 * Not synchronized; a single fetcher reads and writes it.
 */
class ResponseCache {
public:
  /**
   * @param root Cache root directory. Created lazily on first write.
   */
  explicit ResponseCache(std::filesystem::path root);

  /**
   * Look up the record for a request.
   *
   * A record that exists but cannot be parsed is removed and reported as a
   * miss.
   *
   * @param scope Repository namespace, `owner/repo`.
   * @param id Request identity.
   * @return Stored entry, or std::nullopt on a miss.
   * @throws CacheIoError When the record cannot be read.
   */
  std::optional<CacheEntry> get(const std::string &scope,
                                const RequestIdentity &id) const;

  /**
   * Store or overwrite the record for a request.
   *
   * @throws CacheIoError When the record cannot be written.
   */
  void put(const std::string &scope, const RequestIdentity &id,
           const CacheEntry &entry);

  /**
   * Remove the record for a request.
   *
   * @return True when a record existed and was removed.
   * @throws CacheIoError When the removal fails.
   */
  bool invalidate(const std::string &scope, const RequestIdentity &id);

  /**
   * Remove every record stored for a repository.
   *
   * @param scope Repository namespace, `owner/repo`.
   * @return Number of filesystem entries removed.
   * @throws std::invalid_argument When @p scope is empty or escapes the root.
   * @throws CacheIoError When the removal fails.
   */
  std::uintmax_t clear_scope(const std::string &scope);

  /**
   * Compute the record file for a request.
   *
   * @throws std::invalid_argument When the URL is not absolute or the scope
   *         is invalid.
   */
  std::filesystem::path record_path(const std::string &scope,
                                    const RequestIdentity &id) const;

  /// Cache root directory.
  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path scope_dir(const std::string &scope) const;

  std::filesystem::path root_;
};

} // namespace sgf

#endif // STARGAZERS_FETCH_RESPONSE_CACHE_HPP
