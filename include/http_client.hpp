/**
 * @file http_client.hpp
 * @brief HTTP transport abstraction and its libcurl implementation.
 */
#ifndef STARGAZERS_FETCH_HTTP_CLIENT_HPP
#define STARGAZERS_FETCH_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <optional>
#include <string>
#include <vector>

namespace sgf {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers as `Name: value`
  long status_code = 0;             ///< HTTP status code
};

/**
 * Find a header value by name, ignoring case.
 *
 * @param headers Header lines formatted as `Name: value`.
 * @param name Header name without the trailing colon.
 * @return Trimmed value of the first matching header.
 */
std::optional<std::string> find_header(const std::vector<std::string> &headers,
                                       const std::string &name);

/** Interface for performing HTTP GET requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request returning body, headers, and status.
   *
   * Any HTTP status is returned to the caller; only transport failures
   * raise.
   *
   * @param url Absolute request URL.
   * @param headers Request headers expressed as `Header: value` strings.
   * @return Aggregated response body, headers, and HTTP status code.
   * @throws TransientNetworkError When no response could be obtained.
   */
  virtual HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;
  /// Borrowed pointer to the managed easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * @note Not thread-safe; the single easy handle is reused across requests.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout_ms Connect and transfer timeout in milliseconds.
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, std::string http_proxy = {},
                          std::string https_proxy = {});

  /// @copydoc HttpClient::get_with_headers()
  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// HTTP proxy URL.
  const std::string &http_proxy() const { return http_proxy_; }

  /// HTTPS proxy URL.
  const std::string &https_proxy() const { return https_proxy_; }

private:
  void apply_proxy(CURL *curl, const std::string &url);
  CurlHandle curl_;
  long timeout_ms_;
  std::string http_proxy_;
  std::string https_proxy_;
};

} // namespace sgf

#endif // STARGAZERS_FETCH_HTTP_CLIENT_HPP
