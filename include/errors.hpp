/**
 * @file errors.hpp
 * @brief Exception types raised by the fetch engine.
 *
 * Recoverable remote conditions (rate limits, transient failures, permanent
 * HTTP errors) are absorbed by the fetcher. The types declared here are the
 * ones that cross component boundaries.
 */
#ifndef STARGAZERS_FETCH_ERRORS_HPP
#define STARGAZERS_FETCH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sgf {

/// Transport-level failure where no HTTP response was received.
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Failure reading or writing the on-disk response cache.
 *
 * Signals systemic storage trouble and terminates the run.
 */
class CacheIoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// A response body could not be decoded into the requested destination.
class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace sgf

#endif // STARGAZERS_FETCH_ERRORS_HPP
