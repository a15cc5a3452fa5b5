#ifndef PRWATCH_GITHUB_CLIENT_HPP
#define PRWATCH_GITHUB_CLIENT_HPP

#include "http_client.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace prw {

/** Base class for every failure reported by a StatusClient. */
class GitHubError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/** Network-level failure while talking to the API. */
class GitHubTransportError : public GitHubError {
public:
  using GitHubError::GitHubError;
};

/** The pull request or commit does not exist (HTTP 404). */
class NotFoundError : public GitHubError {
public:
  using GitHubError::GitHubError;
};

/** Any other non-2xx response. */
class HttpStatusError : public GitHubError {
public:
  HttpStatusError(long status_code, const std::string &message)
      : GitHubError(message), status_code_(status_code) {}

  /// HTTP status code returned by the server.
  long status_code() const { return status_code_; }

private:
  long status_code_;
};

/** Head revision and title of a pull request. */
struct PullRequestHead {
  std::string sha;   ///< Head commit SHA
  std::string title; ///< Pull request title, possibly empty
};

/**
 * Read-only capability used by the watcher to observe pull requests.
 *
 * Calls are synchronous and side-effect free. Implementations must bound
 * each call with a timeout.
 */
class StatusClient {
public:
  virtual ~StatusClient() = default;

  /**
   * Fetch the head revision and title of a pull request.
   *
   * @throws GitHubError (or a subclass) on failure.
   */
  virtual PullRequestHead fetch_head(const std::string &owner,
                                     const std::string &repo, int number) = 0;

  /**
   * Fetch the raw aggregate status string for a commit.
   *
   * @return Status text as reported by the server; an empty string is a
   *         valid answer and means no status has been reported.
   * @throws GitHubError (or a subclass) on failure.
   */
  virtual std::string fetch_aggregate_status(const std::string &owner,
                                             const std::string &repo,
                                             const std::string &sha) = 0;
};

/**
 * StatusClient backed by the GitHub REST API.
 */
class GitHubClient : public StatusClient {
public:
  /**
   * Construct a GitHub API client.
   *
   * @param token Personal access token sent as a bearer credential.
   * @param http Transport used for requests. A CurlHttpClient with
   *        @p timeout_ms is constructed when `nullptr` is supplied.
   * @param api_base Base URL of the REST API, without trailing slash.
   * @param timeout_ms Per-request timeout for the default transport.
   */
  explicit GitHubClient(std::string token, HttpClientPtr http = nullptr,
                        std::string api_base = "https://api.github.com",
                        long timeout_ms = 15000);

  PullRequestHead fetch_head(const std::string &owner,
                             const std::string &repo, int number) override;

  std::string fetch_aggregate_status(const std::string &owner,
                                     const std::string &repo,
                                     const std::string &sha) override;

  /// Base URL requests are issued against.
  const std::string &api_base() const { return api_base_; }

private:
  std::string get_json(const std::string &url);

  std::string token_;
  HttpClientPtr http_;
  std::string api_base_;
};

} // namespace prw

#endif // PRWATCH_GITHUB_CLIENT_HPP
