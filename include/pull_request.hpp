/**
 * @file pull_request.hpp
 * @brief Pull request identity and URL helpers.
 */

#ifndef PRWATCH_PULL_REQUEST_HPP
#define PRWATCH_PULL_REQUEST_HPP

#include <optional>
#include <string>

namespace prw {

/** Natural key of a watched pull request. */
struct PullRequestKey {
  std::string owner; ///< Repository owner (user or organization)
  std::string repo;  ///< Repository name
  int number{0};     ///< Pull request number

  bool operator==(const PullRequestKey &other) const {
    return number == other.number && owner == other.owner &&
           repo == other.repo;
  }
  bool operator!=(const PullRequestKey &other) const {
    return !(*this == other);
  }
};

/// Render `owner/repo#number` for messages and logs.
std::string to_string(const PullRequestKey &key);

/**
 * Parse a pull request URL.
 *
 * Accepts `[http[s]://]github.com/<owner>/<repo>/pull/<number>` with an
 * optional trailing path such as `/files` or `/checks`.
 *
 * @param url URL supplied by the user.
 * @return Parsed key, or std::nullopt if the URL is not a pull request link.
 */
std::optional<PullRequestKey> parse_pr_url(const std::string &url);

/// Canonical `https://github.com/<owner>/<repo>/pull/<number>` link.
std::string format_pr_url(const PullRequestKey &key);

} // namespace prw

#endif // PRWATCH_PULL_REQUEST_HPP
