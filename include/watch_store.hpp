/**
 * @file watch_store.hpp
 * @brief Ordered, duplicate-free collection of watched pull requests and
 *        the settings persisted alongside them.
 */

#ifndef PRWATCH_WATCH_STORE_HPP
#define PRWATCH_WATCH_STORE_HPP

#include "ci_state.hpp"
#include "notification_filter.hpp"
#include "pull_request.hpp"
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace prw {

/// Poll interval used when the state file does not provide a valid one.
constexpr int kDefaultPollIntervalSeconds = 20;

/** Raised when the state document cannot be read or written. */
class PersistenceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/** User settings stored in the state document. */
struct WatchSettings {
  int poll_interval_seconds{kDefaultPollIntervalSeconds}; ///< Seconds between
                                                          ///< watch cycles
  std::string webhook_url;  ///< Optional webhook endpoint
  std::string github_token; ///< Optional API token
  NotificationFilter notification_filter{
      NotificationFilter::Change}; ///< Default filter for `run`
};

/** One tracked pull request and its last observation. */
struct WatchedPullRequest {
  PullRequestKey key;         ///< Natural key, immutable
  std::string last_known_sha; ///< Head SHA seen by the last check
  CiState last_known_state;   ///< Aggregate state seen by the last check
  std::chrono::system_clock::time_point
      last_checked{};  ///< Time of the last check, epoch when never checked
  std::string title;   ///< Cached title, empty until first fetch

  /// True once at least one check has been committed.
  bool checked() const {
    return last_checked != std::chrono::system_clock::time_point{};
  }
};

/** Where the effective API token came from. */
enum class TokenSource {
  Config,      ///< `github_token` in the state document
  Environment, ///< `GITHUB_TOKEN` environment variable
  None         ///< No token configured
};

/** Resolved token value together with its origin. */
struct ResolvedToken {
  std::string value;
  TokenSource source{TokenSource::None};
};

/**
 * Resolve the API token, preferring the state document over the
 * environment.
 */
ResolvedToken resolve_github_token(const WatchSettings &settings);

/// Human readable label for a token source.
std::string to_string(TokenSource source);

/**
 * Default state document location: `$HOME/.prw/config.json`.
 *
 * Falls back to `USERPROFILE` on Windows and to the working directory when
 * no home directory can be determined.
 */
std::string default_state_path();

/**
 * Owner of the watch list and its settings.
 *
 * The store is mutated only by the thread that drives checks; it performs no
 * locking.
 */
class WatchStore {
public:
  /**
   * Construct an empty store bound to a state document path.
   *
   * @param path Location used by persist().
   */
  explicit WatchStore(std::string path);

  /**
   * Load a store from disk.
   *
   * A missing file yields an empty store with default settings. A
   * non-positive poll interval is replaced by the default and an
   * unrecognized filter mode falls back to `change`.
   *
   * @param path State document path.
   * @return Populated store bound to @p path.
   * @throws PersistenceError When the file exists but cannot be read or is
   *         not a valid state document.
   */
  static WatchStore load(const std::string &path);

  /**
   * Write the full document to disk.
   *
   * Parent directories are created as needed and the file is replaced
   * atomically.
   *
   * @throws PersistenceError On any filesystem failure.
   */
  void persist() const;

  /**
   * Append a pull request to the watch list.
   *
   * @return `false` without modifying the store if the key is already
   *         present.
   */
  bool add(WatchedPullRequest entry);

  /**
   * Remove a pull request.
   *
   * @return `false` if the key was not watched.
   */
  bool remove(const PullRequestKey &key);

  /// Look up an entry by key; `nullptr` when absent.
  const WatchedPullRequest *find(const PullRequestKey &key) const;

  /**
   * Record the result of a check.
   *
   * @return `false` if the key is not watched.
   */
  bool update_observed(const PullRequestKey &key, std::string sha,
                       CiState state,
                       std::chrono::system_clock::time_point now);

  /**
   * Replace the cached title when @p title is non-empty and differs.
   *
   * @return `true` when the title changed.
   */
  bool refresh_title(const PullRequestKey &key, const std::string &title);

  const std::vector<WatchedPullRequest> &entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  WatchSettings &settings() { return settings_; }
  const WatchSettings &settings() const { return settings_; }

  /// Location of the state document.
  const std::string &path() const { return path_; }

private:
  WatchedPullRequest *find_mutable(const PullRequestKey &key);

  std::string path_;
  WatchSettings settings_;
  std::vector<WatchedPullRequest> entries_;
};

} // namespace prw

#endif // PRWATCH_WATCH_STORE_HPP
