/**
 * @file watcher.hpp
 * @brief Periodic evaluation of watched pull requests.
 *
 * The watcher fetches the head revision and aggregate status of every
 * watched pull request, applies the notification filter, delivers events
 * and commits the observation back to the WatchStore.
 */

#ifndef PRWATCH_WATCHER_HPP
#define PRWATCH_WATCHER_HPP

#include "github_client.hpp"
#include "notification.hpp"
#include "notification_filter.hpp"
#include "watch_store.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace prw {

/** Fresh data fetched for one pull request, not yet committed. */
struct Observation {
  PullRequestKey key;                               ///< Pull request
  std::string sha;                                  ///< Current head SHA
  std::string title;                                ///< Title after refresh
  CiState previous_state;                           ///< Stored state
  CiState current_state;                            ///< Fetched state
  std::chrono::system_clock::time_point checked_at; ///< Observation time
};

/**
 * Fetch head and aggregate status of a watched pull request.
 *
 * Refreshes the cached title in @p store when the fetched title is
 * non-empty and differs. The observed revision and state are not committed;
 * callers do that with WatchStore::update_observed().
 *
 * @param client Status source.
 * @param store Store holding the entry.
 * @param key Watched pull request.
 * @return Observation carrying both the stored and the fetched state.
 * @throws GitHubError When either request fails.
 * @throws std::out_of_range When @p key is not watched.
 */
Observation observe_pull_request(StatusClient &client, WatchStore &store,
                                 const PullRequestKey &key);

/** Watcher parameters. */
struct WatchOptions {
  std::chrono::milliseconds poll_interval{
      std::chrono::seconds(kDefaultPollIntervalSeconds)}; ///< Cycle period
  NotificationFilter filter{NotificationFilter::Change};  ///< Transition filter
};

/** Outcome of checking one pull request. */
enum class CheckResult {
  Baseline,       ///< First observation, nothing to compare against
  Unchanged,      ///< State equals the stored state
  Suppressed,     ///< Transition rejected by the filter
  Notified,       ///< Event delivered to every sink
  DeliveryFailed, ///< Event built but at least one sink failed
  FetchFailed     ///< Fetch failed; stored state left untouched
};

/** Tally of a full cycle. */
struct CycleReport {
  std::size_t checked{0};           ///< Pull requests fetched successfully
  std::size_t failed{0};            ///< Pull requests whose fetch failed
  std::size_t notified{0};          ///< Events delivered successfully
  std::size_t delivery_failures{0}; ///< Events with a failed sink
  bool persisted{false};            ///< Whether the store was saved
  std::string persist_error;        ///< Save failure message, if any
};

/** Why Watcher::run() returned. */
enum class RunOutcome {
  Idle,     ///< Nothing is watched
  Cancelled ///< The stop flag was raised
};

/**
 * Drives the check algorithm over every watched pull request.
 *
 * Cycles run sequentially on the calling thread.
 */
class Watcher {
public:
  /**
   * @param client Status source.
   * @param store Watch list; must outlive the watcher.
   * @param notifier Event sink; may be `nullptr` to only record state.
   * @param options Poll interval and filter mode.
   */
  Watcher(StatusClient &client, WatchStore &store, NotifierPtr notifier,
          WatchOptions options);

  /**
   * Run the check algorithm for one pull request and commit the result.
   *
   * Failures are logged and reported through the return value; they never
   * propagate.
   */
  CheckResult check(const PullRequestKey &key);

  /**
   * Check every watched pull request once, then persist the store.
   *
   * A persistence failure is logged and recorded in the report.
   */
  CycleReport check_all();

  /**
   * Run an immediate cycle followed by one cycle per poll interval.
   *
   * @param stop Cooperative cancellation flag, observed while waiting for
   *        the next cycle. An in-flight cycle always completes.
   * @return RunOutcome::Idle when nothing is watched, otherwise
   *         RunOutcome::Cancelled once @p stop is raised.
   */
  RunOutcome run(const std::atomic<bool> &stop);

  /// Register a callback invoked after every completed cycle.
  void set_cycle_callback(std::function<void(const CycleReport &)> cb);

  const WatchOptions &options() const { return options_; }

private:
  bool wait_until(std::chrono::steady_clock::time_point deadline,
                  const std::atomic<bool> &stop) const;

  StatusClient &client_;
  WatchStore &store_;
  NotifierPtr notifier_;
  WatchOptions options_;
  std::function<void(const CycleReport &)> cycle_cb_;
};

} // namespace prw

#endif // PRWATCH_WATCHER_HPP
