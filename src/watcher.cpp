#include "watcher.hpp"
#include "log.hpp"
#include <algorithm>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace prw {

namespace {

constexpr std::chrono::milliseconds kStopPollSlice{100};

std::shared_ptr<spdlog::logger> watcher_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("watcher");
  }();
  return logger;
}

} // namespace

Observation observe_pull_request(StatusClient &client, WatchStore &store,
                                 const PullRequestKey &key) {
  const WatchedPullRequest *entry = store.find(key);
  if (entry == nullptr) {
    throw std::out_of_range(to_string(key) + " is not watched");
  }
  Observation obs;
  obs.key = key;
  obs.previous_state = entry->last_known_state;

  PullRequestHead head = client.fetch_head(key.owner, key.repo, key.number);
  std::string raw = client.fetch_aggregate_status(key.owner, key.repo,
                                                  head.sha);
  obs.sha = std::move(head.sha);
  obs.current_state = CiState::parse(raw);
  obs.checked_at = std::chrono::system_clock::now();

  if (store.refresh_title(key, head.title)) {
    watcher_log()->debug("Title of {} is now '{}'", to_string(key),
                         head.title);
  }
  obs.title = store.find(key)->title;
  return obs;
}

Watcher::Watcher(StatusClient &client, WatchStore &store,
                 NotifierPtr notifier, WatchOptions options)
    : client_(client), store_(store), notifier_(std::move(notifier)),
      options_(options) {
  if (options_.poll_interval <= std::chrono::milliseconds::zero()) {
    options_.poll_interval = std::chrono::seconds(kDefaultPollIntervalSeconds);
  }
}

void Watcher::set_cycle_callback(
    std::function<void(const CycleReport &)> cb) {
  cycle_cb_ = std::move(cb);
}

CheckResult Watcher::check(const PullRequestKey &key) {
  Observation obs;
  try {
    obs = observe_pull_request(client_, store_, key);
  } catch (const std::exception &e) {
    watcher_log()->warn("Error checking PR {}: {}", to_string(key), e.what());
    return CheckResult::FetchFailed;
  }

  CheckResult result = CheckResult::Suppressed;
  if (obs.previous_state.empty()) {
    result = CheckResult::Baseline;
  } else if (obs.previous_state == obs.current_state) {
    result = CheckResult::Unchanged;
  }

  if (should_notify(obs.previous_state, obs.current_state, options_.filter)) {
    watcher_log()->info("{} changed: {} -> {}", to_string(key),
                        display_string(obs.previous_state),
                        display_string(obs.current_state));
    StatusChangeEvent event{obs.key,           obs.title,
                            obs.previous_state, obs.current_state,
                            obs.sha,           obs.checked_at};
    if (notifier_) {
      try {
        notifier_->notify(event);
        result = CheckResult::Notified;
      } catch (const std::exception &e) {
        watcher_log()->warn("Notification failed for {}: {}", to_string(key),
                            e.what());
        result = CheckResult::DeliveryFailed;
      }
    } else {
      result = CheckResult::Notified;
    }
  }

  store_.update_observed(key, std::move(obs.sha), obs.current_state,
                         obs.checked_at);
  return result;
}

CycleReport Watcher::check_all() {
  CycleReport report;
  std::vector<PullRequestKey> keys;
  keys.reserve(store_.size());
  for (const auto &entry : store_.entries()) {
    keys.push_back(entry.key);
  }
  for (const auto &key : keys) {
    switch (check(key)) {
    case CheckResult::FetchFailed:
      ++report.failed;
      continue;
    case CheckResult::Notified:
      ++report.notified;
      break;
    case CheckResult::DeliveryFailed:
      ++report.delivery_failures;
      break;
    default:
      break;
    }
    ++report.checked;
  }
  try {
    store_.persist();
    report.persisted = true;
  } catch (const PersistenceError &e) {
    watcher_log()->warn("Failed to save state: {}", e.what());
    report.persist_error = e.what();
  }
  watcher_log()->debug("Cycle finished: {} checked, {} failed, {} notified",
                       report.checked, report.failed, report.notified);
  return report;
}

/**
 * Sleep until @p deadline in short slices so a raised stop flag is noticed
 * promptly.
 *
 * @return `false` if the stop flag was raised before the deadline.
 */
bool Watcher::wait_until(std::chrono::steady_clock::time_point deadline,
                         const std::atomic<bool> &stop) const {
  while (!stop.load()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(
        std::min(remaining + std::chrono::milliseconds(1), kStopPollSlice));
  }
  return false;
}

RunOutcome Watcher::run(const std::atomic<bool> &stop) {
  if (store_.empty()) {
    watcher_log()->info(
        "No PRs being watched. Add some with 'prwatch watch <PR_URL>'.");
    return RunOutcome::Idle;
  }
  watcher_log()->info("Starting watcher with {} second poll interval",
                      std::chrono::duration_cast<std::chrono::seconds>(
                          options_.poll_interval)
                          .count());
  auto next = std::chrono::steady_clock::now();
  while (true) {
    CycleReport report = check_all();
    if (cycle_cb_) {
      cycle_cb_(report);
    }
    auto now = std::chrono::steady_clock::now();
    next += options_.poll_interval;
    while (next <= now) {
      next += options_.poll_interval;
    }
    if (!wait_until(next, stop)) {
      watcher_log()->info("Watcher stopped.");
      return RunOutcome::Cancelled;
    }
  }
}

} // namespace prw
