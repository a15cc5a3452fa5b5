#include "broadcast.hpp"
#include "log.hpp"
#include "watcher.hpp"
#include <exception>
#include <memory>
#include <ostream>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace prw {

namespace {

std::shared_ptr<spdlog::logger> broadcast_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("broadcast");
  }();
  return logger;
}

} // namespace

bool broadcast_includes(BroadcastFilter filter, const CiState &previous,
                        const CiState &current) {
  switch (filter) {
  case BroadcastFilter::All:
    return true;
  case BroadcastFilter::Changed:
    return !previous.empty() && previous != current;
  case BroadcastFilter::Failing:
    return current.is_failing();
  }
  return false;
}

BroadcastReport run_broadcast(StatusClient &client, WatchStore &store,
                              Notifier &notifier,
                              const BroadcastOptions &options,
                              std::ostream &out) {
  BroadcastReport report;
  std::vector<PullRequestKey> keys;
  keys.reserve(store.size());
  for (const auto &entry : store.entries()) {
    keys.push_back(entry.key);
  }
  broadcast_log()->debug("Broadcasting {} pull request(s) with filter '{}'",
                         keys.size(), to_string(options.filter));

  for (const auto &key : keys) {
    Observation obs;
    try {
      obs = observe_pull_request(client, store, key);
    } catch (const std::exception &e) {
      broadcast_log()->warn("Error fetching status for {}: {}",
                            to_string(key), e.what());
      ++report.failed;
      continue;
    }
    ++report.checked;

    if (broadcast_includes(options.filter, obs.previous_state,
                           obs.current_state)) {
      ++report.included;
      if (options.dry_run) {
        out << "DRY RUN: " << to_string(key)
            << " status=" << display_string(obs.current_state)
            << " (prev=" << display_string(obs.previous_state) << ")\n";
      } else {
        StatusChangeEvent event{obs.key,           obs.title,
                                obs.previous_state, obs.current_state,
                                obs.sha,           obs.checked_at};
        try {
          notifier.notify(event);
          ++report.sent;
        } catch (const std::exception &e) {
          broadcast_log()->warn("Notification failed for {}: {}",
                                to_string(key), e.what());
          ++report.delivery_failures;
        }
      }
    }

    store.update_observed(key, std::move(obs.sha), obs.current_state,
                          obs.checked_at);
  }

  store.persist();
  return report;
}

} // namespace prw
