#include "commands.hpp"
#include "log.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace prw {

const char *const kMissingTokenMessage =
    "missing GITHUB_TOKEN; set it as an environment variable or configure it "
    "with 'prwatch config set github_token <token>'";

namespace {

constexpr std::size_t kMaxTitleWidth = 50;

std::shared_ptr<spdlog::logger> commands_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

PullRequestKey require_pr_url(const std::string &url) {
  auto key = parse_pr_url(url);
  if (!key) {
    throw CommandError("invalid PR URL '" + url +
                       "' (expected https://github.com/<owner>/<repo>/pull/"
                       "<number>)");
  }
  return *key;
}

std::string truncate_title(const std::string &title) {
  if (title.size() <= kMaxTitleWidth) {
    return title;
  }
  return title.substr(0, kMaxTitleWidth - 3) + "...";
}

/// Strictly parse a positive decimal integer.
bool parse_positive_int(const std::string &value, int &out) {
  if (value.empty() || value.size() > 9 ||
      !std::all_of(value.begin(), value.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }
  out = std::stoi(value);
  return out > 0;
}

} // namespace

std::shared_ptr<MultiNotifier> make_notifier(const NotifierSetup &setup,
                                             std::ostream &out) {
  auto notifier = std::make_shared<MultiNotifier>();
  notifier->add(std::make_shared<ConsoleNotifier>(out));
  if (!setup.webhook_url.empty()) {
    notifier->add(std::make_shared<WebhookNotifier>(
        setup.webhook_url, setup.http, setup.timeout_ms));
  }
  if (setup.desktop) {
    notifier->add(std::make_shared<DesktopNotifier>());
  }
  return notifier;
}

void cmd_watch(WatchStore &store, StatusClient &client, const std::string &url,
               std::ostream &out) {
  PullRequestKey key = require_pr_url(url);
  if (store.find(key) != nullptr) {
    out << "PR " << to_string(key) << " is already being watched.\n";
    return;
  }
  PullRequestHead head = client.fetch_head(key.owner, key.repo, key.number);
  WatchedPullRequest entry;
  entry.key = key;
  entry.title = head.title;
  store.add(std::move(entry));
  store.persist();
  out << "Now watching: " << to_string(key);
  if (!head.title.empty()) {
    out << " - " << head.title;
  }
  out << '\n';
  commands_log()->debug("Watching {} (head {})", to_string(key), head.sha);
}

void cmd_unwatch(WatchStore &store, const std::string &url,
                 std::ostream &out) {
  PullRequestKey key = require_pr_url(url);
  if (!store.remove(key)) {
    out << "PR " << to_string(key) << " is not being watched.\n";
    return;
  }
  store.persist();
  out << "Stopped watching: " << to_string(key) << '\n';
}

void cmd_list(const WatchStore &store, bool json, std::ostream &out) {
  if (json) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &entry : store.entries()) {
      nlohmann::json item = {{"owner", entry.key.owner},
                             {"repo", entry.key.repo},
                             {"number", entry.key.number},
                             {"status", display_string(entry.last_known_state)}};
      if (entry.checked()) {
        item["last_checked"] = format_rfc3339(entry.last_checked);
      }
      if (!entry.title.empty()) {
        item["title"] = entry.title;
      }
      arr.push_back(std::move(item));
    }
    out << arr.dump(2) << '\n';
    return;
  }
  if (store.empty()) {
    out << "No PRs being watched.\n";
    return;
  }

  using Row = std::array<std::string, 5>;
  std::vector<Row> rows;
  rows.push_back({"REPO", "PR", "STATUS", "LAST CHECKED", "TITLE"});
  for (const auto &entry : store.entries()) {
    rows.push_back({entry.key.owner + "/" + entry.key.repo,
                    "#" + std::to_string(entry.key.number),
                    display_string(entry.last_known_state),
                    entry.checked() ? format_local_minutes(entry.last_checked)
                                    : std::string("never"),
                    truncate_title(entry.title)});
  }
  std::array<std::size_t, 5> widths{};
  for (const auto &row : rows) {
    for (std::size_t i = 0; i < row.size(); ++i) {
      widths[i] = std::max(widths[i], row[i].size());
    }
  }
  for (const auto &row : rows) {
    for (std::size_t i = 0; i < row.size(); ++i) {
      if (i + 1 == row.size()) {
        out << row[i];
      } else {
        out << std::left << std::setw(static_cast<int>(widths[i] + 2))
            << row[i];
      }
    }
    out << '\n';
  }
}

void cmd_broadcast(WatchStore &store, StatusClient &client, Notifier &notifier,
                   const BroadcastOptions &options, std::ostream &out) {
  if (store.empty()) {
    out << "No PRs being watched.\n";
    return;
  }
  BroadcastReport report =
      run_broadcast(client, store, notifier, options, out);
  if (options.dry_run) {
    out << "Dry-run complete (no webhook calls made).\n";
  } else if (report.sent == 0) {
    out << "No notifications sent (filter may have excluded all PRs).\n";
  }
  commands_log()->debug(
      "Broadcast: {} checked, {} failed, {} included, {} sent",
      report.checked, report.failed, report.included, report.sent);
}

void cmd_config_show(const WatchStore &store, std::ostream &out) {
  const WatchSettings &settings = store.settings();
  ResolvedToken token = resolve_github_token(settings);
  out << "Config file: " << store.path() << '\n';
  out << "Poll interval: " << settings.poll_interval_seconds << " seconds\n";
  out << "Notification filter: " << to_string(settings.notification_filter)
      << '\n';
  out << "Webhook URL: "
      << (settings.webhook_url.empty() ? std::string("(not set)")
                                       : settings.webhook_url)
      << '\n';
  out << "GitHub token: "
      << (token.source == TokenSource::None
              ? std::string("not set")
              : "set (" + to_string(token.source) + ")")
      << '\n';
  out << "Watched PRs: " << store.size() << '\n';
}

void cmd_config_set(WatchStore &store, const std::string &key,
                    const std::string &value, std::ostream &out) {
  WatchSettings &settings = store.settings();
  if (key == "poll_interval_seconds") {
    int interval = 0;
    if (!parse_positive_int(value, interval)) {
      throw CommandError("poll_interval_seconds must be a positive integer");
    }
    settings.poll_interval_seconds = interval;
  } else if (key == "webhook_url") {
    settings.webhook_url = value;
  } else if (key == "github_token") {
    settings.github_token = value;
  } else if (key == "notification_filter") {
    auto filter = notification_filter_from_string(value);
    if (!filter) {
      commands_log()->warn("Unknown notification_filter '{}'; using 'change'",
                           value);
    }
    settings.notification_filter = filter.value_or(NotificationFilter::Change);
  } else {
    throw CommandError("unknown config key '" + key +
                       "' (expected poll_interval_seconds, webhook_url, "
                       "github_token or notification_filter)");
  }
  store.persist();
  if (key == "github_token") {
    out << "Set github_token\n";
  } else if (key == "notification_filter") {
    out << "Set notification_filter = "
        << to_string(settings.notification_filter) << '\n';
  } else {
    out << "Set " << key << " = " << value << '\n';
  }
}

void cmd_config_unset(WatchStore &store, const std::string &key,
                      std::ostream &out) {
  WatchSettings &settings = store.settings();
  if (key == "poll_interval_seconds") {
    settings.poll_interval_seconds = kDefaultPollIntervalSeconds;
  } else if (key == "webhook_url") {
    settings.webhook_url.clear();
  } else if (key == "github_token") {
    settings.github_token.clear();
  } else if (key == "notification_filter") {
    settings.notification_filter = NotificationFilter::Change;
  } else {
    throw CommandError("unknown config key '" + key + "'");
  }
  store.persist();
  out << "Unset " << key << '\n';
}

} // namespace prw
