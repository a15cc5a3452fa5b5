#include "watch_store.hpp"
#include "log.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

namespace prw {

namespace {

namespace fs = std::filesystem;

std::shared_ptr<spdlog::logger> store_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("store");
  }();
  return logger;
}

/**
 * Fetch an environment variable in a cross-platform manner.
 *
 * @param name Null-terminated environment variable name.
 * @return Variable contents or an empty string if unavailable.
 */
std::string get_env_var(const char *name) {
#ifdef _WIN32
  char *buf = nullptr;
  size_t sz = 0;
  if (_dupenv_s(&buf, &sz, name) == 0 && buf) {
    std::string value(buf);
    std::free(buf);
    return value;
  }
  return {};
#else
  const char *env = std::getenv(name);
  return env ? std::string(env) : std::string();
#endif
}

std::string string_field(const nlohmann::json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

nlohmann::json entry_to_json(const WatchedPullRequest &entry) {
  nlohmann::json j = {{"owner", entry.key.owner},
                      {"repo", entry.key.repo},
                      {"number", entry.key.number}};
  if (!entry.last_known_sha.empty()) {
    j["last_known_sha"] = entry.last_known_sha;
  }
  if (!entry.last_known_state.empty()) {
    j["last_known_state"] = entry.last_known_state.str();
  }
  if (entry.checked()) {
    j["last_checked"] = format_rfc3339(entry.last_checked);
  }
  if (!entry.title.empty()) {
    j["title"] = entry.title;
  }
  return j;
}

/**
 * Read a JSON integer that must fit in a positive `int`.
 *
 * @return `false` for non-integers, zero, negatives and values above
 *         `INT_MAX`; @p out is left untouched in that case.
 */
bool positive_int_field(const nlohmann::json &value, int &out) {
  if (!value.is_number_integer()) {
    return false;
  }
  constexpr auto max = static_cast<unsigned long long>(
      std::numeric_limits<int>::max());
  if (value.is_number_unsigned()) {
    auto v = value.get<unsigned long long>();
    if (v == 0 || v > max) {
      return false;
    }
    out = static_cast<int>(v);
    return true;
  }
  auto v = value.get<long long>();
  if (v <= 0 || static_cast<unsigned long long>(v) > max) {
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

/// @return `false` when the record lacks a usable key.
bool entry_from_json(const nlohmann::json &j, WatchedPullRequest &out) {
  if (!j.is_object()) {
    return false;
  }
  out.key.owner = string_field(j, "owner");
  out.key.repo = string_field(j, "repo");
  auto number = j.find("number");
  if (number == j.end() || !positive_int_field(*number, out.key.number)) {
    return false;
  }
  if (out.key.owner.empty() || out.key.repo.empty()) {
    return false;
  }
  out.last_known_sha = string_field(j, "last_known_sha");
  out.last_known_state = CiState::parse(string_field(j, "last_known_state"));
  out.title = string_field(j, "title");
  std::string checked = string_field(j, "last_checked");
  if (!checked.empty()) {
    auto tp = parse_rfc3339(checked);
    if (tp) {
      out.last_checked = *tp;
    } else {
      store_log()->warn("Ignoring malformed last_checked '{}' for {}",
                        checked, to_string(out.key));
    }
  }
  return true;
}

} // namespace

ResolvedToken resolve_github_token(const WatchSettings &settings) {
  if (!settings.github_token.empty()) {
    return {settings.github_token, TokenSource::Config};
  }
  std::string env = get_env_var("GITHUB_TOKEN");
  if (!env.empty()) {
    return {env, TokenSource::Environment};
  }
  return {};
}

std::string to_string(TokenSource source) {
  switch (source) {
  case TokenSource::Config:
    return "config file";
  case TokenSource::Environment:
    return "environment variable";
  case TokenSource::None:
    return "not set";
  }
  return "not set";
}

std::string default_state_path() {
  std::string home = get_env_var("HOME");
#ifdef _WIN32
  if (home.empty()) {
    home = get_env_var("USERPROFILE");
  }
#endif
  fs::path base = home.empty() ? fs::path(".") : fs::path(home);
  return (base / ".prw" / "config.json").string();
}

WatchStore::WatchStore(std::string path) : path_(std::move(path)) {}

WatchStore WatchStore::load(const std::string &path) {
  WatchStore store(path);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    store_log()->debug("No state file at {}; using defaults", path);
    return store;
  }
  std::ifstream in(path);
  if (!in) {
    throw PersistenceError("failed to read state file " + path);
  }
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception &e) {
    store_log()->error("Failed to parse state file {}: {}", path, e.what());
    throw PersistenceError("failed to parse state file " + path + ": " +
                           e.what());
  }
  if (!j.is_object()) {
    throw PersistenceError("state file " + path + " is not a JSON object");
  }

  WatchSettings &settings = store.settings_;
  auto interval = j.find("poll_interval_seconds");
  if (interval != j.end() &&
      !positive_int_field(*interval, settings.poll_interval_seconds)) {
    store_log()->warn("Invalid poll_interval_seconds in {}; using {}", path,
                      kDefaultPollIntervalSeconds);
  }
  settings.webhook_url = string_field(j, "webhook_url");
  settings.github_token = string_field(j, "github_token");
  std::string filter = string_field(j, "notification_filter");
  if (!filter.empty() && !notification_filter_from_string(filter)) {
    store_log()->warn("Unknown notification_filter '{}'; using 'change'",
                      filter);
  }
  settings.notification_filter = normalize_notification_filter(filter);

  auto list = j.find("watched_prs");
  if (list != j.end() && list->is_array()) {
    for (const auto &item : *list) {
      WatchedPullRequest entry;
      if (!entry_from_json(item, entry)) {
        store_log()->warn("Skipping malformed watched_prs entry: {}",
                          item.dump());
        continue;
      }
      if (!store.add(std::move(entry))) {
        store_log()->warn("Skipping duplicate watched_prs entry: {}",
                          item.dump());
      }
    }
  }
  store_log()->debug("Loaded {} watched pull request(s) from {}",
                     store.size(), path);
  return store;
}

void WatchStore::persist() const {
  nlohmann::json j;
  j["poll_interval_seconds"] = settings_.poll_interval_seconds;
  if (!settings_.webhook_url.empty()) {
    j["webhook_url"] = settings_.webhook_url;
  }
  if (!settings_.github_token.empty()) {
    j["github_token"] = settings_.github_token;
  }
  j["notification_filter"] = to_string(settings_.notification_filter);
  nlohmann::json list = nlohmann::json::array();
  for (const auto &entry : entries_) {
    list.push_back(entry_to_json(entry));
  }
  j["watched_prs"] = std::move(list);

  fs::path target(path_);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw PersistenceError("failed to create directory " +
                             target.parent_path().string() + ": " +
                             ec.message());
    }
  }
  fs::path tmp(path_ + ".tmp");
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw PersistenceError("failed to open " + tmp.string() +
                             " for writing");
    }
    out << j.dump(2) << '\n';
    out.flush();
    if (!out) {
      throw PersistenceError("failed to write " + tmp.string());
    }
  }
  fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace, ec);
  if (ec) {
    store_log()->debug("Could not restrict permissions on {}: {}",
                       tmp.string(), ec.message());
    ec.clear();
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw PersistenceError("failed to replace " + path_ + ": " +
                           ec.message());
  }
  store_log()->debug("Saved {} watched pull request(s) to {}",
                     entries_.size(), path_);
}

bool WatchStore::add(WatchedPullRequest entry) {
  if (find(entry.key) != nullptr) {
    return false;
  }
  entries_.push_back(std::move(entry));
  return true;
}

bool WatchStore::remove(const PullRequestKey &key) {
  auto it = std::find_if(
      entries_.begin(), entries_.end(),
      [&key](const WatchedPullRequest &entry) { return entry.key == key; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

const WatchedPullRequest *WatchStore::find(const PullRequestKey &key) const {
  for (const auto &entry : entries_) {
    if (entry.key == key) {
      return &entry;
    }
  }
  return nullptr;
}

WatchedPullRequest *WatchStore::find_mutable(const PullRequestKey &key) {
  for (auto &entry : entries_) {
    if (entry.key == key) {
      return &entry;
    }
  }
  return nullptr;
}

bool WatchStore::update_observed(const PullRequestKey &key, std::string sha,
                                 CiState state,
                                 std::chrono::system_clock::time_point now) {
  WatchedPullRequest *entry = find_mutable(key);
  if (entry == nullptr) {
    return false;
  }
  entry->last_known_sha = std::move(sha);
  entry->last_known_state = std::move(state);
  entry->last_checked = now;
  return true;
}

bool WatchStore::refresh_title(const PullRequestKey &key,
                               const std::string &title) {
  WatchedPullRequest *entry = find_mutable(key);
  if (entry == nullptr || title.empty() || entry->title == title) {
    return false;
  }
  entry->title = title;
  return true;
}

} // namespace prw
