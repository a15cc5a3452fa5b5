#include "watcher.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace prw;
namespace fs = std::filesystem;

namespace {

/// Status client returning scripted heads and states per pull request.
class ScriptedStatusClient : public StatusClient {
public:
  struct Script {
    std::string sha = "sha";
    std::string title;
    std::string state;
    bool fail = false;
  };
  std::map<int, Script> scripts;
  int head_calls = 0;

  PullRequestHead fetch_head(const std::string &owner, const std::string &repo,
                             int number) override {
    (void)owner;
    (void)repo;
    ++head_calls;
    const Script &s = scripts.at(number);
    if (s.fail) {
      throw GitHubTransportError("network down");
    }
    return {s.sha, s.title};
  }

  std::string fetch_aggregate_status(const std::string &owner,
                                     const std::string &repo,
                                     const std::string &sha) override {
    (void)owner;
    (void)repo;
    for (const auto &[number, s] : scripts) {
      (void)number;
      if (s.sha == sha) {
        return s.state;
      }
    }
    throw NotFoundError("unknown sha " + sha);
  }
};

class RecordingNotifier : public Notifier {
public:
  std::vector<StatusChangeEvent> events;
  bool fail = false;

  void notify(const StatusChangeEvent &event) override {
    events.push_back(event);
    if (fail) {
      throw NotificationError("sink down");
    }
  }
  std::string name() const override { return "recording"; }
};

/// Notifier noting whether the state file existed at delivery time.
class StateFileNotifier : public Notifier {
public:
  explicit StateFileNotifier(std::string path) : path_(std::move(path)) {}

  std::vector<bool> file_seen;

  void notify(const StatusChangeEvent &) override {
    file_seen.push_back(fs::exists(path_));
  }
  std::string name() const override { return "file"; }

private:
  std::string path_;
};

/// Webhook transport answering every POST with a fixed status.
class FixedStatusHttpClient : public HttpClient {
public:
  int status = 500;
  std::vector<std::string> bodies;

  HttpResponse get(const std::string &,
                   const std::vector<std::string> &) override {
    throw TransportError("unexpected GET");
  }
  HttpResponse post(const std::string &, const std::string &data,
                    const std::vector<std::string> &) override {
    bodies.push_back(data);
    HttpResponse res;
    res.status_code = status;
    return res;
  }
};

std::string temp_state(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return (dir / "config.json").string();
}

PullRequestKey key_for(int number) { return {"o", "r", number}; }

WatchedPullRequest entry_for(int number, CiState state = CiState()) {
  WatchedPullRequest entry;
  entry.key = key_for(number);
  entry.last_known_state = state;
  return entry;
}

WatchOptions options_with(NotificationFilter filter) {
  WatchOptions opts;
  opts.filter = filter;
  return opts;
}

} // namespace

TEST_CASE("first observation is a silent baseline") {
  ScriptedStatusClient client;
  client.scripts[1] = {"s1", "Title", "pending"};
  WatchStore store(temp_state("prw_watch_baseline"));
  store.add(entry_for(1));
  auto notifier = std::make_shared<RecordingNotifier>();
  Watcher watcher(client, store, notifier,
                  options_with(NotificationFilter::Change));

  CHECK(watcher.check(key_for(1)) == CheckResult::Baseline);
  CHECK(notifier->events.empty());
  const WatchedPullRequest *entry = store.find(key_for(1));
  CHECK(entry->last_known_state == CiState::pending());
  CHECK(entry->last_known_sha == "s1");
  CHECK(entry->title == "Title");
  CHECK(entry->checked());
}

TEST_CASE("transition emits exactly one event with both states") {
  ScriptedStatusClient client;
  client.scripts[1] = {"s2", "", "failure"};
  WatchStore store(temp_state("prw_watch_transition"));
  store.add(entry_for(1, CiState::pending()));
  auto notifier = std::make_shared<RecordingNotifier>();
  Watcher watcher(client, store, notifier,
                  options_with(NotificationFilter::Change));

  CHECK(watcher.check(key_for(1)) == CheckResult::Notified);
  REQUIRE(notifier->events.size() == 1);
  const StatusChangeEvent &event = notifier->events[0];
  CHECK(event.previous_state == CiState::pending());
  CHECK(event.current_state == CiState::failure());
  CHECK(event.sha == "s2");
  CHECK(event.key == key_for(1));

  CHECK(watcher.check(key_for(1)) == CheckResult::Unchanged);
  CHECK(notifier->events.size() == 1);
}

TEST_CASE("filter suppresses unwanted transitions but still records them") {
  ScriptedStatusClient client;
  client.scripts[1] = {"s", "", "success"};
  WatchStore store(temp_state("prw_watch_filter"));
  store.add(entry_for(1, CiState::pending()));
  auto notifier = std::make_shared<RecordingNotifier>();
  Watcher watcher(client, store, notifier,
                  options_with(NotificationFilter::Fail));

  CHECK(watcher.check(key_for(1)) == CheckResult::Suppressed);
  CHECK(notifier->events.empty());
  CHECK(store.find(key_for(1))->last_known_state == CiState::success());

  client.scripts[1].state = "error";
  CHECK(watcher.check(key_for(1)) == CheckResult::Notified);
  REQUIRE(notifier->events.size() == 1);
  CHECK(notifier->events[0].previous_state == CiState::success());
}

TEST_CASE("failed fetch leaves the stored state untouched") {
  ScriptedStatusClient client;
  client.scripts[1] = {"s", "", "failure", true};
  WatchStore store(temp_state("prw_watch_fetchfail"));
  store.add(entry_for(1, CiState::pending()));
  auto notifier = std::make_shared<RecordingNotifier>();
  Watcher watcher(client, store, notifier,
                  options_with(NotificationFilter::Change));

  CHECK(watcher.check(key_for(1)) == CheckResult::FetchFailed);
  CHECK(notifier->events.empty());
  const WatchedPullRequest *entry = store.find(key_for(1));
  CHECK(entry->last_known_state == CiState::pending());
  CHECK_FALSE(entry->checked());
}

TEST_CASE("delivery failure still commits the new state") {
  ScriptedStatusClient client;
  client.scripts[1] = {"s", "", "failure"};
  WatchStore store(temp_state("prw_watch_delivery"));
  store.add(entry_for(1, CiState::success()));
  auto notifier = std::make_shared<RecordingNotifier>();
  notifier->fail = true;
  Watcher watcher(client, store, notifier,
                  options_with(NotificationFilter::Change));

  CHECK(watcher.check(key_for(1)) == CheckResult::DeliveryFailed);
  CHECK(store.find(key_for(1))->last_known_state == CiState::failure());
  CHECK(watcher.check(key_for(1)) == CheckResult::Unchanged);
  CHECK(notifier->events.size() == 1);
}

TEST_CASE("check_all isolates failures and persists once") {
  ScriptedStatusClient client;
  client.scripts[1] = {"a", "", "failure"};
  client.scripts[2] = {"b", "", "success", true};
  client.scripts[3] = {"c", "", "success"};
  std::string path = temp_state("prw_watch_cycle");
  WatchStore store(path);
  store.add(entry_for(1, CiState::pending()));
  store.add(entry_for(2, CiState::pending()));
  store.add(entry_for(3, CiState::success()));
  auto notifier = std::make_shared<RecordingNotifier>();
  Watcher watcher(client, store, notifier,
                  options_with(NotificationFilter::Change));

  CycleReport report = watcher.check_all();
  CHECK(report.checked == 2);
  CHECK(report.failed == 1);
  CHECK(report.notified == 1);
  CHECK(report.delivery_failures == 0);
  CHECK(report.persisted);
  CHECK(client.head_calls == 3);

  WatchStore reloaded = WatchStore::load(path);
  CHECK(reloaded.find(key_for(1))->last_known_state == CiState::failure());
  CHECK(reloaded.find(key_for(2))->last_known_state == CiState::pending());
}

TEST_CASE("check_all writes the state file after the last check") {
  ScriptedStatusClient client;
  client.scripts[1] = {"a", "", "failure"};
  client.scripts[2] = {"b", "", "failure"};
  std::string path = temp_state("prw_watch_single_write");
  WatchStore store(path);
  store.add(entry_for(1, CiState::pending()));
  store.add(entry_for(2, CiState::success()));
  auto notifier = std::make_shared<StateFileNotifier>(path);
  Watcher watcher(client, store, notifier,
                  options_with(NotificationFilter::Change));

  CycleReport report = watcher.check_all();
  REQUIRE(notifier->file_seen.size() == 2);
  CHECK_FALSE(notifier->file_seen[0]);
  CHECK_FALSE(notifier->file_seen[1]);
  CHECK(report.persisted);
  CHECK(fs::exists(path));
  CHECK_FALSE(fs::exists(path + ".tmp"));
}

TEST_CASE("failing webhook does not block the cycle") {
  ScriptedStatusClient client;
  client.scripts[1] = {"a", "", "failure"};
  client.scripts[2] = {"b", "", "success"};
  std::string path = temp_state("prw_watch_webhook_500");
  WatchStore store(path);
  store.add(entry_for(1, CiState::success()));
  store.add(entry_for(2, CiState::pending()));
  auto http = std::make_shared<FixedStatusHttpClient>();
  auto webhook =
      std::make_shared<WebhookNotifier>("https://hooks.example/prw", http);
  Watcher watcher(client, store, webhook,
                  options_with(NotificationFilter::Change));

  CycleReport report = watcher.check_all();
  CHECK(http->bodies.size() == 2);
  CHECK(report.checked == 2);
  CHECK(report.failed == 0);
  CHECK(report.delivery_failures == 2);
  CHECK(report.persisted);
  WatchStore reloaded = WatchStore::load(path);
  CHECK(reloaded.find(key_for(1))->last_known_state == CiState::failure());
  CHECK(reloaded.find(key_for(2))->last_known_state == CiState::success());
}

TEST_CASE("check_all survives a persistence failure") {
  fs::path dir = fs::temp_directory_path() / "prw_watch_blocked";
  fs::remove_all(dir);
  fs::create_directories(dir);
  {
    std::ofstream blocker(dir / "blocker");
    blocker << "x";
  }
  ScriptedStatusClient client;
  client.scripts[1] = {"a", "", "success"};
  WatchStore store((dir / "blocker" / "config.json").string());
  store.add(entry_for(1));
  Watcher watcher(client, store, nullptr,
                  options_with(NotificationFilter::Change));
  CycleReport report = watcher.check_all();
  CHECK_FALSE(report.persisted);
  CHECK_FALSE(report.persist_error.empty());
  CHECK(store.find(key_for(1))->last_known_state == CiState::success());
}

TEST_CASE("observe_pull_request requires a watched key") {
  ScriptedStatusClient client;
  WatchStore store(temp_state("prw_watch_observe"));
  CHECK_THROWS_AS(observe_pull_request(client, store, key_for(9)),
                  std::out_of_range);
}

TEST_CASE("non-positive interval falls back to the default") {
  ScriptedStatusClient client;
  WatchStore store(temp_state("prw_watch_interval"));
  WatchOptions opts;
  opts.poll_interval = std::chrono::milliseconds(0);
  Watcher watcher(client, store, nullptr, opts);
  CHECK(watcher.options().poll_interval ==
        std::chrono::seconds(kDefaultPollIntervalSeconds));
}

TEST_CASE("run returns immediately with nothing to watch") {
  ScriptedStatusClient client;
  WatchStore store(temp_state("prw_watch_idle"));
  Watcher watcher(client, store, nullptr, WatchOptions{});
  std::atomic<bool> stop{false};
  CHECK(watcher.run(stop) == RunOutcome::Idle);
  CHECK(client.head_calls == 0);
}

TEST_CASE("run checks immediately and stops when cancelled") {
  ScriptedStatusClient client;
  client.scripts[1] = {"a", "", "pending"};
  WatchStore store(temp_state("prw_watch_run"));
  store.add(entry_for(1));
  WatchOptions opts;
  opts.poll_interval = std::chrono::milliseconds(50);
  Watcher watcher(client, store, nullptr, opts);

  std::atomic<bool> stop{false};
  std::atomic<int> cycles{0};
  watcher.set_cycle_callback([&](const CycleReport &report) {
    CHECK(report.checked == 1);
    if (++cycles >= 3) {
      stop.store(true);
    }
  });
  CHECK(watcher.run(stop) == RunOutcome::Cancelled);
  CHECK(cycles.load() == 3);
  CHECK(client.head_calls == 3);
}

TEST_CASE("run exits promptly when stopped between cycles") {
  ScriptedStatusClient client;
  client.scripts[1] = {"a", "", "pending"};
  WatchStore store(temp_state("prw_watch_stop"));
  store.add(entry_for(1));
  WatchOptions opts;
  opts.poll_interval = std::chrono::seconds(60);
  Watcher watcher(client, store, nullptr, opts);

  std::atomic<bool> stop{false};
  std::thread stopper([&stop] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    stop.store(true);
  });
  auto started = std::chrono::steady_clock::now();
  RunOutcome outcome = watcher.run(stop);
  stopper.join();
  CHECK(outcome == RunOutcome::Cancelled);
  CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
  CHECK(client.head_calls == 1);
}
