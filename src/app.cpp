#include "app.hpp"
#include "broadcast.hpp"
#include "cli.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "github_client.hpp"
#include "log.hpp"
#include "version.hpp"
#include "watch_store.hpp"
#include "watcher.hpp"
#include <exception>
#include <memory>
#include <ostream>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace prw {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

bool needs_token(Command command) {
  return command == Command::Watch || command == Command::Run ||
         command == Command::Broadcast;
}
} // namespace

/**
 * Execute the startup flow.
 *
 * This routine orchestrates CLI parsing, option file loading and logger
 * initialization. Subcommands run later through execute().
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  if (!options_.config_file.empty()) {
    try {
      config_ = Config::from_file(options_.config_file);
    } catch (const std::exception &e) {
      app_log()->error("Failed to load option file {}: {}",
                       options_.config_file, e.what());
      should_exit_ = true;
      return 1;
    }
  }

  std::string level_str = options_.verbose ? "debug" : config_.log_level();
  if (!options_.log_level.empty()) {
    level_str = options_.log_level;
  }
  spdlog::level::level_enum lvl = spdlog::level::from_str(level_str);
  if (lvl == spdlog::level::off && level_str != "off") {
    app_log()->warn("Unknown log level '{}'; using info", level_str);
    lvl = spdlog::level::info;
  }
  std::string log_file = config_.log_file();
  if (!options_.log_file.empty()) {
    log_file = options_.log_file;
  }
  init_logger(lvl, config_.log_pattern(), log_file,
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, category_level] : config_.log_categories()) {
    auto parsed = spdlog::level::from_str(category_level);
    if (parsed == spdlog::level::off && category_level != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      category_level, category);
      continue;
    }
    category_levels[category] = parsed;
  }
  configure_log_categories(category_levels);

  if (!options_.state_file.empty()) {
    state_path_ = options_.state_file;
  } else if (!config_.state_file().empty()) {
    state_path_ = config_.state_file();
  } else {
    state_path_ = default_state_path();
  }
  app_log()->debug("Using state file {}", state_path_);
  return 0;
}

long App::timeout_ms() const {
  int seconds = options_.http_timeout > 0 ? options_.http_timeout
                                          : config_.http_timeout();
  return static_cast<long>(seconds) * 1000;
}

int App::execute(const std::atomic<bool> &stop, std::ostream &out) {
  if (options_.command == Command::Version) {
    out << "prwatch version " << version_string() << '\n';
    return 0;
  }
  if (options_.command == Command::Completion) {
    out << options_.completion_script;
    return 0;
  }
  try {
    WatchStore store = WatchStore::load(state_path_);
    switch (options_.command) {
    case Command::Unwatch:
      cmd_unwatch(store, options_.pr_url, out);
      return 0;
    case Command::List:
      cmd_list(store, options_.list_json, out);
      return 0;
    case Command::ConfigShow:
      cmd_config_show(store, out);
      return 0;
    case Command::ConfigSet:
      cmd_config_set(store, options_.config_key, options_.config_value, out);
      return 0;
    case Command::ConfigUnset:
      cmd_config_unset(store, options_.config_key, out);
      return 0;
    default:
      break;
    }
    if (!needs_token(options_.command)) {
      app_log()->error("No command given");
      return 1;
    }

    if (options_.command == Command::Broadcast && store.empty()) {
      out << "No PRs being watched.\n";
      return 0;
    }

    ResolvedToken token = resolve_github_token(store.settings());
    if (token.value.empty()) {
      app_log()->error("{}", kMissingTokenMessage);
      return 1;
    }
    if (!http_) {
      http_ = std::make_shared<CurlHttpClient>(timeout_ms());
    }
    const std::string api_base =
        options_.api_base.empty() ? config_.api_base() : options_.api_base;
    GitHubClient client(token.value, http_, api_base, timeout_ms());

    if (options_.command == Command::Watch) {
      cmd_watch(store, client, options_.pr_url, out);
      return 0;
    }

    const WatchSettings &settings = store.settings();
    if (options_.command == Command::Broadcast) {
      auto filter = broadcast_filter_from_string(options_.broadcast_filter);
      if (!filter) {
        throw CommandError("invalid --filter value '" +
                           options_.broadcast_filter +
                           "' (expected all, changed, or failing)");
      }
      BroadcastOptions opts;
      opts.filter = *filter;
      opts.dry_run = options_.dry_run;
      NotifierSetup setup;
      if (!opts.dry_run) {
        setup.webhook_url = options_.webhook_override.empty()
                                ? settings.webhook_url
                                : options_.webhook_override;
      }
      setup.timeout_ms = timeout_ms();
      setup.http = http_;
      auto notifier = make_notifier(setup, out);
      cmd_broadcast(store, client, *notifier, opts, out);
      return 0;
    }

    WatchOptions watch_opts;
    watch_opts.poll_interval =
        std::chrono::seconds(settings.poll_interval_seconds);
    watch_opts.filter = settings.notification_filter;
    if (!options_.notify_on.empty()) {
      auto filter = notification_filter_from_string(options_.notify_on);
      if (!filter) {
        app_log()->warn("Unknown --on value '{}'; notifying on any change",
                        options_.notify_on);
      }
      watch_opts.filter = filter.value_or(NotificationFilter::Change);
    }
    NotifierSetup setup;
    setup.webhook_url = settings.webhook_url;
    setup.desktop = config_.desktop_notifications();
    setup.timeout_ms = timeout_ms();
    setup.http = http_;
    Watcher watcher(client, store, make_notifier(setup, out), watch_opts);
    run_outcome_ = watcher.run(stop);
    if (*run_outcome_ == RunOutcome::Cancelled) {
      app_log()->info("Watcher stopped on request");
    } else {
      app_log()->info("Watcher exited: nothing to watch");
    }
    return 0;
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
}

} // namespace prw
