/**
 * @file commands.hpp
 * @brief Implementations of the one-shot subcommands.
 *
 * Each command writes user-facing output to the supplied stream and reports
 * failures by throwing; App maps exceptions to a non-zero exit code.
 */

#ifndef PRWATCH_COMMANDS_HPP
#define PRWATCH_COMMANDS_HPP

#include "broadcast.hpp"
#include "config.hpp"
#include "github_client.hpp"
#include "http_client.hpp"
#include "notification.hpp"
#include "watch_store.hpp"
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>

namespace prw {

/** Invalid user input to a command (bad URL, unknown key, bad value). */
class CommandError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Message used when no API token can be resolved.
extern const char *const kMissingTokenMessage;

/**
 * Sinks to combine for a notifier.
 */
struct NotifierSetup {
  std::string webhook_url;   ///< Webhook endpoint; empty to skip
  bool desktop{false};       ///< Add the desktop sink
  long timeout_ms{15000};    ///< Webhook timeout
  HttpClientPtr http;        ///< Shared transport, may be `nullptr`
};

/**
 * Build the fan-out notifier: console first, then webhook and desktop.
 *
 * @param setup Which optional sinks to add.
 * @param out Stream for the console sink; must outlive the notifier.
 */
std::shared_ptr<MultiNotifier> make_notifier(const NotifierSetup &setup,
                                             std::ostream &out);

/**
 * Start watching a pull request.
 *
 * Fetches the pull request to validate it and cache its title, then
 * persists the store.
 *
 * @throws CommandError For an unparseable URL.
 * @throws GitHubError When the pull request cannot be fetched.
 * @throws PersistenceError When saving fails.
 */
void cmd_watch(WatchStore &store, StatusClient &client, const std::string &url,
               std::ostream &out);

/**
 * Stop watching a pull request.
 *
 * @throws CommandError For an unparseable URL.
 * @throws PersistenceError When saving fails.
 */
void cmd_unwatch(WatchStore &store, const std::string &url, std::ostream &out);

/**
 * Print the watch list as an aligned table or as a JSON array.
 */
void cmd_list(const WatchStore &store, bool json, std::ostream &out);

/**
 * Run a broadcast and print its summary.
 *
 * @throws PersistenceError When saving fails.
 */
void cmd_broadcast(WatchStore &store, StatusClient &client, Notifier &notifier,
                   const BroadcastOptions &options, std::ostream &out);

/**
 * Print settings, token source and watch list size.
 */
void cmd_config_show(const WatchStore &store, std::ostream &out);

/**
 * Change a setting and persist it.
 *
 * `poll_interval_seconds` must be a positive integer; an unrecognized
 * `notification_filter` is stored as `change` with a warning.
 *
 * @throws CommandError For an unknown key or invalid value.
 * @throws PersistenceError When saving fails.
 */
void cmd_config_set(WatchStore &store, const std::string &key,
                    const std::string &value, std::ostream &out);

/**
 * Reset a setting to its default and persist it.
 *
 * @throws CommandError For an unknown key.
 * @throws PersistenceError When saving fails.
 */
void cmd_config_unset(WatchStore &store, const std::string &key,
                      std::ostream &out);

} // namespace prw

#endif // PRWATCH_COMMANDS_HPP
