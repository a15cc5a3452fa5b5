#ifndef PRWATCH_NOTIFICATION_HPP
#define PRWATCH_NOTIFICATION_HPP

#include "ci_state.hpp"
#include "http_client.hpp"
#include "pull_request.hpp"
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iosfwd>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace prw {

/**
 * A qualifying status transition of one pull request.
 *
 * Events are built by the watcher or the broadcast command and handed to a
 * Notifier; they are never persisted.
 */
struct StatusChangeEvent {
  PullRequestKey key;                              ///< Pull request identity
  std::string title;                               ///< Cached title
  CiState previous_state;                          ///< State before the check
  CiState current_state;                           ///< Freshly fetched state
  std::string sha;                                 ///< Head commit SHA
  std::chrono::system_clock::time_point timestamp; ///< Time of the check
};

/** Raised when a notifier fails to deliver an event. */
class NotificationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Interface for delivering status-change events.
 *
 * Implementations route events to the console, outbound webhooks or the
 * desktop notification system.
 */
class Notifier {
public:
  virtual ~Notifier() = default;
  /**
   * Deliver an event.
   *
   * @param event Transition to report.
   * @throws NotificationError When delivery failed.
   */
  virtual void notify(const StatusChangeEvent &event) = 0;

  /// Short sink name used in logs and aggregated errors.
  virtual std::string name() const = 0;
};

using NotifierPtr = std::shared_ptr<Notifier>;

/**
 * Writes a multi-line, human readable block per event.
 */
class ConsoleNotifier : public Notifier {
public:
  /**
   * @param out Destination stream; must outlive the notifier.
   */
  explicit ConsoleNotifier(std::ostream &out);
  ConsoleNotifier();

  void notify(const StatusChangeEvent &event) override;
  std::string name() const override { return "console"; }

private:
  std::ostream &out_;
};

/**
 * Build the JSON payload posted by WebhookNotifier.
 *
 * @param event Event to serialize.
 * @return Object with `type`, `owner`, `repo`, `pr_number`, `title` (only
 *         when non-empty), `previous_state`, `current_state`, `sha`, `url`
 *         and `timestamp`.
 */
nlohmann::json webhook_payload(const StatusChangeEvent &event);

/**
 * POSTs each event as JSON to a configured endpoint.
 *
 * An empty endpoint turns the notifier into a no-op. Transport failures and
 * non-2xx responses raise NotificationError.
 */
class WebhookNotifier : public Notifier {
public:
  /**
   * @param url Endpoint receiving the payload.
   * @param http Transport; a CurlHttpClient with @p timeout_ms is created
   *        when `nullptr`.
   * @param timeout_ms Timeout for the default transport.
   */
  explicit WebhookNotifier(std::string url, HttpClientPtr http = nullptr,
                           long timeout_ms = 15000);

  void notify(const StatusChangeEvent &event) override;
  std::string name() const override { return "webhook"; }

  const std::string &url() const { return url_; }

private:
  std::string url_;
  HttpClientPtr http_;
};

/**
 * Desktop notifier that invokes platform-specific utilities:
 *
 * - Linux: `notify-send`
 * - Windows: BurntToast PowerShell module
 * - macOS: `terminal-notifier` (preferred) or `osascript`
 *
 * If the required tool is not available, the notification request is ignored.
 * A tool that is present but exits with a non-zero status is reported as a
 * delivery failure.
 */
class DesktopNotifier : public Notifier {
public:
  using CommandRunner = std::function<int(const std::string &)>;

  /**
   * Construct a notifier that executes platform-specific commands.
   *
   * @param runner Callback responsible for executing shell commands. The
   *        default implementation delegates to `std::system`.
   */
  explicit DesktopNotifier(CommandRunner runner =
                               [](const std::string &cmd) {
                                 return std::system(cmd.c_str());
                               });

  void notify(const StatusChangeEvent &event) override;
  std::string name() const override { return "desktop"; }

private:
  CommandRunner run_;
};

/**
 * Fan-out combinator delivering to every sink in insertion order.
 *
 * All sinks are attempted even when an earlier one fails; the combined call
 * then raises a single NotificationError naming each failed sink.
 */
class MultiNotifier : public Notifier {
public:
  MultiNotifier() = default;
  explicit MultiNotifier(std::vector<NotifierPtr> sinks);

  /// Append a sink; `nullptr` is ignored.
  void add(NotifierPtr sink);

  void notify(const StatusChangeEvent &event) override;
  std::string name() const override { return "multi"; }

  std::size_t size() const { return sinks_.size(); }

private:
  std::vector<NotifierPtr> sinks_;
};

} // namespace prw

#endif // PRWATCH_NOTIFICATION_HPP
