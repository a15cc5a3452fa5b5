/**
 * @file notification.cpp
 * @brief Console, webhook and desktop delivery of status-change events.
 *
 * The desktop notifier shells out to platform utilities (notify-send,
 * terminal-notifier, osascript, PowerShell/BurntToast).
 */
#include "notification.hpp"
#include "log.hpp"
#include "util/time.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace prw {

namespace {

std::shared_ptr<spdlog::logger> notify_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("notify");
  }();
  return logger;
}

/**
 * Quote a string for safe use in POSIX shells.
 *
 * @param s String to escape.
 * @return Safely quoted representation suitable for `sh`/`bash`.
 */
[[maybe_unused]] std::string shell_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

/**
 * Escape characters for use inside AppleScript quoted strings.
 */
[[maybe_unused]] std::string escape_apple_script(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
    } else if (c == '\'') {
      out += "'\\''";
      continue;
    }
    out.push_back(c);
  }
  return out;
}

/**
 * Escape characters for use inside PowerShell single-quoted strings.
 */
[[maybe_unused]] std::string escape_powershell(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\'') {
      out += "''";
    } else if (c == '"') {
      out += "\\\"";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string transition_text(const StatusChangeEvent &event) {
  return display_string(event.previous_state) + " -> " +
         display_string(event.current_state);
}

} // namespace

ConsoleNotifier::ConsoleNotifier(std::ostream &out) : out_(out) {}

ConsoleNotifier::ConsoleNotifier() : out_(std::cout) {}

void ConsoleNotifier::notify(const StatusChangeEvent &event) {
  out_ << "\nStatus Change Detected!\n";
  out_ << "   PR: " << to_string(event.key) << '\n';
  if (!event.title.empty()) {
    out_ << "   Title: " << event.title << '\n';
  }
  out_ << "   Status: " << transition_text(event) << '\n';
  out_ << "   Link: " << format_pr_url(event.key) << '\n';
  out_ << "   Time: " << format_rfc3339(event.timestamp) << "\n\n";
  out_.flush();
}

nlohmann::json webhook_payload(const StatusChangeEvent &event) {
  nlohmann::json j = {{"type", "pr_status_change"},
                      {"owner", event.key.owner},
                      {"repo", event.key.repo},
                      {"pr_number", event.key.number}};
  if (!event.title.empty()) {
    j["title"] = event.title;
  }
  j["previous_state"] = event.previous_state.str();
  j["current_state"] = event.current_state.str();
  j["sha"] = event.sha;
  j["url"] = format_pr_url(event.key);
  j["timestamp"] = format_rfc3339(event.timestamp);
  return j;
}

WebhookNotifier::WebhookNotifier(std::string url, HttpClientPtr http,
                                 long timeout_ms)
    : url_(std::move(url)), http_(std::move(http)) {
  if (!http_ && !url_.empty()) {
    http_ = std::make_shared<CurlHttpClient>(timeout_ms);
  }
}

void WebhookNotifier::notify(const StatusChangeEvent &event) {
  if (url_.empty()) {
    return;
  }
  const std::string body = webhook_payload(event).dump();
  HttpResponse res;
  try {
    res = http_->post(url_, body, {"Content-Type: application/json"});
  } catch (const TransportError &e) {
    throw NotificationError(std::string("webhook request failed: ") +
                            e.what());
  }
  if (!res.ok()) {
    throw NotificationError("webhook returned non-2xx status: " +
                            std::to_string(res.status_code));
  }
  notify_log()->debug("Webhook accepted event for {} ({})",
                      to_string(event.key), res.status_code);
}

/**
 * Construct a notifier using the provided command runner.
 *
 * @param runner Callback responsible for executing notification commands.
 */
DesktopNotifier::DesktopNotifier(CommandRunner runner)
    : run_(std::move(runner)) {}

/**
 * Dispatch a desktop notification using platform-specific utilities.
 *
 * The title names the pull request; the body shows the transition, preceded
 * by the pull request title when one is cached.
 */
void DesktopNotifier::notify(const StatusChangeEvent &event) {
  const std::string title = "PR Status Change: " + to_string(event.key);
  std::string message = transition_text(event);
  if (!event.title.empty()) {
    message = event.title + "\n" + message;
  }
  int rc = 0;
#ifdef _WIN32
  if (run_("powershell -NoProfile -Command \"if (-not (Get-Module "
           "-ListAvailable BurntToast)) { exit 127 }\"") != 0) {
    notify_log()->debug("BurntToast not available; skipping desktop alert");
    return;
  }
  std::string cmd =
      "powershell -NoProfile -Command \"Import-Module BurntToast "
      "-ErrorAction Stop; New-BurntToastNotification -Text '" +
      escape_powershell(title) + "','" + escape_powershell(message) + "'\"";
  rc = run_(cmd);
#elif defined(__APPLE__)
  if (run_("command -v terminal-notifier >/dev/null 2>&1") == 0) {
    rc = run_("terminal-notifier -title " + shell_escape(title) +
              " -message " + shell_escape(message));
  } else if (run_("command -v osascript >/dev/null 2>&1") == 0) {
    rc = run_("osascript -e 'display notification \"" +
              escape_apple_script(message) + "\" with title \"" +
              escape_apple_script(title) + "\"'");
  } else {
    notify_log()->debug("No desktop notification tool available");
    return;
  }
#elif defined(__linux__)
  if (run_("command -v notify-send >/dev/null 2>&1") != 0) {
    notify_log()->debug("notify-send not found; skipping desktop alert");
    return;
  }
  rc = run_("notify-send " + shell_escape(title) + " " +
            shell_escape(message));
#else
  (void)title;
  (void)message;
  return;
#endif
  if (rc != 0) {
    throw NotificationError("desktop notification command exited with " +
                            std::to_string(rc));
  }
}

MultiNotifier::MultiNotifier(std::vector<NotifierPtr> sinks) {
  for (auto &sink : sinks) {
    add(std::move(sink));
  }
}

void MultiNotifier::add(NotifierPtr sink) {
  if (sink) {
    sinks_.push_back(std::move(sink));
  }
}

void MultiNotifier::notify(const StatusChangeEvent &event) {
  std::string failures;
  for (const auto &sink : sinks_) {
    try {
      sink->notify(event);
    } catch (const std::exception &e) {
      notify_log()->warn("{} notification failed for {}: {}", sink->name(),
                         to_string(event.key), e.what());
      if (!failures.empty()) {
        failures += "; ";
      }
      failures += sink->name() + ": " + e.what();
    }
  }
  if (!failures.empty()) {
    throw NotificationError(failures);
  }
}

} // namespace prw
